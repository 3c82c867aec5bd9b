#include "SmtcProvider.hpp"
#include <future>
#include <winrt/Windows.Foundation.Collections.h>
#include <winrt/Windows.Foundation.h>
#include <winrt/Windows.Media.Control.h>
#include <winrt/Windows.Storage.Streams.h>
#include "core/Logger.hpp"

namespace nd {

using namespace winrt::Windows::Media::Control;
using namespace winrt::Windows::Storage::Streams;

namespace {

using WinStatus = GlobalSystemMediaTransportControlsSessionPlaybackStatus;

PlaybackStatus toStatus(const GlobalSystemMediaTransportControlsSession& session) {
    auto info = session.GetPlaybackInfo();
    if (!info)
        return PlaybackStatus::Stopped;
    switch (info.PlaybackStatus()) {
    case WinStatus::Playing: return PlaybackStatus::Playing;
    case WinStatus::Paused: return PlaybackStatus::Paused;
    default: return PlaybackStatus::Stopped;
    }
}

// Joins the worker thread to the MTA for the duration of one query
class ApartmentScope {
public:
    ApartmentScope() {
        winrt::init_apartment(winrt::apartment_type::multi_threaded);
    }
    ~ApartmentScope() {
        winrt::uninit_apartment();
    }
};

std::string trimmed(const winrt::hstring& text) {
    auto s = winrt::to_string(text);
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos)
        return {};
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

} // namespace

std::unique_ptr<MediaProvider> createMediaProvider(const MediaConfig& config) {
    return std::make_unique<SmtcProvider>(config);
}

SmtcProvider::SmtcProvider(const MediaConfig& config)
    : config_(config) {
}

SmtcProvider::~SmtcProvider() = default;

Result<std::optional<TrackInfo>> SmtcProvider::currentMedia() {
    auto pending = std::async(std::launch::async, [this]() { return query(); });
    return pending.get();
}

Result<std::optional<TrackInfo>> SmtcProvider::query() const {
    using R = Result<std::optional<TrackInfo>>;

    try {
        ApartmentScope apartment;

        auto manager =
                GlobalSystemMediaTransportControlsSessionManager::RequestAsync().get();
        if (!manager)
            return R::err("Media session manager unavailable");

        std::vector<GlobalSystemMediaTransportControlsSession> candidates;
        std::vector<PlaybackStatus> statuses;
        for (const auto& session : manager.GetSessions()) {
            auto appId = winrt::to_string(session.SourceAppUserModelId());
            if (!matchesPlayerFilter(appId, config_.player))
                continue;
            candidates.push_back(session);
            statuses.push_back(toStatus(session));
        }

        auto index = selectSession(statuses);
        if (!index)
            return R::ok(std::nullopt);

        const auto& session = candidates[*index];
        auto props = session.TryGetMediaPropertiesAsync().get();
        if (!props)
            return R::ok(std::nullopt);

        TrackInfo track;
        track.title = trimmed(props.Title());
        track.artist = trimmed(props.Artist());
        track.album = trimmed(props.AlbumTitle());
        track.player = winrt::to_string(session.SourceAppUserModelId());

        if (auto thumbnail = props.Thumbnail()) {
            auto stream = thumbnail.OpenReadAsync().get();
            const auto size = stream.Size();
            if (size > config_.artworkMaxBytes) {
                LOG_DEBUG("SmtcProvider: thumbnail of {} bytes exceeds size limit",
                          size);
            } else if (size > 0) {
                DataReader reader(stream);
                reader.LoadAsync(static_cast<uint32_t>(size)).get();
                Bytes art(static_cast<usize>(size));
                reader.ReadBytes(art);
                track.artwork = std::move(art);
            }
        }

        return R::ok(std::move(track));
    } catch (const winrt::hresult_error& e) {
        return R::err("Media session query failed: " + winrt::to_string(e.message()));
    }
}

} // namespace nd
