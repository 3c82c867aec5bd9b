#include "MediaDisplayLoop.hpp"
#include "core/Logger.hpp"
#include "render/DisplayFormat.hpp"

namespace nd {

namespace {

std::string artworkIdOf(const TrackInfo& track) {
    return track.artwork ? track.artworkIdentity() : std::string();
}

} // namespace

MediaDisplayLoop::MediaDisplayLoop(MediaProvider& provider,
                                   DeckRenderer& renderer,
                                   FavoritesLog& favorites,
                                   DeviceConnector connector,
                                   LoopSettings settings)
    : provider_(provider),
      renderer_(renderer),
      favorites_(favorites),
      connector_(std::move(connector)),
      settings_(settings) {
}

MediaDisplayLoop::~MediaDisplayLoop() = default;

bool MediaDisplayLoop::fitsLayout(const DeckDevice& device) const {
    const auto& keys = settings_.keys;
    const u32 keyCount = device.keyCount();
    if (keys.albumArt >= keyCount || keys.refresh >= keyCount ||
        keys.favorite >= keyCount) {
        LOG_ERROR("{} has {} keys, configured keys need more",
                  device.deckType(), keyCount);
        return false;
    }

    const auto& strip = renderer_.touchStrip();
    const auto screen = device.touchscreenSize();
    if (strip.x + strip.width > screen.width ||
        strip.y + strip.height > screen.height) {
        LOG_ERROR("Touch strip region {}x{}+{}+{} does not fit the {}x{} screen of {}",
                  strip.width, strip.height, strip.x, strip.y,
                  screen.width, screen.height, device.deckType());
        return false;
    }
    return true;
}

bool MediaDisplayLoop::attach(std::unique_ptr<DeckDevice> device) {
    if (!device || !fitsLayout(*device))
        return false;
    device_ = std::move(device);
    state_.invalidate();
    lastConnectError_.clear();
    connectionChanged.emitSignal(true);
    return true;
}

void MediaDisplayLoop::tick() {
    bool haveDevice = ensureDevice();

    TrackInfo current = pollMedia();

    if (!haveDevice)
        return;

    render(current);
    if (device_)
        handleKeys(current);
}

bool MediaDisplayLoop::ensureDevice() {
    if (device_)
        return true;
    if (!connector_)
        return false;

    auto now = Clock::now();
    if (lastConnectAttempt_ &&
        now - *lastConnectAttempt_ < settings_.reconnectInterval)
        return false;
    lastConnectAttempt_ = now;

    auto res = connector_();
    if (!res) {
        if (res.error().message != lastConnectError_) {
            LOG_WARN("No Stream Deck available: {}", res.error().message);
            lastConnectError_ = res.error().message;
        }
        return false;
    }

    if (!attach(std::move(res).value()))
        return false;
    LOG_INFO("Stream Deck connected");
    return true;
}

TrackInfo MediaDisplayLoop::pollMedia() {
    auto res = provider_.currentMedia();
    if (!res) {
        if (res.error().message != lastProviderError_) {
            LOG_WARN("Media provider unavailable: {}", res.error().message);
            lastProviderError_ = res.error().message;
        }
        return TrackInfo::idle();
    }

    if (!lastProviderError_.empty()) {
        LOG_INFO("Media provider available again");
        lastProviderError_.clear();
    }

    if (!res.value())
        return TrackInfo::idle();
    return std::move(*res.value());
}

void MediaDisplayLoop::render(const TrackInfo& current) {
    renderText(current);
    if (device_)
        renderArtwork(current);
}

void MediaDisplayLoop::renderText(const TrackInfo& current) {
    if (state_.track && state_.track->sameText(current))
        return;

    const auto& strip = renderer_.touchStrip();
    auto lines = display::formatLines(current, strip);
    auto image = renderer_.renderTouchStrip(lines);
    if (!image) {
        LOG_ERROR("Error updating currently playing media: {}",
                  image.error().message);
        return;
    }

    if (auto res = device_->setTouchscreenImage(
                image.value(), strip.x, strip.y, strip.width, strip.height);
        !res) {
        dropDevice(res.error().message);
        return;
    }

    LOG_INFO("Now playing: {}",
             current.isIdle() ? strip.idleText : FavoritesLog::formatLine(current));
    state_.track = current;
    trackRendered.emitSignal(current);
}

void MediaDisplayLoop::renderArtwork(const TrackInfo& current) {
    auto id = artworkIdOf(current);
    if (state_.artworkId && *state_.artworkId == id)
        return;

    const auto keySize = device_->keyImageSize();
    Result<Bytes> image = current.artwork
                                  ? renderer_.renderKeyArtwork(*current.artwork, keySize)
                                  : renderer_.blankKey(keySize);
    if (!image) {
        // Keep whatever the key shows now and don't retry this artwork
        LOG_WARN("Album art not updated: {}", image.error().message);
        state_.artworkId = id;
        return;
    }

    if (auto res = device_->setKeyImage(settings_.keys.albumArt, image.value());
        !res) {
        dropDevice(res.error().message);
        return;
    }

    LOG_DEBUG("Album art updated on key {}", settings_.keys.albumArt);
    state_.artworkId = id;
}

void MediaDisplayLoop::handleKeys(const TrackInfo& current) {
    auto events = device_->pollButtonEvents();
    if (!events) {
        dropDevice(events.error().message);
        return;
    }

    const auto& pressed = events.value();
    if (pressed.contains(settings_.keys.favorite))
        saveFavorite();

    if (pressed.contains(settings_.keys.refresh)) {
        LOG_INFO("Refresh requested");
        state_.invalidate();
        render(current);
    }
}

void MediaDisplayLoop::saveFavorite() {
    if (!state_.track || state_.track->isIdle()) {
        LOG_INFO("Favorite ignored: nothing playing");
        return;
    }

    const TrackInfo& track = *state_.track;
    if (auto res = favorites_.append(track); !res) {
        LOG_ERROR("Favorite dropped: {}", res.error().message);
        return;
    }

    LOG_INFO("Favorited: {}", FavoritesLog::formatLine(track));
    favoriteSaved.emitSignal(track);
}

void MediaDisplayLoop::dropDevice(const std::string& reason) {
    LOG_ERROR("Stream Deck connection lost: {}", reason);
    device_.reset();
    state_.invalidate();
    // Retry on the very next tick
    lastConnectAttempt_.reset();
    lastConnectError_.clear();
    connectionChanged.emitSignal(false);
}

} // namespace nd
