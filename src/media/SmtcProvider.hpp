/**
 * @file SmtcProvider.hpp
 * @brief MediaProvider backed by the Windows media session manager.
 *
 * Uses GlobalSystemMediaTransportControlsSessionManager (C++/WinRT). The
 * provider prefers a Playing session, then a Paused one, reads the media
 * properties and the raw bytes of the session thumbnail.
 *
 * WinRT calls block, so each query runs on a short-lived MTA thread and
 * the calling (Qt, STA) thread waits for it. WinRT objects never outlive
 * that thread, so the session manager is requested on every query.
 *
 * @section Dependencies
 * - C++/WinRT (Windows.Media.Control, Windows.Storage.Streams)
 */

#pragma once
#include <memory>
#include "MediaProvider.hpp"

namespace nd {

class SmtcProvider : public MediaProvider {
public:
    explicit SmtcProvider(const MediaConfig& config);
    ~SmtcProvider() override;

    Result<std::optional<TrackInfo>> currentMedia() override;

private:
    Result<std::optional<TrackInfo>> query() const;

    MediaConfig config_;
};

} // namespace nd
