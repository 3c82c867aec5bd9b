/**
 * @file MediaProvider.hpp
 * @brief Abstract source of the desktop's current media session.
 *
 * A provider answers one question per poll: what is playing right now.
 * No active session is a normal answer (std::nullopt), not an error.
 * Errors are reserved for an unreachable backend or malformed replies.
 *
 * The platform build links exactly one implementation: MprisProvider on
 * Linux, SmtcProvider on Windows. createMediaProvider() returns it.
 */

#pragma once
#include <memory>
#include <optional>
#include <string_view>
#include <vector>
#include "TrackInfo.hpp"
#include "core/ConfigData.hpp"
#include "util/Result.hpp"

namespace nd {

enum class PlaybackStatus { Playing, Paused, Stopped };

class MediaProvider {
public:
    virtual ~MediaProvider() = default;

    virtual Result<std::optional<TrackInfo>> currentMedia() = 0;
};

std::unique_ptr<MediaProvider> createMediaProvider(const MediaConfig& config);

// Index of the session to show: the first Playing one, else the first
// Paused one, else none
std::optional<usize> selectSession(const std::vector<PlaybackStatus>& sessions);

// Case-insensitive substring match of media.player against a player id;
// an empty filter matches everything
bool matchesPlayerFilter(std::string_view playerId, std::string_view filter);

} // namespace nd
