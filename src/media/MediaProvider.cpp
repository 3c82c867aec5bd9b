#include "MediaProvider.hpp"
#include <algorithm>
#include <cctype>

namespace nd {

std::optional<usize> selectSession(const std::vector<PlaybackStatus>& sessions) {
    std::optional<usize> paused;
    for (usize i = 0; i < sessions.size(); ++i) {
        if (sessions[i] == PlaybackStatus::Playing)
            return i;
        if (sessions[i] == PlaybackStatus::Paused && !paused)
            paused = i;
    }
    return paused;
}

bool matchesPlayerFilter(std::string_view playerId, std::string_view filter) {
    if (filter.empty())
        return true;
    auto it = std::search(playerId.begin(), playerId.end(),
                          filter.begin(), filter.end(),
                          [](char a, char b) {
                              return std::tolower(static_cast<unsigned char>(a)) ==
                                     std::tolower(static_cast<unsigned char>(b));
                          });
    return it != playerId.end();
}

} // namespace nd
