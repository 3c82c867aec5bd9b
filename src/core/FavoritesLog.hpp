/**
 * @file FavoritesLog.hpp
 * @brief Append-only text log of favorited tracks.
 *
 * One line per favorite, "<title> - <artist>". The file is opened in
 * append mode for every entry and flushed before append() returns, so an
 * entry survives a crash right after the key press. Existing lines are
 * never touched.
 */

#pragma once
#include <filesystem>
#include "media/TrackInfo.hpp"
#include "util/Result.hpp"

namespace nd {

class FavoritesLog {
public:
    explicit FavoritesLog(std::filesystem::path path);

    // Resolution order: explicit override, $NOWDECK_FAVORITES, config, default
    static std::filesystem::path resolvePath(
            const std::filesystem::path& override,
            const std::filesystem::path& configured);

    // Serialized form without the trailing newline
    static std::string formatLine(const TrackInfo& track);

    Result<void> append(const TrackInfo& track);

    const std::filesystem::path& path() const {
        return path_;
    }

private:
    std::filesystem::path path_;
};

} // namespace nd
