#include "FavoritesLog.hpp"
#include <cstdlib>
#include <fstream>
#include "Logger.hpp"
#include "util/FileUtils.hpp"

namespace nd {

namespace fs = std::filesystem;

namespace {

// A field must never break the one-line-per-entry format
std::string singleLine(const std::string& field) {
    std::string out = field;
    for (char& c : out) {
        if (c == '\n' || c == '\r')
            c = ' ';
    }
    return out;
}

} // namespace

FavoritesLog::FavoritesLog(fs::path path) : path_(std::move(path)) {
}

fs::path FavoritesLog::resolvePath(const fs::path& override,
                                   const fs::path& configured) {
    if (!override.empty())
        return override;
    if (const char* env = std::getenv("NOWDECK_FAVORITES"); env && *env)
        return file::expandPath(env);
    if (!configured.empty())
        return configured;
    return file::dataDir() / "favorites.txt";
}

std::string FavoritesLog::formatLine(const TrackInfo& track) {
    std::string line = singleLine(track.title);
    if (!track.artist.empty())
        line += " - " + singleLine(track.artist);
    return line;
}

Result<void> FavoritesLog::append(const TrackInfo& track) {
    if (track.isIdle())
        return Result<void>::err("Nothing to favorite");

    if (auto res = file::ensureDir(path_.parent_path()); !res)
        return res;

    std::ofstream out(path_, std::ios::out | std::ios::app | std::ios::binary);
    if (!out)
        return Result<void>::err("Failed to open favorites file: " +
                                 path_.string());

    out << formatLine(track) << '\n';
    out.flush();
    if (!out)
        return Result<void>::err("Failed to write favorites file: " +
                                 path_.string());

    LOG_DEBUG("Appended favorite to {}", path_.string());
    return Result<void>::ok();
}

} // namespace nd
