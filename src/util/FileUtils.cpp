#include "FileUtils.hpp"
#include <QDir>
#include <QStandardPaths>
#include <string>

namespace nd::file {

namespace {

fs::path standardDir(QStandardPaths::StandardLocation location) {
    auto dir = QStandardPaths::writableLocation(location);
    if (dir.isEmpty())
        return fs::temp_directory_path() / "nowdeck";
    return fs::path(dir.toStdString());
}

} // namespace

fs::path configDir() {
    return standardDir(QStandardPaths::AppConfigLocation);
}

fs::path dataDir() {
    return standardDir(QStandardPaths::AppDataLocation);
}

fs::path cacheDir() {
    return standardDir(QStandardPaths::CacheLocation);
}

Result<void> ensureDir(const fs::path& dir) {
    std::error_code ec;
    if (dir.empty() || fs::is_directory(dir, ec))
        return Result<void>::ok();
    fs::create_directories(dir, ec);
    if (ec)
        return Result<void>::err("Failed to create directory " + dir.string() +
                                 ": " + ec.message());
    return Result<void>::ok();
}

fs::path expandPath(std::string_view path) {
    std::string p(path);
    if (p.starts_with("~/"))
        p = QDir::homePath().toStdString() + p.substr(1);
    return fs::path(p);
}

} // namespace nd::file
