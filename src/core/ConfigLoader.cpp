#include "ConfigLoader.hpp"
#include <fstream>
#include "Config.hpp"
#include "ConfigParsers.hpp"
#include "Logger.hpp"
#include "util/FileUtils.hpp"

namespace nd {

Result<void> ConfigLoader::load(Config& config, const fs::path& path) {
    try {
        auto tbl = toml::parse_file(path.string());

        ConfigParsers::parseGeneral(tbl, config.general());
        ConfigParsers::parseDevice(tbl, config.device());
        ConfigParsers::parseKeys(tbl, config.keys());
        ConfigParsers::parseTouchStrip(tbl, config.touchStrip());
        ConfigParsers::parseMedia(tbl, config.media());
        ConfigParsers::parseFavorites(tbl, config.favorites());

        config.markClean();
        LOG_INFO("Config loaded from: {}", path.string());
        return Result<void>::ok();
    } catch (const toml::parse_error& err) {
        return Result<void>::err(std::string("Config parse error: ") +
                                 err.what());
    }
}

Result<void> ConfigLoader::loadDefault(Config& config) {
    auto configDir = file::configDir();
    auto defaultPath = configDir / "config.toml";
    config.configPath_ = defaultPath;

    if (fs::exists(defaultPath)) {
        return load(config, defaultPath);
    }

    LOG_WARN("No config file found, writing built-in defaults to {}",
             defaultPath.string());
    if (auto res = file::ensureDir(configDir); !res) {
        LOG_WARN("{}", res.error().message);
        return Result<void>::ok();
    }
    if (auto res = save(config, defaultPath); !res) {
        LOG_WARN("Continuing with built-in defaults: {}", res.error().message);
    }
    config.markClean();
    return Result<void>::ok();
}

Result<void> ConfigLoader::save(const Config& config, const fs::path& path) {
    try {
        auto tbl = ConfigParsers::serialize(config.general(),
                                            config.device(),
                                            config.keys(),
                                            config.touchStrip(),
                                            config.media(),
                                            config.favorites());
        fs::path tempPath = path;
        tempPath += ".tmp";
        {
            std::ofstream file(tempPath);
            if (!file)
                return Result<void>::err("Failed to open temp config file");
            file << tbl;
        }
        fs::rename(tempPath, path);
        LOG_DEBUG("Config saved to: {}", path.string());
        return Result<void>::ok();
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to save config: {}", e.what());
        return Result<void>::err(std::string("Failed to save config: ") +
                                 e.what());
    }
}

} // namespace nd
