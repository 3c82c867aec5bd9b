/**
 * @file Config.hpp
 * @brief Configuration management singleton.
 *
 * This file defines the Config class which provides a thread-safe singleton
 * for accessing and modifying application settings. It delegates parsing
 * to ConfigParsers and file I/O to ConfigLoader.
 *
 * @section Dependencies
 * - ConfigData
 * - ConfigLoader
 * - ConfigParsers
 *
 * @section Patterns
 * - Singleton: Global access point for configuration.
 * - Thread-Safe: Mutex-protected access to settings.
 */

#pragma once
#include <mutex>
#include "ConfigData.hpp"
#include "util/Result.hpp"

namespace nd {

class Config {
public:
    static Config& instance();

    Result<void> load(const fs::path& path);
    Result<void> save(const fs::path& path) const;
    Result<void> loadDefault();

    fs::path configPath() const {
        return configPath_;
    }

    // Section accessors (const)
    const GeneralConfig& general() const {
        return general_;
    }
    const DeviceConfig& device() const {
        return device_;
    }
    const KeysConfig& keys() const {
        return keys_;
    }
    const TouchStripConfig& touchStrip() const {
        return touchStrip_;
    }
    const MediaConfig& media() const {
        return media_;
    }
    const FavoritesConfig& favorites() const {
        return favorites_;
    }

    // Section accessors (mutable)
    GeneralConfig& general() {
        markDirty();
        return general_;
    }
    DeviceConfig& device() {
        markDirty();
        return device_;
    }
    KeysConfig& keys() {
        markDirty();
        return keys_;
    }
    TouchStripConfig& touchStrip() {
        markDirty();
        return touchStrip_;
    }
    MediaConfig& media() {
        markDirty();
        return media_;
    }
    FavoritesConfig& favorites() {
        markDirty();
        return favorites_;
    }

    bool isDirty() const {
        return dirty_;
    }
    void markClean() {
        dirty_ = false;
    }

private:
    friend class ConfigLoader;

    Config() = default;
    void markDirty() {
        dirty_ = true;
    }

    fs::path configPath_;
    bool dirty_{false};

    GeneralConfig general_;
    DeviceConfig device_;
    KeysConfig keys_;
    TouchStripConfig touchStrip_;
    MediaConfig media_;
    FavoritesConfig favorites_;

    mutable std::mutex mutex_;
};

#define CONFIG nd::Config::instance()

} // namespace nd
