#include "ConfigParsers.hpp"
#include <algorithm>
#include "util/FileUtils.hpp"

namespace nd {

namespace {
template <typename T>
T get(const toml::table& tbl, std::string_view key, T defaultVal) {
    if (auto node = tbl[key]) {
        if constexpr (std::is_same_v<T, std::string>) {
            if (auto val = node.value<std::string>())
                return *val;
        } else if constexpr (std::is_same_v<T, bool>) {
            if (auto val = node.value<bool>())
                return *val;
        } else if constexpr (std::is_integral_v<T>) {
            if (auto val = node.value<i64>()) {
                if constexpr (std::is_unsigned_v<T>) {
                    if (*val < 0)
                        return defaultVal;
                }
                return static_cast<T>(*val);
            }
        }
    }
    return defaultVal;
}

constexpr u32 kMaxKey = 7;
} // namespace

void ConfigParsers::parseGeneral(const toml::table& tbl, GeneralConfig& cfg) {
    if (auto gen = tbl["general"].as_table()) {
        cfg.debug = get(*gen, "debug", false);
        cfg.pollIntervalMs =
                std::clamp(get(*gen, "poll_interval_ms", 250u), 50u, 10000u);
    }
}

void ConfigParsers::parseDevice(const toml::table& tbl, DeviceConfig& cfg) {
    if (auto dev = tbl["device"].as_table()) {
        cfg.serial = get(*dev, "serial", std::string());
        cfg.brightness = std::clamp(get(*dev, "brightness", 60u), 0u, 100u);
        cfg.resetOnOpen = get(*dev, "reset_on_open", false);
        cfg.waitForDevice = get(*dev, "wait_for_device", false);
        cfg.scanIntervalMs =
                std::clamp(get(*dev, "scan_interval_ms", 1000u), 100u, 60000u);
    }
}

void ConfigParsers::parseKeys(const toml::table& tbl, KeysConfig& cfg) {
    if (auto keys = tbl["keys"].as_table()) {
        cfg.albumArt = std::min(get(*keys, "album_art", 6u), kMaxKey);
        cfg.refresh = std::min(get(*keys, "refresh", 5u), kMaxKey);
        cfg.favorite = std::min(get(*keys, "favorite", 7u), kMaxKey);
    }
}

void ConfigParsers::parseTouchStrip(const toml::table& tbl,
                                    TouchStripConfig& cfg) {
    if (auto ts = tbl["touch_strip"].as_table()) {
        cfg.x = std::clamp(get(*ts, "x", 200u), 0u, 799u);
        cfg.y = std::clamp(get(*ts, "y", 0u), 0u, 99u);
        cfg.width = std::clamp(get(*ts, "width", 600u), 1u, 800u - cfg.x);
        cfg.height = std::clamp(get(*ts, "height", 100u), 1u, 100u - cfg.y);
        cfg.fontFamily = get(*ts, "font_family", std::string("Arial"));
        cfg.fontSize = std::clamp(get(*ts, "font_size", 18u), 6u, 96u);
        cfg.bold = get(*ts, "bold", true);
        cfg.textColor =
                Color::fromHex(get(*ts, "text_color", std::string("#FFFFFF")));
        cfg.backgroundColor = Color::fromHex(
                get(*ts, "background_color", std::string("#000000")));
        cfg.asciiOnly = get(*ts, "ascii_only", false);
        cfg.wrapColumn = std::clamp(get(*ts, "wrap_column", 65u), 8u, 512u);
        cfg.showAlbum = get(*ts, "show_album", true);
        cfg.idleText =
                get(*ts, "idle_text", std::string("Nothing playing"));
    }
}

void ConfigParsers::parseMedia(const toml::table& tbl, MediaConfig& cfg) {
    if (auto media = tbl["media"].as_table()) {
        cfg.player = get(*media, "player", std::string());
        cfg.dbusTimeoutMs =
                std::clamp(get(*media, "dbus_timeout_ms", 500u), 50u, 10000u);
        cfg.artworkTimeoutMs = std::clamp(
                get(*media, "artwork_timeout_ms", 2000u), 100u, 30000u);
        cfg.artworkMaxBytes = std::clamp(
                get(*media, "artwork_max_bytes", 5000000u), 1024u, 50000000u);
    }
}

void ConfigParsers::parseFavorites(const toml::table& tbl,
                                   FavoritesConfig& cfg) {
    if (auto fav = tbl["favorites"].as_table()) {
        auto pathStr = get(*fav, "path", std::string());
        cfg.path = pathStr.empty() ? fs::path() : file::expandPath(pathStr);
    }
}

toml::table ConfigParsers::serialize(const GeneralConfig& general,
                                     const DeviceConfig& device,
                                     const KeysConfig& keys,
                                     const TouchStripConfig& touchStrip,
                                     const MediaConfig& media,
                                     const FavoritesConfig& favorites) {
    toml::table root;
    root.insert("general",
                toml::table{{"debug", general.debug},
                            {"poll_interval_ms", (i64)general.pollIntervalMs}});

    root.insert("device",
                toml::table{{"serial", device.serial},
                            {"brightness", (i64)device.brightness},
                            {"reset_on_open", device.resetOnOpen},
                            {"wait_for_device", device.waitForDevice},
                            {"scan_interval_ms", (i64)device.scanIntervalMs}});

    root.insert("keys",
                toml::table{{"album_art", (i64)keys.albumArt},
                            {"refresh", (i64)keys.refresh},
                            {"favorite", (i64)keys.favorite}});

    root.insert(
            "touch_strip",
            toml::table{{"x", (i64)touchStrip.x},
                        {"y", (i64)touchStrip.y},
                        {"width", (i64)touchStrip.width},
                        {"height", (i64)touchStrip.height},
                        {"font_family", touchStrip.fontFamily},
                        {"font_size", (i64)touchStrip.fontSize},
                        {"bold", touchStrip.bold},
                        {"text_color", touchStrip.textColor.toHex()},
                        {"background_color",
                         touchStrip.backgroundColor.toHex()},
                        {"ascii_only", touchStrip.asciiOnly},
                        {"wrap_column", (i64)touchStrip.wrapColumn},
                        {"show_album", touchStrip.showAlbum},
                        {"idle_text", touchStrip.idleText}});

    root.insert("media",
                toml::table{{"player", media.player},
                            {"dbus_timeout_ms", (i64)media.dbusTimeoutMs},
                            {"artwork_timeout_ms", (i64)media.artworkTimeoutMs},
                            {"artwork_max_bytes", (i64)media.artworkMaxBytes}});

    root.insert("favorites", toml::table{{"path", favorites.path.string()}});

    return root;
}

} // namespace nd
