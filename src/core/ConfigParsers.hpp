/**
 * @file ConfigParsers.hpp
 * @brief TOML parsing and serialization logic.
 *
 * This file defines the ConfigParsers class which handles the conversion
 * between TOML data structures and the application's C++ configuration structs.
 *
 * @section Dependencies
 * - toml++
 * - ConfigData
 */

#pragma once
#include <toml++/toml.h>
#include "ConfigData.hpp"

namespace nd {

class ConfigParsers {
public:
    static void parseGeneral(const toml::table& tbl, GeneralConfig& cfg);
    static void parseDevice(const toml::table& tbl, DeviceConfig& cfg);
    static void parseKeys(const toml::table& tbl, KeysConfig& cfg);
    static void parseTouchStrip(const toml::table& tbl, TouchStripConfig& cfg);
    static void parseMedia(const toml::table& tbl, MediaConfig& cfg);
    static void parseFavorites(const toml::table& tbl, FavoritesConfig& cfg);

    static toml::table serialize(const GeneralConfig& general,
                                 const DeviceConfig& device,
                                 const KeysConfig& keys,
                                 const TouchStripConfig& touchStrip,
                                 const MediaConfig& media,
                                 const FavoritesConfig& favorites);
};

} // namespace nd
