/**
 * @file ConfigData.hpp
 * @brief Configuration data structures.
 *
 * This file defines the POD (Plain Old Data) structs used to hold configuration
 * values. It is separated from the logic classes to keep headers lean and
 * avoid circular dependencies.
 */

#pragma once
#include <filesystem>
#include <string>
#include "util/Types.hpp"

namespace nd {

namespace fs = std::filesystem;

struct GeneralConfig {
    bool debug{false};
    u32 pollIntervalMs{250};
};

// Stream Deck+ connection settings
struct DeviceConfig {
    std::string serial;        // empty = first Stream Deck+ found
    u32 brightness{60};        // percent
    bool resetOnOpen{false};
    bool waitForDevice{false}; // keep scanning at startup instead of failing
    u32 scanIntervalMs{1000};
};

// LCD key assignments, 0-based, 4x2 grid left-to-right top-to-bottom
struct KeysConfig {
    u32 albumArt{6};
    u32 refresh{5};
    u32 favorite{7};
};

struct TouchStripConfig {
    u32 x{200};
    u32 y{0};
    u32 width{600};
    u32 height{100};
    std::string fontFamily{"Arial"};
    u32 fontSize{18};
    bool bold{true};
    Color textColor{Color::white()};
    Color backgroundColor{Color::black()};
    bool asciiOnly{false};
    u32 wrapColumn{65};
    bool showAlbum{true};
    std::string idleText{"Nothing playing"};
};

struct MediaConfig {
    std::string player;        // substring filter on the MPRIS bus name
    u32 dbusTimeoutMs{500};
    u32 artworkTimeoutMs{2000};
    u32 artworkMaxBytes{5000000};
};

struct FavoritesConfig {
    fs::path path;             // empty = <data dir>/favorites.txt
};

} // namespace nd
