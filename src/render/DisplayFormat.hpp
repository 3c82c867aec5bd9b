#pragma once
// DisplayFormat.hpp - What the touch strip says for a given track
// Pure string work, no Qt GUI types, so it is trivially testable

#include <string>
#include <string_view>
#include <vector>
#include "core/ConfigData.hpp"
#include "media/TrackInfo.hpp"

namespace nd::display {

std::string stripNonAscii(std::string_view text);

// Splits a long title once, at the last space within the column if any
std::vector<std::string> wrapTitle(const std::string& title, u32 column);

// Lines in display order: title (1 or 2 lines), artist, album
std::vector<std::string> formatLines(const TrackInfo& track,
                                     const TouchStripConfig& cfg);

// formatLines joined with '\n'
std::string formatText(const TrackInfo& track, const TouchStripConfig& cfg);

} // namespace nd::display
