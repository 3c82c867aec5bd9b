/**
 * @file DeviceManager.hpp
 * @brief Finds and opens the Stream Deck+ the loop renders to.
 *
 * Only the Stream Deck+ has a touch strip; other Elgato decks are listed
 * in the log and skipped.
 */

#pragma once
#include <memory>
#include <optional>
#include <vector>
#include "DeckDevice.hpp"
#include "Transport.hpp"
#include "core/ConfigData.hpp"

namespace nd {

class DeviceManager {
public:
    // Human readable deck name for an Elgato product id
    static std::optional<std::string> deckTypeName(u16 productId);

    // Elgato decks among the given HID devices, in path order
    static std::vector<HidDeviceEntry> elgatoDecks(
            const std::vector<HidDeviceEntry>& devices);

    // Opens the first matching Stream Deck+ and applies brightness/reset
    static Result<std::unique_ptr<DeckDevice>> open(const DeviceConfig& config);
};

} // namespace nd
