#include "DeviceManager.hpp"
#include "StreamDeckPlus.hpp"
#include "core/Logger.hpp"

namespace nd {

std::optional<std::string> DeviceManager::deckTypeName(u16 productId) {
    switch (productId) {
    case 0x0060: return "Stream Deck Original";
    case 0x0063: return "Stream Deck Mini";
    case 0x006c: return "Stream Deck XL";
    case 0x006d: return "Stream Deck Original";
    case 0x0080: return "Stream Deck MK.2";
    case 0x0084: return "Stream Deck +";
    case 0x0086: return "Stream Deck Pedal";
    case 0x008f: return "Stream Deck XL";
    case 0x0090: return "Stream Deck Mini";
    case 0x009a: return "Stream Deck Neo";
    default: return std::nullopt;
    }
}

std::vector<HidDeviceEntry> DeviceManager::elgatoDecks(
        const std::vector<HidDeviceEntry>& devices) {
    std::vector<HidDeviceEntry> decks;
    for (const auto& dev : devices) {
        if (dev.vendorId == StreamDeckPlus::VENDOR_ID &&
            deckTypeName(dev.productId))
            decks.push_back(dev);
    }
    return decks;
}

Result<std::unique_ptr<DeckDevice>> DeviceManager::open(
        const DeviceConfig& config) {
    using R = Result<std::unique_ptr<DeckDevice>>;

    auto decks = elgatoDecks(hid::enumerate());
    LOG_DEBUG("Found {} Stream Deck(s)", decks.size());

    std::string lastError = "No Stream Deck + found";
    for (const auto& deck : decks) {
        if (deck.productId != StreamDeckPlus::PRODUCT_ID) {
            LOG_DEBUG("Skipping {} at {}: only the Stream Deck + has a touch strip",
                      *deckTypeName(deck.productId), deck.path);
            continue;
        }
        if (!config.serial.empty() && !deck.serial.empty() &&
            deck.serial != config.serial) {
            LOG_DEBUG("Skipping Stream Deck + {} (serial mismatch)", deck.serial);
            continue;
        }

        auto transport = hid::open(deck.path);
        if (!transport) {
            lastError = transport.error().message;
            LOG_WARN("{}", lastError);
            continue;
        }

        auto device = std::make_unique<StreamDeckPlus>(std::move(*transport));

        if (!config.serial.empty() && deck.serial.empty()) {
            auto serial = device->serialNumber();
            if (!serial || serial.value() != config.serial)
                continue;
        }

        if (config.resetOnOpen) {
            if (auto res = device->reset(); !res) {
                lastError = res.error().message;
                continue;
            }
        }
        if (auto res = device->setBrightness(config.brightness); !res) {
            lastError = res.error().message;
            continue;
        }

        auto serial = device->serialNumber();
        auto firmware = device->firmwareVersion();
        LOG_INFO("Opened '{}' device (serial number: '{}', firmware: '{}')",
                 device->deckType(),
                 serial ? serial.value() : std::string("?"),
                 firmware ? firmware.value() : std::string("?"));

        return R::ok(std::move(device));
    }

    return R::err(lastError);
}

} // namespace nd
