/**
 * @file StreamDeckPlus.hpp
 * @brief Elgato Stream Deck+ protocol on top of a Transport.
 *
 * 8 LCD keys of 120x120, an 800x100 touch strip and 4 dials. Images are
 * JPEG, split into 1024-byte output reports with a small paging header.
 *
 * @section Dependencies
 * - Transport
 */

#pragma once
#include <array>
#include <memory>
#include "DeckDevice.hpp"
#include "Transport.hpp"

namespace nd {

class StreamDeckPlus : public DeckDevice {
public:
    static constexpr u16 VENDOR_ID = 0x0fd9;
    static constexpr u16 PRODUCT_ID = 0x0084;

    static constexpr u32 KEY_COUNT = 8;
    static constexpr u32 KEY_PIXELS = 120;
    static constexpr u32 TOUCHSCREEN_WIDTH = 800;
    static constexpr u32 TOUCHSCREEN_HEIGHT = 100;

    static constexpr usize IMAGE_REPORT_LENGTH = 1024;
    static constexpr usize KEY_HEADER_LENGTH = 8;
    static constexpr usize KEY_PAYLOAD_LENGTH =
            IMAGE_REPORT_LENGTH - KEY_HEADER_LENGTH;
    static constexpr usize LCD_HEADER_LENGTH = 16;
    static constexpr usize LCD_PAYLOAD_LENGTH =
            IMAGE_REPORT_LENGTH - LCD_HEADER_LENGTH;
    static constexpr usize FEATURE_REPORT_LENGTH = 32;

    explicit StreamDeckPlus(std::unique_ptr<Transport> transport);
    ~StreamDeckPlus() override;

    std::string deckType() const override {
        return "Stream Deck +";
    }
    u32 keyCount() const override {
        return KEY_COUNT;
    }
    PixelSize keyImageSize() const override {
        return {KEY_PIXELS, KEY_PIXELS};
    }
    PixelSize touchscreenSize() const override {
        return {TOUCHSCREEN_WIDTH, TOUCHSCREEN_HEIGHT};
    }

    Result<void> reset() override;
    Result<void> setBrightness(u32 percent) override;

    Result<void> setKeyImage(u32 key, ByteView image) override;
    Result<void> setTouchscreenImage(ByteView image,
                                     u32 x,
                                     u32 y,
                                     u32 width,
                                     u32 height) override;

    Result<std::set<u32>> pollButtonEvents() override;

    Result<std::string> serialNumber() override;
    Result<std::string> firmwareVersion() override;

    // Decodes one input report into key states; false for non-key reports
    static bool decodeKeyReport(ByteView report,
                                std::array<bool, KEY_COUNT>& states);

private:
    Result<std::string> readFeatureString(u8 reportId, usize offset);

    std::unique_ptr<Transport> transport_;
    std::array<bool, KEY_COUNT> keyStates_{};
};

} // namespace nd
