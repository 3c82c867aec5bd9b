/**
 * @file DeckDevice.hpp
 * @brief Abstract Stream Deck surface used by the display loop.
 *
 * Images are pre-encoded in the device's native format (JPEG for the
 * Stream Deck+). Every call is synchronous; a failed call means the
 * connection is no longer usable.
 */

#pragma once
#include <set>
#include <string>
#include "util/Result.hpp"
#include "util/Types.hpp"

namespace nd {

struct PixelSize {
    u32 width{0};
    u32 height{0};
};

class DeckDevice {
public:
    virtual ~DeckDevice() = default;

    virtual std::string deckType() const = 0;
    virtual u32 keyCount() const = 0;
    virtual PixelSize keyImageSize() const = 0;
    virtual PixelSize touchscreenSize() const = 0;

    virtual Result<void> reset() = 0;
    virtual Result<void> setBrightness(u32 percent) = 0;

    virtual Result<void> setKeyImage(u32 key, ByteView image) = 0;
    virtual Result<void> setTouchscreenImage(ByteView image,
                                             u32 x,
                                             u32 y,
                                             u32 width,
                                             u32 height) = 0;

    // Keys that went from released to pressed since the previous call
    virtual Result<std::set<u32>> pollButtonEvents() = 0;

    virtual Result<std::string> serialNumber() = 0;
    virtual Result<std::string> firmwareVersion() = 0;
};

} // namespace nd
