/**
 * @file DeckRenderer.hpp
 * @brief Produces device-ready JPEGs for the touch strip and LCD keys.
 *
 * Text is drawn with QPainter into a QImage the size of the configured
 * touch-strip region. Artwork is decoded with QImage, scaled to the key
 * size the device reports and re-encoded.
 *
 * @section Dependencies
 * - QtGui (QImage, QPainter, QFont)
 */

#pragma once
#include <QImage>
#include <string>
#include <vector>
#include "core/ConfigData.hpp"
#include "device/DeckDevice.hpp"
#include "util/Result.hpp"

namespace nd {

class DeckRenderer {
public:
    explicit DeckRenderer(const TouchStripConfig& touchStrip);

    // One centred line per entry, elided when wider than the region
    Result<Bytes> renderTouchStrip(const std::vector<std::string>& lines) const;

    // Fails when the bytes are not a decodable image
    Result<Bytes> renderKeyArtwork(ByteView encoded, PixelSize keySize) const;

    Result<Bytes> blankKey(PixelSize keySize) const;

    const TouchStripConfig& touchStrip() const {
        return touchStrip_;
    }

    static Result<Bytes> encodeJpeg(const QImage& image, int quality = 90);

private:
    TouchStripConfig touchStrip_;
};

} // namespace nd
