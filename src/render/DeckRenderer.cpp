#include "DeckRenderer.hpp"
#include <QBuffer>
#include <QColor>
#include <QFont>
#include <QFontMetrics>
#include <QPainter>
#include <algorithm>

namespace nd {

namespace {

QColor toQColor(const Color& c) {
    return QColor(c.r, c.g, c.b);
}

} // namespace

DeckRenderer::DeckRenderer(const TouchStripConfig& touchStrip)
    : touchStrip_(touchStrip) {
}

Result<Bytes> DeckRenderer::encodeJpeg(const QImage& image, int quality) {
    QByteArray data;
    QBuffer buffer(&data);
    if (!buffer.open(QIODevice::WriteOnly))
        return Result<Bytes>::err("Failed to open image buffer");

    // The device has no alpha channel
    QImage rgb = image.convertToFormat(QImage::Format_RGB888);
    if (!rgb.save(&buffer, "JPEG", quality))
        return Result<Bytes>::err("JPEG encoding failed");

    return Result<Bytes>::ok(Bytes(data.begin(), data.end()));
}

Result<Bytes> DeckRenderer::renderTouchStrip(
        const std::vector<std::string>& lines) const {
    const int width = static_cast<int>(touchStrip_.width);
    const int height = static_cast<int>(touchStrip_.height);

    QImage canvas(width, height, QImage::Format_RGB32);
    canvas.fill(toQColor(touchStrip_.backgroundColor));

    {
        QPainter painter(&canvas);
        painter.setRenderHint(QPainter::TextAntialiasing);

        QFont font(QString::fromStdString(touchStrip_.fontFamily));
        font.setPixelSize(static_cast<int>(touchStrip_.fontSize));
        font.setBold(touchStrip_.bold);
        painter.setFont(font);
        painter.setPen(toQColor(touchStrip_.textColor));

        QFontMetrics metrics(font);
        const int lineHeight = metrics.height();
        const int maxLines = std::max(1, height / std::max(1, lineHeight));
        const int count = std::min(static_cast<int>(lines.size()), maxLines);
        int y = (height - count * lineHeight) / 2;

        for (int i = 0; i < count; ++i) {
            QString text = metrics.elidedText(
                    QString::fromStdString(lines[static_cast<size_t>(i)]),
                    Qt::ElideRight,
                    width - 8);
            painter.drawText(QRect(0, y, width, lineHeight),
                             Qt::AlignHCenter | Qt::AlignVCenter,
                             text);
            y += lineHeight;
        }
    }

    return encodeJpeg(canvas);
}

Result<Bytes> DeckRenderer::renderKeyArtwork(ByteView encoded,
                                             PixelSize keySize) const {
    if (encoded.empty())
        return Result<Bytes>::err("Artwork is empty");

    QImage art;
    if (!art.loadFromData(encoded.data(), static_cast<int>(encoded.size())))
        return Result<Bytes>::err("Artwork could not be decoded");

    QImage key(static_cast<int>(keySize.width),
               static_cast<int>(keySize.height),
               QImage::Format_RGB32);
    key.fill(Qt::black);

    QImage scaled = art.scaled(key.size(),
                               Qt::IgnoreAspectRatio,
                               Qt::SmoothTransformation);
    {
        QPainter painter(&key);
        painter.drawImage(0, 0, scaled);
    }

    return encodeJpeg(key);
}

Result<Bytes> DeckRenderer::blankKey(PixelSize keySize) const {
    QImage key(static_cast<int>(keySize.width),
               static_cast<int>(keySize.height),
               QImage::Format_RGB32);
    key.fill(Qt::black);
    return encodeJpeg(key);
}

} // namespace nd
