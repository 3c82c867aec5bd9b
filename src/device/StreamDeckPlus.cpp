#include "StreamDeckPlus.hpp"
#include <algorithm>
#include "core/Logger.hpp"

namespace nd {

namespace {

constexpr u8 IMAGE_REPORT_ID = 0x02;
constexpr u8 CMD_KEY_IMAGE = 0x07;
constexpr u8 CMD_LCD_IMAGE = 0x0c;

constexpr u8 FEATURE_REPORT_ID = 0x03;
constexpr u8 FEATURE_RESET = 0x02;
constexpr u8 FEATURE_BRIGHTNESS = 0x08;
constexpr u8 FEATURE_FIRMWARE = 0x05;
constexpr u8 FEATURE_SERIAL = 0x06;

constexpr u8 INPUT_REPORT_ID = 0x01;
constexpr u8 EVENT_KEY = 0x00;
constexpr u8 EVENT_TOUCH = 0x02;
constexpr u8 EVENT_DIAL = 0x03;
constexpr usize KEY_STATE_OFFSET = 4;

constexpr usize INPUT_REPORT_LENGTH = 64;

void putLe16(Bytes& buf, usize offset, usize value) {
    buf[offset] = static_cast<u8>(value & 0xFF);
    buf[offset + 1] = static_cast<u8>((value >> 8) & 0xFF);
}

} // namespace

StreamDeckPlus::StreamDeckPlus(std::unique_ptr<Transport> transport)
    : transport_(std::move(transport)) {
}

StreamDeckPlus::~StreamDeckPlus() = default;

Result<void> StreamDeckPlus::reset() {
    Bytes payload(FEATURE_REPORT_LENGTH, 0);
    payload[0] = FEATURE_REPORT_ID;
    payload[1] = FEATURE_RESET;
    return transport_->sendFeature(payload);
}

Result<void> StreamDeckPlus::setBrightness(u32 percent) {
    Bytes payload(FEATURE_REPORT_LENGTH, 0);
    payload[0] = FEATURE_REPORT_ID;
    payload[1] = FEATURE_BRIGHTNESS;
    payload[2] = static_cast<u8>(std::min(percent, 100u));
    return transport_->sendFeature(payload);
}

Result<void> StreamDeckPlus::setKeyImage(u32 key, ByteView image) {
    if (key >= KEY_COUNT)
        return Result<void>::err("Key index out of range: " +
                                 std::to_string(key));
    if (image.empty())
        return Result<void>::err("Empty key image");

    usize page = 0;
    usize sent = 0;
    while (sent < image.size()) {
        usize chunk = std::min(image.size() - sent, KEY_PAYLOAD_LENGTH);
        bool last = sent + chunk == image.size();

        Bytes report(IMAGE_REPORT_LENGTH, 0);
        report[0] = IMAGE_REPORT_ID;
        report[1] = CMD_KEY_IMAGE;
        report[2] = static_cast<u8>(key);
        report[3] = last ? 1 : 0;
        putLe16(report, 4, chunk);
        putLe16(report, 6, page);
        std::copy_n(image.begin() + static_cast<std::ptrdiff_t>(sent), chunk,
                    report.begin() + KEY_HEADER_LENGTH);

        if (auto res = transport_->write(report); !res)
            return res;

        sent += chunk;
        ++page;
    }
    return Result<void>::ok();
}

Result<void> StreamDeckPlus::setTouchscreenImage(ByteView image,
                                                 u32 x,
                                                 u32 y,
                                                 u32 width,
                                                 u32 height) {
    if (image.empty())
        return Result<void>::err("Empty touchscreen image");
    if (x + width > TOUCHSCREEN_WIDTH || y + height > TOUCHSCREEN_HEIGHT)
        return Result<void>::err("Touchscreen region out of bounds");

    usize page = 0;
    usize sent = 0;
    while (sent < image.size()) {
        usize chunk = std::min(image.size() - sent, LCD_PAYLOAD_LENGTH);
        bool last = sent + chunk == image.size();

        Bytes report(IMAGE_REPORT_LENGTH, 0);
        report[0] = IMAGE_REPORT_ID;
        report[1] = CMD_LCD_IMAGE;
        putLe16(report, 2, x);
        putLe16(report, 4, y);
        putLe16(report, 6, width);
        putLe16(report, 8, height);
        report[10] = last ? 1 : 0;
        putLe16(report, 11, page);
        putLe16(report, 13, chunk);
        std::copy_n(image.begin() + static_cast<std::ptrdiff_t>(sent), chunk,
                    report.begin() + LCD_HEADER_LENGTH);

        if (auto res = transport_->write(report); !res)
            return res;

        sent += chunk;
        ++page;
    }
    return Result<void>::ok();
}

bool StreamDeckPlus::decodeKeyReport(ByteView report,
                                     std::array<bool, KEY_COUNT>& states) {
    if (report.size() < KEY_STATE_OFFSET + KEY_COUNT)
        return false;
    if (report[0] != INPUT_REPORT_ID || report[1] != EVENT_KEY)
        return false;
    for (u32 i = 0; i < KEY_COUNT; ++i)
        states[i] = report[KEY_STATE_OFFSET + i] != 0;
    return true;
}

Result<std::set<u32>> StreamDeckPlus::pollButtonEvents() {
    std::set<u32> pressed;

    // Drain everything queued since the last poll without blocking
    while (true) {
        auto report = transport_->read(INPUT_REPORT_LENGTH, 0);
        if (!report)
            return Result<std::set<u32>>::err(report.error().message);
        if (!report.value())
            break;

        const Bytes& data = *report.value();
        std::array<bool, KEY_COUNT> states{};
        if (decodeKeyReport(data, states)) {
            for (u32 i = 0; i < KEY_COUNT; ++i) {
                if (states[i] && !keyStates_[i]) {
                    LOG_DEBUG("Key {} has been pressed", i);
                    pressed.insert(i);
                } else if (!states[i] && keyStates_[i]) {
                    LOG_DEBUG("Key {} has been released", i);
                }
            }
            keyStates_ = states;
        } else if (data.size() > 1 && data[0] == INPUT_REPORT_ID) {
            if (data[1] == EVENT_TOUCH)
                LOG_TRACE("Touch strip event ignored");
            else if (data[1] == EVENT_DIAL)
                LOG_TRACE("Dial event ignored");
        }
    }

    return Result<std::set<u32>>::ok(std::move(pressed));
}

Result<std::string> StreamDeckPlus::readFeatureString(u8 reportId,
                                                      usize offset) {
    auto report = transport_->getFeature(reportId, FEATURE_REPORT_LENGTH);
    if (!report)
        return Result<std::string>::err(report.error().message);

    std::string out;
    const auto& data = report.value();
    for (usize i = offset; i < data.size(); ++i) {
        if (data[i] == 0)
            break;
        if (data[i] >= 0x20 && data[i] < 0x7f)
            out.push_back(static_cast<char>(data[i]));
    }
    return Result<std::string>::ok(std::move(out));
}

Result<std::string> StreamDeckPlus::serialNumber() {
    return readFeatureString(FEATURE_SERIAL, 2);
}

Result<std::string> StreamDeckPlus::firmwareVersion() {
    return readFeatureString(FEATURE_FIRMWARE, 6);
}

} // namespace nd
