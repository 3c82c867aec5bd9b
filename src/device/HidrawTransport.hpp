/**
 * @file HidrawTransport.hpp
 * @brief Transport over the Linux hidraw character devices.
 *
 * Output and input reports use write()/read() on /dev/hidrawN, feature
 * reports use the HIDIOCSFEATURE/HIDIOCGFEATURE ioctls. Device discovery
 * reads /sys/class/hidraw/<node>/device/uevent.
 *
 * @section Patterns
 * - RAII: the file descriptor is closed with the object.
 */

#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "Transport.hpp"

namespace nd {

class HidrawTransport : public Transport {
public:
    ~HidrawTransport() override;

    HidrawTransport(const HidrawTransport&) = delete;
    HidrawTransport& operator=(const HidrawTransport&) = delete;

    static Result<std::unique_ptr<HidrawTransport>> open(const std::string& path);

    static std::vector<HidDeviceEntry> enumerate();

    // Parses the HID_ID / HID_NAME / HID_UNIQ lines of a hidraw uevent file
    static std::optional<HidDeviceEntry> parseUevent(const std::string& content);

    Result<void> write(ByteView report) override;
    Result<std::optional<Bytes>> read(usize maxLength, i32 timeoutMs) override;
    Result<void> sendFeature(ByteView report) override;
    Result<Bytes> getFeature(u8 reportId, usize length) override;

    std::string path() const override {
        return path_;
    }

private:
    HidrawTransport(int fd, std::string path);

    int fd_{-1};
    std::string path_;
};

} // namespace nd
