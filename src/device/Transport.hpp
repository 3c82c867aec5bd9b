#pragma once
// Transport.hpp - Raw HID report I/O, one open device
// Reports always carry the report ID in byte 0

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "util/Result.hpp"
#include "util/Types.hpp"

namespace nd {

struct HidDeviceEntry {
    std::string path;     // platform device path, opaque to callers
    u16 vendorId{0};
    u16 productId{0};
    std::string serial;
    std::string name;
};

class Transport {
public:
    virtual ~Transport() = default;

    virtual Result<void> write(ByteView report) = 0;

    // Next input report, std::nullopt when none arrives within timeoutMs
    virtual Result<std::optional<Bytes>> read(usize maxLength, i32 timeoutMs) = 0;

    virtual Result<void> sendFeature(ByteView report) = 0;
    virtual Result<Bytes> getFeature(u8 reportId, usize length) = 0;

    virtual std::string path() const = 0;
};

// Implemented by the platform transport (hidraw on Linux, HID API on Windows)
namespace hid {

// All HID devices currently attached, sorted by path
std::vector<HidDeviceEntry> enumerate();

Result<std::unique_ptr<Transport>> open(const std::string& path);

} // namespace hid

} // namespace nd
