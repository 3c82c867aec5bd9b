/**
 * @file WinHidTransport.hpp
 * @brief Transport over the Windows HID class driver.
 *
 * Devices are found through SetupAPI with the HID interface GUID and
 * opened with CreateFile. Output and input reports use overlapped
 * WriteFile/ReadFile, feature reports HidD_SetFeature/HidD_GetFeature.
 *
 * @section Patterns
 * - RAII: the device handle and event handles close with the object.
 */

#pragma once
#include <memory>
#include <string>
#include <vector>
#include "Transport.hpp"

namespace nd {

class WinHidTransport : public Transport {
public:
    ~WinHidTransport() override;

    WinHidTransport(const WinHidTransport&) = delete;
    WinHidTransport& operator=(const WinHidTransport&) = delete;

    static Result<std::unique_ptr<WinHidTransport>> open(const std::string& path);

    static std::vector<HidDeviceEntry> enumerate();

    Result<void> write(ByteView report) override;
    Result<std::optional<Bytes>> read(usize maxLength, i32 timeoutMs) override;
    Result<void> sendFeature(ByteView report) override;
    Result<Bytes> getFeature(u8 reportId, usize length) override;

    std::string path() const override {
        return path_;
    }

private:
    WinHidTransport(void* handle,
                    std::string path,
                    usize inputLength,
                    usize outputLength,
                    usize featureLength);

    // HANDLEs, kept as void* so <windows.h> stays out of the header
    void* handle_{nullptr};
    void* readEvent_{nullptr};
    void* writeEvent_{nullptr};
    std::string path_;

    // Report sizes from the device capabilities, report ID included
    usize inputLength_{0};
    usize outputLength_{0};
    usize featureLength_{0};
};

} // namespace nd
