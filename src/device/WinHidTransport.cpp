#include "WinHidTransport.hpp"

#ifndef NOMINMAX
#define NOMINMAX
#endif
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>
#include <setupapi.h>
#include <hidsdi.h>
#include <hidpi.h>

#include <algorithm>
#include "core/Logger.hpp"

namespace nd {

namespace {

std::string lastErrorMessage(const std::string& what) {
    DWORD code = GetLastError();
    char* buffer = nullptr;
    DWORD len = FormatMessageA(FORMAT_MESSAGE_ALLOCATE_BUFFER |
                                       FORMAT_MESSAGE_FROM_SYSTEM |
                                       FORMAT_MESSAGE_IGNORE_INSERTS,
                               nullptr,
                               code,
                               0,
                               reinterpret_cast<LPSTR>(&buffer),
                               0,
                               nullptr);
    std::string text = len && buffer ? std::string(buffer, len)
                                     : "error " + std::to_string(code);
    if (buffer)
        LocalFree(buffer);
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r'))
        text.pop_back();
    return what + ": " + text;
}

std::string narrow(const wchar_t* text) {
    int len = WideCharToMultiByte(CP_UTF8, 0, text, -1, nullptr, 0, nullptr, nullptr);
    if (len <= 1)
        return {};
    std::string out(static_cast<usize>(len - 1), '\0');
    WideCharToMultiByte(CP_UTF8, 0, text, -1, out.data(), len, nullptr, nullptr);
    return out;
}

// Waits for an overlapped operation, cancelling it after timeoutMs
// (negative = wait forever). Returns false on timeout or error.
bool finishOverlapped(HANDLE handle, OVERLAPPED& ov, DWORD& transferred,
                      i32 timeoutMs, bool& timedOut) {
    timedOut = false;
    DWORD wait = WaitForSingleObject(ov.hEvent,
                                     timeoutMs < 0 ? INFINITE
                                                   : static_cast<DWORD>(timeoutMs));
    if (wait == WAIT_TIMEOUT) {
        CancelIo(handle);
        // The cancelled request may still have completed in the meantime
        if (GetOverlappedResult(handle, &ov, &transferred, TRUE))
            return true;
        timedOut = GetLastError() == ERROR_OPERATION_ABORTED;
        return false;
    }
    if (wait != WAIT_OBJECT_0)
        return false;
    return GetOverlappedResult(handle, &ov, &transferred, FALSE) != FALSE;
}

} // namespace

WinHidTransport::WinHidTransport(void* handle,
                                 std::string path,
                                 usize inputLength,
                                 usize outputLength,
                                 usize featureLength)
    : handle_(handle),
      readEvent_(CreateEventA(nullptr, TRUE, FALSE, nullptr)),
      writeEvent_(CreateEventA(nullptr, TRUE, FALSE, nullptr)),
      path_(std::move(path)),
      inputLength_(inputLength),
      outputLength_(outputLength),
      featureLength_(featureLength) {
}

WinHidTransport::~WinHidTransport() {
    if (handle_ && handle_ != INVALID_HANDLE_VALUE) {
        CancelIo(handle_);
        CloseHandle(handle_);
    }
    if (readEvent_)
        CloseHandle(readEvent_);
    if (writeEvent_)
        CloseHandle(writeEvent_);
}

Result<std::unique_ptr<WinHidTransport>> WinHidTransport::open(
        const std::string& path) {
    using R = Result<std::unique_ptr<WinHidTransport>>;

    HANDLE handle = CreateFileA(path.c_str(),
                                GENERIC_READ | GENERIC_WRITE,
                                FILE_SHARE_READ | FILE_SHARE_WRITE,
                                nullptr,
                                OPEN_EXISTING,
                                FILE_FLAG_OVERLAPPED,
                                nullptr);
    if (handle == INVALID_HANDLE_VALUE)
        return R::err(lastErrorMessage("Cannot open " + path));

    PHIDP_PREPARSED_DATA preparsed = nullptr;
    HIDP_CAPS caps{};
    bool haveCaps = HidD_GetPreparsedData(handle, &preparsed) &&
                    HidP_GetCaps(preparsed, &caps) == HIDP_STATUS_SUCCESS;
    if (preparsed)
        HidD_FreePreparsedData(preparsed);
    if (!haveCaps) {
        CloseHandle(handle);
        return R::err("Cannot read HID capabilities of " + path);
    }

    std::unique_ptr<WinHidTransport> transport(
            new WinHidTransport(handle,
                                path,
                                caps.InputReportByteLength,
                                caps.OutputReportByteLength,
                                caps.FeatureReportByteLength));
    if (!transport->readEvent_ || !transport->writeEvent_)
        return R::err(lastErrorMessage("Cannot create HID events"));
    return R::ok(std::move(transport));
}

std::vector<HidDeviceEntry> WinHidTransport::enumerate() {
    std::vector<HidDeviceEntry> devices;

    GUID hidGuid;
    HidD_GetHidGuid(&hidGuid);
    HDEVINFO info = SetupDiGetClassDevsA(
            &hidGuid, nullptr, nullptr, DIGCF_PRESENT | DIGCF_DEVICEINTERFACE);
    if (info == INVALID_HANDLE_VALUE) {
        LOG_WARN("{}", lastErrorMessage("HID device enumeration failed"));
        return devices;
    }

    SP_DEVICE_INTERFACE_DATA iface{};
    iface.cbSize = sizeof(iface);
    for (DWORD i = 0;
         SetupDiEnumDeviceInterfaces(info, nullptr, &hidGuid, i, &iface);
         ++i) {
        DWORD required = 0;
        SetupDiGetDeviceInterfaceDetailA(info, &iface, nullptr, 0, &required, nullptr);
        if (required == 0)
            continue;

        std::vector<char> storage(required);
        auto* detail =
                reinterpret_cast<SP_DEVICE_INTERFACE_DETAIL_DATA_A*>(storage.data());
        detail->cbSize = sizeof(SP_DEVICE_INTERFACE_DETAIL_DATA_A);
        if (!SetupDiGetDeviceInterfaceDetailA(
                    info, &iface, detail, required, nullptr, nullptr))
            continue;

        std::string path = detail->DevicePath;

        // No access rights needed to read attributes and strings
        HANDLE handle = CreateFileA(path.c_str(),
                                    0,
                                    FILE_SHARE_READ | FILE_SHARE_WRITE,
                                    nullptr,
                                    OPEN_EXISTING,
                                    0,
                                    nullptr);
        if (handle == INVALID_HANDLE_VALUE)
            continue;

        HIDD_ATTRIBUTES attrs{};
        attrs.Size = sizeof(attrs);
        if (HidD_GetAttributes(handle, &attrs)) {
            HidDeviceEntry entry;
            entry.path = path;
            entry.vendorId = attrs.VendorID;
            entry.productId = attrs.ProductID;

            wchar_t text[128]{};
            if (HidD_GetSerialNumberString(handle, text, sizeof(text)))
                entry.serial = narrow(text);
            text[0] = L'\0';
            if (HidD_GetProductString(handle, text, sizeof(text)))
                entry.name = narrow(text);

            devices.push_back(std::move(entry));
        }
        CloseHandle(handle);
    }
    SetupDiDestroyDeviceInfoList(info);

    std::sort(devices.begin(), devices.end(),
              [](const auto& a, const auto& b) { return a.path < b.path; });
    return devices;
}

Result<void> WinHidTransport::write(ByteView report) {
    // The class driver only accepts writes of the full output report size
    Bytes buffer(report.begin(), report.end());
    if (buffer.size() < outputLength_)
        buffer.resize(outputLength_, 0);

    OVERLAPPED ov{};
    ov.hEvent = writeEvent_;
    ResetEvent(writeEvent_);
    if (!WriteFile(handle_, buffer.data(), static_cast<DWORD>(buffer.size()),
                   nullptr, &ov) &&
        GetLastError() != ERROR_IO_PENDING)
        return Result<void>::err(lastErrorMessage("HID write failed on " + path_));

    DWORD written = 0;
    bool timedOut = false;
    if (!finishOverlapped(handle_, ov, written, 1000, timedOut))
        return Result<void>::err(timedOut ? "HID write timed out on " + path_
                                          : lastErrorMessage("HID write failed on " + path_));
    if (written != buffer.size())
        return Result<void>::err("Short HID write on " + path_);
    return Result<void>::ok();
}

Result<std::optional<Bytes>> WinHidTransport::read(usize maxLength,
                                                   i32 timeoutMs) {
    using R = Result<std::optional<Bytes>>;

    // ReadFile rejects buffers smaller than the input report
    Bytes buffer(std::max(maxLength, inputLength_));

    OVERLAPPED ov{};
    ov.hEvent = readEvent_;
    ResetEvent(readEvent_);
    if (!ReadFile(handle_, buffer.data(), static_cast<DWORD>(buffer.size()),
                  nullptr, &ov) &&
        GetLastError() != ERROR_IO_PENDING)
        return R::err(lastErrorMessage("HID read failed on " + path_));

    DWORD got = 0;
    bool timedOut = false;
    if (!finishOverlapped(handle_, ov, got, timeoutMs, timedOut)) {
        if (timedOut)
            return R::ok(std::nullopt);
        return R::err(lastErrorMessage("HID read failed on " + path_));
    }

    buffer.resize(std::min<usize>(got, maxLength));
    return R::ok(std::move(buffer));
}

Result<void> WinHidTransport::sendFeature(ByteView report) {
    Bytes buffer(report.begin(), report.end());
    if (buffer.size() < featureLength_)
        buffer.resize(featureLength_, 0);
    if (!HidD_SetFeature(handle_, buffer.data(), static_cast<ULONG>(buffer.size())))
        return Result<void>::err(
                lastErrorMessage("HID set feature failed on " + path_));
    return Result<void>::ok();
}

Result<Bytes> WinHidTransport::getFeature(u8 reportId, usize length) {
    Bytes buffer(std::max(length, featureLength_), 0);
    buffer[0] = reportId;
    if (!HidD_GetFeature(handle_, buffer.data(), static_cast<ULONG>(buffer.size())))
        return Result<Bytes>::err(
                lastErrorMessage("HID get feature failed on " + path_));
    buffer.resize(length);
    return Result<Bytes>::ok(std::move(buffer));
}

namespace hid {

std::vector<HidDeviceEntry> enumerate() {
    return WinHidTransport::enumerate();
}

Result<std::unique_ptr<Transport>> open(const std::string& path) {
    auto transport = WinHidTransport::open(path);
    if (!transport)
        return Result<std::unique_ptr<Transport>>::err(transport.error().message);
    return Result<std::unique_ptr<Transport>>::ok(std::move(transport).value());
}

} // namespace hid

} // namespace nd
