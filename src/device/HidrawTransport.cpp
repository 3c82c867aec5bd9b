#include "HidrawTransport.hpp"
#include <fcntl.h>
#include <linux/hidraw.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include "core/Logger.hpp"

namespace nd {

namespace fs = std::filesystem;

namespace {

std::string errnoMessage(const std::string& what) {
    return what + ": " + std::strerror(errno);
}

} // namespace

HidrawTransport::HidrawTransport(int fd, std::string path)
    : fd_(fd), path_(std::move(path)) {
}

HidrawTransport::~HidrawTransport() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

Result<std::unique_ptr<HidrawTransport>> HidrawTransport::open(
        const std::string& path) {
    int fd = ::open(path.c_str(), O_RDWR | O_CLOEXEC);
    if (fd < 0)
        return Result<std::unique_ptr<HidrawTransport>>::err(
                errnoMessage("Cannot open " + path));
    return Result<std::unique_ptr<HidrawTransport>>::ok(
            std::unique_ptr<HidrawTransport>(new HidrawTransport(fd, path)));
}

std::optional<HidDeviceEntry> HidrawTransport::parseUevent(
        const std::string& content) {
    HidDeviceEntry entry;
    bool haveId = false;

    std::istringstream in(content);
    std::string line;
    while (std::getline(in, line)) {
        auto eq = line.find('=');
        if (eq == std::string::npos)
            continue;
        auto key = line.substr(0, eq);
        auto value = line.substr(eq + 1);

        if (key == "HID_ID") {
            // bus:vendor:product, each hex, e.g. 0003:00000FD9:00000084
            unsigned int bus = 0, vendor = 0, product = 0;
            if (std::sscanf(value.c_str(), "%x:%x:%x", &bus, &vendor, &product) == 3) {
                entry.vendorId = static_cast<u16>(vendor);
                entry.productId = static_cast<u16>(product);
                haveId = true;
            }
        } else if (key == "HID_NAME") {
            entry.name = value;
        } else if (key == "HID_UNIQ") {
            entry.serial = value;
        }
    }

    if (!haveId)
        return std::nullopt;
    return entry;
}

std::vector<HidDeviceEntry> HidrawTransport::enumerate() {
    std::vector<HidDeviceEntry> devices;
    std::error_code ec;
    const fs::path sysClass = "/sys/class/hidraw";
    if (!fs::is_directory(sysClass, ec))
        return devices;

    for (const auto& node : fs::directory_iterator(sysClass, ec)) {
        std::ifstream uevent(node.path() / "device" / "uevent");
        if (!uevent)
            continue;
        std::stringstream content;
        content << uevent.rdbuf();

        auto entry = parseUevent(content.str());
        if (!entry)
            continue;
        entry->path = "/dev/" + node.path().filename().string();
        devices.push_back(std::move(*entry));
    }

    std::sort(devices.begin(), devices.end(),
              [](const auto& a, const auto& b) { return a.path < b.path; });
    return devices;
}

Result<void> HidrawTransport::write(ByteView report) {
    ssize_t written = ::write(fd_, report.data(), report.size());
    if (written < 0)
        return Result<void>::err(errnoMessage("HID write failed on " + path_));
    if (static_cast<usize>(written) != report.size())
        return Result<void>::err("Short HID write on " + path_);
    return Result<void>::ok();
}

Result<std::optional<Bytes>> HidrawTransport::read(usize maxLength,
                                                   i32 timeoutMs) {
    using R = Result<std::optional<Bytes>>;

    pollfd pfd{fd_, POLLIN, 0};
    int ready = ::poll(&pfd, 1, timeoutMs);
    if (ready < 0) {
        if (errno == EINTR)
            return R::ok(std::nullopt);
        return R::err(errnoMessage("HID poll failed on " + path_));
    }
    if (ready == 0)
        return R::ok(std::nullopt);
    if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL))
        return R::err("HID device " + path_ + " disconnected");

    Bytes buffer(maxLength);
    ssize_t got = ::read(fd_, buffer.data(), buffer.size());
    if (got < 0)
        return R::err(errnoMessage("HID read failed on " + path_));
    buffer.resize(static_cast<usize>(got));
    return R::ok(std::move(buffer));
}

Result<void> HidrawTransport::sendFeature(ByteView report) {
    Bytes buffer(report.begin(), report.end());
    if (::ioctl(fd_, HIDIOCSFEATURE(buffer.size()), buffer.data()) < 0)
        return Result<void>::err(
                errnoMessage("HID set feature failed on " + path_));
    return Result<void>::ok();
}

Result<Bytes> HidrawTransport::getFeature(u8 reportId, usize length) {
    Bytes buffer(length, 0);
    buffer[0] = reportId;
    int got = ::ioctl(fd_, HIDIOCGFEATURE(buffer.size()), buffer.data());
    if (got < 0)
        return Result<Bytes>::err(
                errnoMessage("HID get feature failed on " + path_));
    buffer.resize(static_cast<usize>(got));
    return Result<Bytes>::ok(std::move(buffer));
}

namespace hid {

std::vector<HidDeviceEntry> enumerate() {
    return HidrawTransport::enumerate();
}

Result<std::unique_ptr<Transport>> open(const std::string& path) {
    auto transport = HidrawTransport::open(path);
    if (!transport)
        return Result<std::unique_ptr<Transport>>::err(transport.error().message);
    return Result<std::unique_ptr<Transport>>::ok(std::move(transport).value());
}

} // namespace hid

} // namespace nd
