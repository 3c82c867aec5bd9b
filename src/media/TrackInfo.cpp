#include "TrackInfo.hpp"
#include <spdlog/fmt/fmt.h>

namespace nd {

std::string TrackInfo::artworkIdentity() const {
    if (!artworkKey.empty())
        return artworkKey;
    if (!artwork)
        return {};
    return fmt::format("{:016x}", hashBytes(*artwork));
}

u64 hashBytes(ByteView data) {
    u64 hash = 0xcbf29ce484222325ULL;
    for (u8 byte : data) {
        hash ^= byte;
        hash *= 0x100000001b3ULL;
    }
    return hash;
}

} // namespace nd
