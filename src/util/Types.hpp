#pragma once
// Types.hpp - Fixed-width aliases and small value types

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace nd {

using u8 = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;
using i32 = std::int32_t;
using i64 = std::int64_t;
using f32 = float;
using usize = std::size_t;

using Bytes = std::vector<u8>;
using ByteView = std::span<const u8>;

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = std::chrono::milliseconds;

struct Color {
    u8 r{0};
    u8 g{0};
    u8 b{0};

    static constexpr Color black() {
        return {0, 0, 0};
    }
    static constexpr Color white() {
        return {255, 255, 255};
    }

    // Accepts "#RRGGBB" or "RRGGBB", anything else yields black
    static Color fromHex(const std::string& hex);
    std::string toHex() const;

    bool operator==(const Color&) const = default;
};

} // namespace nd
