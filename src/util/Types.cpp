#include "Types.hpp"
#include <cstdio>

namespace nd {

Color Color::fromHex(const std::string& hex) {
    std::string s = hex;
    if (!s.empty() && s.front() == '#')
        s.erase(0, 1);
    if (s.size() != 6)
        return black();

    unsigned int value = 0;
    for (char c : s) {
        value <<= 4;
        if (c >= '0' && c <= '9')
            value |= static_cast<unsigned int>(c - '0');
        else if (c >= 'a' && c <= 'f')
            value |= static_cast<unsigned int>(c - 'a' + 10);
        else if (c >= 'A' && c <= 'F')
            value |= static_cast<unsigned int>(c - 'A' + 10);
        else
            return black();
    }
    return {static_cast<u8>((value >> 16) & 0xFF),
            static_cast<u8>((value >> 8) & 0xFF),
            static_cast<u8>(value & 0xFF)};
}

std::string Color::toHex() const {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "#%02X%02X%02X", r, g, b);
    return buf;
}

} // namespace nd
