/**
 * @file types.cpp
 * @brief Out-of-line helpers for core types
 */

#include <lumen/core/types.hpp>

#include <cctype>

namespace lumen {

namespace {

int hexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
    return -1;
}

bool parseByte(const std::string& s, size_t pos, uint8_t& out) {
    int hi = hexDigit(s[pos]);
    int lo = hexDigit(s[pos + 1]);
    if (hi < 0 || lo < 0) {
        return false;
    }
    out = static_cast<uint8_t>(hi * 16 + lo);
    return true;
}

} // namespace

Color Color::fromHex(const std::string& hex) {
    std::string s = hex;
    if (!s.empty() && s.front() == '#') {
        s.erase(s.begin());
    }
    if (s.size() == 3) {
        // #rgb shorthand
        s = {s[0], s[0], s[1], s[1], s[2], s[2]};
    }
    if (s.size() != 6 && s.size() != 8) {
        return black();
    }

    Color c;
    if (!parseByte(s, 0, c.r) || !parseByte(s, 2, c.g) || !parseByte(s, 4, c.b)) {
        return black();
    }
    if (s.size() == 8 && !parseByte(s, 6, c.a)) {
        return black();
    }
    return c;
}

} // namespace lumen
