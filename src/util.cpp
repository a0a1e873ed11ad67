#include <sodium/utils.h>

#include <esmp/util.hpp>

namespace esmp {

std::vector<std::string_view> split(std::string_view str, std::string_view delim) {
    std::vector<std::string_view> pieces;
    if (delim.empty()) {
        pieces.push_back(str);
        return pieces;
    }
    size_t pos;
    while ((pos = str.find(delim)) != std::string_view::npos) {
        pieces.push_back(str.substr(0, pos));
        str.remove_prefix(pos + delim.size());
    }
    pieces.push_back(str);
    return pieces;
}

int32_t utf8_next(std::string_view& s) {
    if (s.empty())
        return -1;
    auto b0 = static_cast<unsigned char>(s[0]);
    size_t len;
    int32_t cp;
    int32_t min;
    if (b0 < 0x80) {
        s.remove_prefix(1);
        return b0;
    } else if ((b0 & 0xE0) == 0xC0) {
        len = 2, cp = b0 & 0x1F, min = 0x80;
    } else if ((b0 & 0xF0) == 0xE0) {
        len = 3, cp = b0 & 0x0F, min = 0x800;
    } else if ((b0 & 0xF8) == 0xF0) {
        len = 4, cp = b0 & 0x07, min = 0x10000;
    } else {
        return -1;
    }
    if (s.size() < len)
        return -1;
    for (size_t i = 1; i < len; i++) {
        auto b = static_cast<unsigned char>(s[i]);
        if ((b & 0xC0) != 0x80)
            return -1;
        cp = (cp << 6) | (b & 0x3F);
    }
    // Reject overlong encodings, UTF-16 surrogates and values beyond U+10FFFF
    if (cp < min || (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF)
        return -1;
    s.remove_prefix(len);
    return cp;
}

size_t utf8_length(std::string_view s) {
    size_t n = 0;
    while (!s.empty()) {
        if (utf8_next(s) < 0)
            return std::string_view::npos;
        n++;
    }
    return n;
}

void sodium_zero_buffer(void* ptr, size_t size) {
    if (ptr)
        sodium_memzero(ptr, size);
}

}  // namespace esmp
