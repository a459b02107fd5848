#pragma once

#include <cstddef>
#include <string>

namespace mathguard::runtime::text {

// Script strings are UTF-8; lengths and indices count code points.

inline bool IsAscii(const std::string& value) {
    for (unsigned char c : value) {
        if (c >= 0x80) {
            return false;
        }
    }
    return true;
}

inline std::u32string Decode(const std::string& value) {
    std::u32string out;
    out.reserve(value.size());
    std::size_t i = 0;
    while (i < value.size()) {
        const auto lead = static_cast<unsigned char>(value[i]);
        char32_t code = lead;
        std::size_t extra = 0;
        if (lead >= 0xF0) {
            code = lead & 0x07;
            extra = 3;
        } else if (lead >= 0xE0) {
            code = lead & 0x0F;
            extra = 2;
        } else if (lead >= 0xC0) {
            code = lead & 0x1F;
            extra = 1;
        }
        ++i;
        for (std::size_t k = 0; k < extra && i < value.size(); ++k, ++i) {
            code = (code << 6) | (static_cast<unsigned char>(value[i]) & 0x3F);
        }
        out.push_back(code);
    }
    return out;
}

inline void AppendUtf8(std::string& out, char32_t code) {
    if (code < 0x80) {
        out.push_back(static_cast<char>(code));
    } else if (code < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (code >> 6)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    } else if (code < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (code >> 12)));
        out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (code >> 18)));
        out.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    }
}

inline std::string Encode(const std::u32string& value) {
    std::string out;
    out.reserve(value.size());
    for (char32_t code : value) {
        AppendUtf8(out, code);
    }
    return out;
}

inline std::size_t Length(const std::string& value) {
    std::size_t count = 0;
    for (unsigned char c : value) {
        if ((c & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

}  // namespace mathguard::runtime::text
