#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <algorithm>

namespace asciimedia {

namespace CharSet {

// Densest glyph first. Requested subsets are always reordered to match.
const std::string MASTER =
    "BEHWNQMA@KFGPRdb%D8Xe#SOap9Ufq6gh5mkZ4sxTL23YnCzw=IourV$0tv&cyJli1j7+*?<>\"():;-_!~/\\'|,.` ";

// Length of the UTF-8 sequence introduced by `lead`, 0 for a stray byte.
inline int sequence_length(unsigned char lead) {
    if (lead < 0x80) return 1;
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 0;
}

// Malformed sequences and surrogates are skipped.
inline std::vector<uint32_t> to_codepoints(const std::string& text) {
    static const uint32_t lead_mask[] = {0, 0x7F, 0x1F, 0x0F, 0x07};

    std::vector<uint32_t> result;
    size_t pos = 0;
    while (pos < text.size()) {
        const int len = sequence_length(static_cast<unsigned char>(text[pos]));
        if (len == 0 || pos + len > text.size()) {
            ++pos;
            continue;
        }

        uint32_t cp = static_cast<unsigned char>(text[pos]) & lead_mask[len];
        bool valid = true;
        for (int k = 1; k < len && valid; ++k) {
            const unsigned char next = static_cast<unsigned char>(text[pos + k]);
            valid = (next & 0xC0) == 0x80;
            cp = (cp << 6) | (next & 0x3F);
        }
        if (!valid) {
            ++pos;
            continue;
        }

        pos += static_cast<size_t>(len);
        if (cp < 0xD800 || cp > 0xDFFF) {
            result.push_back(cp);
        }
    }
    return result;
}

inline std::string to_utf8(uint32_t cp) {
    std::string result;
    if (cp < 0x80) {
        result += static_cast<char>(cp);
    } else if (cp < 0x800) {
        result += static_cast<char>(0xC0 | (cp >> 6));
        result += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        result += static_cast<char>(0xE0 | (cp >> 12));
        result += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        result += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        result += static_cast<char>(0xF0 | (cp >> 18));
        result += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        result += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        result += static_cast<char>(0x80 | (cp & 0x3F));
    }
    return result;
}

// Master characters present in `filter`, in master order. An empty filter
// selects the whole master set.
inline std::vector<uint32_t> select(const std::string& filter) {
    std::vector<uint32_t> master = to_codepoints(MASTER);
    if (filter.empty()) return master;

    std::vector<uint32_t> wanted = to_codepoints(filter);
    std::vector<uint32_t> result;
    for (uint32_t cp : master) {
        if (std::find(wanted.begin(), wanted.end(), cp) != wanted.end()) {
            result.push_back(cp);
        }
    }
    return result;
}

}

}
