#include "diyanet/string_utils.h"


namespace diyanet {

namespace {

// Decodes one code point at text[pos]; returns the sequence length or 0 if invalid.
size_t decode_utf8(const std::string& text, size_t pos, uint32_t& cp) {
    const unsigned char c0 = static_cast<unsigned char>(text[pos]);
    size_t len;
    if (c0 < 0x80) {
        cp = c0;
        return 1;
    } else if ((c0 & 0xE0) == 0xC0) {
        len = 2;
        cp = c0 & 0x1F;
    } else if ((c0 & 0xF0) == 0xE0) {
        len = 3;
        cp = c0 & 0x0F;
    } else if ((c0 & 0xF8) == 0xF0) {
        len = 4;
        cp = c0 & 0x07;
    } else {
        return 0;
    }
    if (pos + len > text.size()) {
        return 0;
    }
    for (size_t i = 1; i < len; ++i) {
        const unsigned char c = static_cast<unsigned char>(text[pos + i]);
        if ((c & 0xC0) != 0x80) {
            return 0;
        }
        cp = (cp << 6) | (c & 0x3F);
    }
    // reject overlong forms, surrogates and out-of-range values
    static const uint32_t min_for_len[5] = {0, 0, 0x80, 0x800, 0x10000};
    if (cp < min_for_len[len] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        return 0;
    }
    return len;
}

bool is_ascii_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

// Appends the folded form of cp to out.
void fold_code_point(uint32_t cp, std::string& out) {
    if (cp >= 'A' && cp <= 'Z') {
        out += static_cast<char>(cp + 32);
        return;
    }
    if (cp < 0x80) {
        out += static_cast<char>(cp);
        return;
    }

    // Latin-1 Supplement
    if (cp == 0x00B5) { append_utf8(out, 0x03BC); return; }
    if (cp == 0x00DF) { out += "ss"; return; }
    if (cp >= 0x00C0 && cp <= 0x00DE && cp != 0x00D7) { append_utf8(out, cp + 32); return; }

    // Latin Extended-A
    if (cp == 0x0130) { out += 'i'; append_utf8(out, 0x0307); return; }
    if (cp == 0x0178) { append_utf8(out, 0x00FF); return; }
    if (cp == 0x017F) { out += 's'; return; }
    if ((cp >= 0x0100 && cp <= 0x012F) || (cp >= 0x0132 && cp <= 0x0137) ||
        (cp >= 0x014A && cp <= 0x0177)) {
        append_utf8(out, cp | 1u);
        return;
    }
    if ((cp >= 0x0139 && cp <= 0x0148) || (cp >= 0x0179 && cp <= 0x017E)) {
        append_utf8(out, (cp & 1u) ? cp + 1 : cp);
        return;
    }

    // Greek
    if (cp == 0x0386) { append_utf8(out, 0x03AC); return; }
    if (cp >= 0x0388 && cp <= 0x038A) { append_utf8(out, cp + 37); return; }
    if (cp == 0x038C) { append_utf8(out, 0x03CC); return; }
    if (cp == 0x038E || cp == 0x038F) { append_utf8(out, cp + 63); return; }
    if (cp >= 0x0391 && cp <= 0x03AB && cp != 0x03A2) { append_utf8(out, cp + 32); return; }
    if (cp == 0x03C2) { append_utf8(out, 0x03C3); return; }

    // Cyrillic
    if (cp >= 0x0400 && cp <= 0x040F) { append_utf8(out, cp + 80); return; }
    if (cp >= 0x0410 && cp <= 0x042F) { append_utf8(out, cp + 32); return; }

    append_utf8(out, cp);
}

} // namespace

void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

std::string casefold(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    size_t pos = 0;
    while (pos < text.size()) {
        uint32_t cp = 0;
        size_t len = decode_utf8(text, pos, cp);
        if (len == 0) {
            result += text[pos++];
            continue;
        }
        fold_code_point(cp, result);
        pos += len;
    }
    return result;
}

bool iequals(const std::string& a, const std::string& b) {
    return casefold(a) == casefold(b);
}

std::string trim(const std::string& text) {
    size_t start = 0;
    size_t end = text.size();
    while (start < end && is_ascii_space(text[start])) ++start;
    while (end > start && is_ascii_space(text[end - 1])) --end;
    return text.substr(start, end - start);
}

bool is_blank(const std::string& text) {
    for (char c : text) {
        if (!is_ascii_space(c)) return false;
    }
    return true;
}

std::string url_encode(const std::string& text) {
    static const char hex[] = "0123456789ABCDEF";
    std::string result;
    result.reserve(text.size() * 3);
    for (unsigned char c : text) {
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            result += static_cast<char>(c);
        } else if (c == ' ') {
            result += '+';
        } else {
            result += '%';
            result += hex[c >> 4];
            result += hex[c & 0x0F];
        }
    }
    return result;
}

bool is_valid_utf8(const std::string& text) {
    size_t pos = 0;
    while (pos < text.size()) {
        uint32_t cp = 0;
        size_t len = decode_utf8(text, pos, cp);
        if (len == 0) return false;
        pos += len;
    }
    return true;
}

} // namespace diyanet
