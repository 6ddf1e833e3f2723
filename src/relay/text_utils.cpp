#include "text_utils.hpp"

#include <algorithm>
#include <array>

namespace text {

namespace {

constexpr std::array<char32_t, 34> kPunctuation = {
    U'。', U'，', U'！', U'？', U'、', U'；', U'：', U'“', U'”',
    U'.', U',', U'!', U'?', U';', U':', U'"', U'\'',
    U'（', U'）', U'(', U')', U'【', U'】', U'[', U']',
    U'《', U'》', U'<', U'>', U'—', U'…', U'·', U'‘', U'’',
};

// Decodes one UTF-8 sequence starting at s[pos]. Returns the byte length, or 0
// for a malformed sequence (the byte is then kept verbatim).
size_t decode_at(std::string_view s, size_t pos, char32_t& cp) {
    auto b0 = static_cast<unsigned char>(s[pos]);
    size_t len = 0;
    if (b0 < 0x80) {
        cp = b0;
        return 1;
    } else if ((b0 & 0xe0) == 0xc0) {
        cp = b0 & 0x1f;
        len = 2;
    } else if ((b0 & 0xf0) == 0xe0) {
        cp = b0 & 0x0f;
        len = 3;
    } else if ((b0 & 0xf8) == 0xf0) {
        cp = b0 & 0x07;
        len = 4;
    } else {
        return 0;
    }
    if (pos + len > s.size()) return 0;
    for (size_t i = 1; i < len; ++i) {
        auto b = static_cast<unsigned char>(s[pos + i]);
        if ((b & 0xc0) != 0x80) return 0;
        cp = (cp << 6) | (b & 0x3f);
    }
    return len;
}

} // namespace

bool is_transcript_punctuation(char32_t cp) {
    return std::find(kPunctuation.begin(), kPunctuation.end(), cp) != kPunctuation.end();
}

std::string strip_trailing_punctuation(std::string_view s) {
    size_t end = s.size();
    while (end > 0) {
        // Walk back to the lead byte of the last code point.
        size_t start = end - 1;
        while (start > 0 && (static_cast<unsigned char>(s[start]) & 0xc0) == 0x80) {
            --start;
        }
        char32_t cp = 0;
        size_t len = decode_at(s, start, cp);
        if (len != end - start || !is_transcript_punctuation(cp)) break;
        end = start;
    }
    return std::string(s.substr(0, end));
}

std::string strip_all_punctuation(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    size_t pos = 0;
    while (pos < s.size()) {
        char32_t cp = 0;
        size_t len = decode_at(s, pos, cp);
        if (len == 0) {
            out.push_back(s[pos]);
            ++pos;
            continue;
        }
        if (!is_transcript_punctuation(cp)) {
            out.append(s.substr(pos, len));
        }
        pos += len;
    }
    return out;
}

} // namespace text
