#include "subtitle/utf8.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <iterator>

namespace utf8 {

namespace {

constexpr char32_t REPLACEMENT = 0xFFFD;

bool is_continuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

// Decodes one code point at s[pos]. Returns the number of bytes consumed.
size_t decode_one(std::string_view s, size_t pos, char32_t& cp) {
    auto c = static_cast<unsigned char>(s[pos]);
    size_t len = 0;
    char32_t min = 0;

    if (c < 0x80) {
        cp = c;
        return 1;
    } else if ((c & 0xE0) == 0xC0) {
        len = 2; cp = c & 0x1F; min = 0x80;
    } else if ((c & 0xF0) == 0xE0) {
        len = 3; cp = c & 0x0F; min = 0x800;
    } else if ((c & 0xF8) == 0xF0) {
        len = 4; cp = c & 0x07; min = 0x10000;
    } else {
        cp = REPLACEMENT;
        return 1;
    }

    if (pos + len > s.size()) {
        cp = REPLACEMENT;
        return 1;
    }
    for (size_t i = 1; i < len; ++i) {
        auto cc = static_cast<unsigned char>(s[pos + i]);
        if (!is_continuation(cc)) {
            cp = REPLACEMENT;
            return 1;
        }
        cp = (cp << 6) | (cc & 0x3F);
    }
    if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        cp = REPLACEMENT;
        return 1;
    }
    return len;
}

struct Range {
    char32_t lo;
    char32_t hi;
};

// Letters (L*) and digits/numbers (N*) outside ASCII, sorted and disjoint.
// Abugida blocks are taken whole, vowel signs included, minus their sentence
// punctuation.
constexpr std::array ALNUM_RANGES = std::to_array<Range>({
    {0x00AA, 0x00AA}, {0x00B2, 0x00B3}, {0x00B5, 0x00B5}, {0x00B9, 0x00BA},
    {0x00BC, 0x00BE}, {0x00C0, 0x00D6}, {0x00D8, 0x00F6}, {0x00F8, 0x02C1},
    {0x02C6, 0x02D1}, {0x02E0, 0x02E4}, {0x02EC, 0x02EC}, {0x02EE, 0x02EE},
    // Greek, Coptic, Cyrillic
    {0x0370, 0x0374}, {0x0376, 0x0377}, {0x037A, 0x037D}, {0x037F, 0x037F},
    {0x0386, 0x0386}, {0x0388, 0x03F5}, {0x03F7, 0x0481}, {0x048A, 0x052F},
    // Armenian
    {0x0531, 0x0556}, {0x0559, 0x0559}, {0x0560, 0x0588},
    // Hebrew
    {0x05D0, 0x05EA}, {0x05EF, 0x05F2},
    // Arabic
    {0x0620, 0x064A}, {0x0660, 0x0669}, {0x066E, 0x06D3}, {0x06D5, 0x06D5},
    {0x06E5, 0x06E6}, {0x06EE, 0x06FC}, {0x06FF, 0x06FF},
    // Syriac, Arabic Supplement, Thaana, NKo
    {0x0710, 0x074A}, {0x074D, 0x07B1}, {0x07C0, 0x07EA},
    {0x0800, 0x0815}, {0x0840, 0x0858}, {0x0860, 0x086A}, {0x0870, 0x0887},
    {0x0889, 0x088E}, {0x08A0, 0x08C9},
    // Devanagari through Sinhala
    {0x0900, 0x0963}, {0x0966, 0x096F}, {0x0971, 0x09FC},
    {0x0A00, 0x0A75}, {0x0A81, 0x0AEF}, {0x0AF9, 0x0AFF}, {0x0B01, 0x0B6F},
    {0x0B71, 0x0B77}, {0x0B82, 0x0BF2}, {0x0C00, 0x0C7E}, {0x0C80, 0x0CF3},
    {0x0D00, 0x0D4E}, {0x0D54, 0x0D78}, {0x0D7A, 0x0DEF}, {0x0DF2, 0x0DF3},
    // Thai, Lao
    {0x0E01, 0x0E3A}, {0x0E40, 0x0E4E}, {0x0E50, 0x0E59},
    {0x0E81, 0x0EDF},
    // Tibetan
    {0x0F00, 0x0F00}, {0x0F20, 0x0F33}, {0x0F40, 0x0F6C}, {0x0F88, 0x0F8C},
    // Myanmar
    {0x1000, 0x1049}, {0x1050, 0x109D},
    // Georgian, Hangul Jamo, Ethiopic
    {0x10A0, 0x10FA}, {0x10FC, 0x135A}, {0x1369, 0x137C}, {0x1380, 0x138F},
    // Cherokee, Canadian Syllabics, Ogham, Runic
    {0x13A0, 0x13F5}, {0x13F8, 0x13FD}, {0x1401, 0x166C}, {0x166F, 0x167F},
    {0x1681, 0x169A}, {0x16A0, 0x16EA}, {0x16EE, 0x16F8},
    // Philippine scripts, Khmer, Mongolian
    {0x1700, 0x1773},
    {0x1780, 0x17B3}, {0x17D7, 0x17D7}, {0x17DC, 0x17DC}, {0x17E0, 0x17E9},
    {0x17F0, 0x17F9}, {0x1810, 0x1819}, {0x1820, 0x1878}, {0x1880, 0x18AA},
    // Limbu through Ol Chiki, Cyrillic Extended-C, Georgian Mtavruli
    {0x18B0, 0x18F5}, {0x1900, 0x193B}, {0x1946, 0x19DA},
    {0x1A00, 0x1A1B}, {0x1A20, 0x1A99}, {0x1AA7, 0x1AA7}, {0x1B00, 0x1B59},
    {0x1B80, 0x1BF3}, {0x1C00, 0x1C37}, {0x1C40, 0x1C49}, {0x1C4D, 0x1C7D},
    {0x1C80, 0x1C88}, {0x1C90, 0x1CBA}, {0x1CBD, 0x1CBF},
    // Phonetic extensions, Latin Extended Additional, Greek Extended
    {0x1D00, 0x1DBF}, {0x1E00, 0x1F15}, {0x1F18, 0x1F1D}, {0x1F20, 0x1F45},
    {0x1F48, 0x1F4D}, {0x1F50, 0x1F57}, {0x1F59, 0x1F7D}, {0x1F80, 0x1FB4},
    {0x1FB6, 0x1FBC}, {0x1FBE, 0x1FBE}, {0x1FC2, 0x1FC4}, {0x1FC6, 0x1FCC},
    {0x1FD0, 0x1FD3}, {0x1FD6, 0x1FDB}, {0x1FE0, 0x1FEC}, {0x1FF2, 0x1FF4},
    {0x1FF6, 0x1FFC},
    // Super/subscripts, letterlike symbols, number forms, enclosed numbers
    {0x2070, 0x2071}, {0x2074, 0x2079}, {0x207F, 0x2089}, {0x2090, 0x209C},
    {0x2102, 0x2102}, {0x2107, 0x2107}, {0x210A, 0x2113}, {0x2115, 0x2115},
    {0x2119, 0x211D}, {0x2124, 0x2124}, {0x2126, 0x2126}, {0x2128, 0x2128},
    {0x212A, 0x212D}, {0x212F, 0x2139}, {0x213C, 0x213F}, {0x2145, 0x2149},
    {0x214E, 0x214E}, {0x2150, 0x2189}, {0x2460, 0x249B}, {0x24EA, 0x24FF},
    {0x2776, 0x2793},
    // Glagolitic, Latin Extended-C, Coptic, Georgian Supplement, Tifinagh
    {0x2C00, 0x2CE4}, {0x2CEB, 0x2CEE}, {0x2CF2, 0x2CF3}, {0x2CFD, 0x2CFD},
    {0x2D00, 0x2D25}, {0x2D27, 0x2D27}, {0x2D2D, 0x2D2D}, {0x2D30, 0x2D67},
    {0x2D6F, 0x2D6F}, {0x2D80, 0x2DDE},
    // CJK symbols with letter or number values, Bopomofo, Hangul Compatibility Jamo
    {0x3005, 0x3007}, {0x3021, 0x3029}, {0x3031, 0x3035}, {0x3038, 0x303C},
    {0x3105, 0x312F}, {0x3131, 0x318E}, {0x3192, 0x3195}, {0x31A0, 0x31BF},
    {0x31F0, 0x31FF}, {0x3220, 0x3229}, {0x3248, 0x324F}, {0x3251, 0x325F},
    {0x3280, 0x3289}, {0x32B1, 0x32BF},
    // Yi, Lisu, Vai, Cyrillic/Latin extensions, Bamum
    {0xA000, 0xA48C}, {0xA4D0, 0xA4FD}, {0xA500, 0xA60C}, {0xA610, 0xA62B},
    {0xA640, 0xA66E}, {0xA67F, 0xA69D}, {0xA6A0, 0xA6EF}, {0xA717, 0xA71F},
    {0xA722, 0xA788}, {0xA78B, 0xA7CA}, {0xA7D0, 0xA7D9}, {0xA7F2, 0xA827},
    // Syloti Nagri through Meetei Mayek, Cherokee Supplement
    {0xA840, 0xA873}, {0xA880, 0xA8C5}, {0xA8D0, 0xA8D9}, {0xA8E0, 0xA8F7},
    {0xA8FB, 0xA8FB}, {0xA8FD, 0xA92D}, {0xA930, 0xA953}, {0xA960, 0xA97C},
    {0xA980, 0xA9C0}, {0xA9CF, 0xA9D9}, {0xA9E0, 0xA9FE}, {0xAA00, 0xAA36},
    {0xAA40, 0xAA4D}, {0xAA50, 0xAA59}, {0xAA60, 0xAA76}, {0xAA7A, 0xAAC2},
    {0xAADB, 0xAADD}, {0xAAE0, 0xAAEF}, {0xAAF2, 0xAAF6}, {0xAB01, 0xAB2E},
    {0xAB30, 0xAB5A}, {0xAB5C, 0xAB69}, {0xAB70, 0xABEA}, {0xABEC, 0xABED},
    {0xABF0, 0xABF9},
    // Hangul Jamo Extended-B
    {0xD7B0, 0xD7C6}, {0xD7CB, 0xD7FB},
    // Alphabetic presentation forms, Arabic presentation forms
    {0xFB00, 0xFB06}, {0xFB13, 0xFB17}, {0xFB1D, 0xFB28}, {0xFB2A, 0xFBB1},
    {0xFBD3, 0xFD3D}, {0xFD50, 0xFDC7}, {0xFDF0, 0xFDFB}, {0xFE70, 0xFEFC},
    // Fullwidth digits and Latin, halfwidth Katakana and Hangul
    {0xFF10, 0xFF19}, {0xFF21, 0xFF3A}, {0xFF41, 0xFF5A}, {0xFF66, 0xFFBE},
    {0xFFC2, 0xFFC7}, {0xFFCA, 0xFFCF}, {0xFFD2, 0xFFD7}, {0xFFDA, 0xFFDC},
    // Deseret, Shavian, Osmanya
    {0x10400, 0x1049D}, {0x104A0, 0x104A9},
    // Mathematical alphanumerics
    {0x1D400, 0x1D6C0}, {0x1D6C2, 0x1D6DA}, {0x1D6DC, 0x1D6FA}, {0x1D6FC, 0x1D714},
    {0x1D716, 0x1D734}, {0x1D736, 0x1D74E}, {0x1D750, 0x1D76E}, {0x1D770, 0x1D788},
    {0x1D78A, 0x1D7A8}, {0x1D7AA, 0x1D7C2}, {0x1D7C4, 0x1D7CB}, {0x1D7CE, 0x1D7FF},
    // CJK Unified Ideographs Extensions B through H, Compatibility Supplement
    {0x20000, 0x2A6DF}, {0x2A700, 0x2EBE0}, {0x2F800, 0x2FA1D}, {0x30000, 0x323AF},
});

} // namespace

std::u32string decode(std::string_view s) {
    std::u32string out;
    out.reserve(s.size());
    size_t pos = 0;
    while (pos < s.size()) {
        char32_t cp;
        pos += decode_one(s, pos, cp);
        out.push_back(cp);
    }
    return out;
}

void append(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

std::string encode(std::u32string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char32_t cp : s) append(out, cp);
    return out;
}

Tail last(std::string_view s) {
    if (s.empty()) return {};

    // Walk back over at most three continuation bytes to the lead byte.
    size_t start = s.size() - 1;
    size_t steps = 0;
    while (start > 0 && steps < 3 && is_continuation(static_cast<unsigned char>(s[start]))) {
        --start;
        ++steps;
    }

    char32_t cp;
    size_t len = decode_one(s, start, cp);
    if (start + len != s.size()) {
        // Trailing bytes did not form a whole sequence.
        return {REPLACEMENT, 1};
    }
    return {cp, len};
}

char32_t first(std::string_view s) {
    if (s.empty()) return 0;
    char32_t cp;
    decode_one(s, 0, cp);
    return cp;
}

bool is_whitespace(char32_t cp) {
    switch (cp) {
        case U' ': case U'\t': case U'\n': case U'\v': case U'\f': case U'\r':
        case 0x1C: case 0x1D: case 0x1E: case 0x1F:
        case 0x85: case 0xA0: case 0x1680:
        case 0x2028: case 0x2029: case 0x202F: case 0x205F: case 0x3000:
            return true;
        default:
            return cp >= 0x2000 && cp <= 0x200A;
    }
}

bool is_cjk(char32_t cp) {
    return (cp >= 0x4E00 && cp <= 0x9FFF)    // CJK Unified Ideographs
        || (cp >= 0x3400 && cp <= 0x4DBF)    // Extension A
        || (cp >= 0xF900 && cp <= 0xFAFF)    // Compatibility Ideographs
        || (cp >= 0x3040 && cp <= 0x30FF)    // Hiragana, Katakana
        || (cp >= 0xAC00 && cp <= 0xD7AF);   // Hangul Syllables
}

bool is_ascii_alnum(char32_t cp) {
    return (cp >= U'0' && cp <= U'9') || (cp >= U'a' && cp <= U'z') || (cp >= U'A' && cp <= U'Z');
}

bool is_alnum(char32_t cp) {
    if (cp < 0x80) return is_ascii_alnum(cp);
    if (is_cjk(cp)) return true;
    auto it = std::upper_bound(ALNUM_RANGES.begin(), ALNUM_RANGES.end(), cp,
                               [](char32_t c, const Range& r) { return c < r.lo; });
    return it != ALNUM_RANGES.begin() && cp <= std::prev(it)->hi;
}

size_t mixed_script_word_count(std::string_view text) {
    size_t count = 0;
    bool in_token = false;
    bool token_has_alnum = false;

    auto close_token = [&] {
        if (in_token && token_has_alnum) ++count;
        in_token = false;
        token_has_alnum = false;
    };

    for (char32_t cp : decode(text)) {
        if (is_cjk(cp)) {
            // A CJK character both counts itself and separates the text around it.
            close_token();
            ++count;
        } else if (is_whitespace(cp)) {
            close_token();
        } else {
            in_token = true;
            if (is_alnum(cp)) token_has_alnum = true;
        }
    }
    close_token();
    return count;
}

} // namespace utf8
