#include <safecsv/encoding/utf8.h>

namespace safecsv::encoding {

    static inline unsigned u8(char c) noexcept {
        return static_cast<unsigned char>(c);
    }

    static inline bool is_cont(unsigned b) noexcept {
        return (b & 0xC0u) == 0x80u;
    }

    DecodeResult decode_first(std::string_view s) noexcept {
        if (s.empty()) return { k_replacement_char, 0 };

        const unsigned b0 = u8(s[0]);
        if (b0 < 0x80u) return { static_cast<char32_t>(b0), 1 };

        std::size_t need = 0;
        char32_t cp = 0;
        char32_t min = 0;
        if ((b0 & 0xE0u) == 0xC0u) { need = 1; cp = b0 & 0x1Fu; min = 0x80u; }
        else if ((b0 & 0xF0u) == 0xE0u) { need = 2; cp = b0 & 0x0Fu; min = 0x800u; }
        else if ((b0 & 0xF8u) == 0xF0u) { need = 3; cp = b0 & 0x07u; min = 0x10000u; }
        else return { k_replacement_char, 1 };

        if (s.size() < need + 1) return { k_replacement_char, 1 };
        for (std::size_t i = 1; i <= need; ++i) {
            const unsigned b = u8(s[i]);
            if (!is_cont(b)) return { k_replacement_char, 1 };
            cp = (cp << 6) | (b & 0x3Fu);
        }

        // Reject overlong forms, surrogates and values past U+10FFFF.
        if (cp < min || !is_valid_code_point(cp)) return { k_replacement_char, 1 };
        return { cp, need + 1 };
    }

    bool is_space(char32_t cp) noexcept {
        if (cp <= 0xFFu) {
            switch (cp) {
            case U'\t': case U'\n': case U'\v': case U'\f': case U'\r': case U' ':
            case 0x85u: case 0xA0u:
                return true;
            default:
                return false;
            }
        }
        if (cp >= 0x2000u && cp <= 0x200Au) return true;
        switch (cp) {
        case 0x1680u: case 0x2028u: case 0x2029u: case 0x202Fu: case 0x205Fu: case 0x3000u:
            return true;
        default:
            return false;
        }
    }

    std::size_t encoded_size(char32_t cp) noexcept {
        if (!is_valid_code_point(cp)) cp = k_replacement_char;
        if (cp < 0x80u) return 1;
        if (cp < 0x800u) return 2;
        if (cp < 0x10000u) return 3;
        return 4;
    }

    void append_utf8(std::string& out, char32_t cp) {
        if (!is_valid_code_point(cp)) cp = k_replacement_char;
        if (cp < 0x80u) {
            out.push_back(static_cast<char>(cp));
        }
        else if (cp < 0x800u) {
            out.push_back(static_cast<char>(0xC0u | (cp >> 6)));
            out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
        }
        else if (cp < 0x10000u) {
            out.push_back(static_cast<char>(0xE0u | (cp >> 12)));
            out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
            out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
        }
        else {
            out.push_back(static_cast<char>(0xF0u | (cp >> 18)));
            out.push_back(static_cast<char>(0x80u | ((cp >> 12) & 0x3Fu)));
            out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
            out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
        }
    }

} // namespace safecsv::encoding
