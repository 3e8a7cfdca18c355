#pragma once
#include <cstddef>
#include <string>
#include <string_view>

namespace safecsv::encoding {

    inline constexpr char32_t k_replacement_char = U'\uFFFD';
    inline constexpr char32_t k_max_code_point = U'\U0010FFFF';

    struct DecodeResult {
        char32_t cp{ k_replacement_char };
        std::size_t size{ 0 }; // bytes consumed; 0 only for empty input
    };

    // Decode the first code point of S. Malformed, overlong or truncated
    // sequences yield {U+FFFD, 1}.
    DecodeResult decode_first(std::string_view s) noexcept;

    // Unicode scalar value: <= U+10FFFF and not a surrogate.
    inline constexpr bool is_valid_code_point(char32_t cp) noexcept {
        return cp <= k_max_code_point && !(cp >= 0xD800u && cp <= 0xDFFFu);
    }

    // Unicode White_Space property.
    bool is_space(char32_t cp) noexcept;

    // Append the UTF-8 encoding of CP. Invalid code points append U+FFFD.
    void append_utf8(std::string& out, char32_t cp);

    // Number of bytes append_utf8 would write for CP.
    std::size_t encoded_size(char32_t cp) noexcept;

} // namespace safecsv::encoding
