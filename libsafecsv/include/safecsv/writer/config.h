#pragma once
#include <cstddef>
#include <string_view>

namespace safecsv::writer {

    enum class LineTerminator {
        lf,   // "\n"
        crlf, // "\r\n"
    };

    inline constexpr std::string_view terminator_bytes(LineTerminator t) noexcept {
        return t == LineTerminator::crlf ? std::string_view{ "\r\n" } : std::string_view{ "\n" };
    }

    // Set before the first write; later changes are unsupported.
    struct WriterConfig {
        char32_t delimiter{ U',' };
        LineTerminator terminator{ LineTerminator::lf };
        std::size_t buffer_size{ 4096 };
    };

    // Accepts one UTF-8 code point, or one of: "\t", "tab", "comma",
    // "semicolon", "pipe". Validity as a delimiter is checked at write time.
    bool parse_delimiter(std::string_view s, char32_t& out) noexcept;

} // namespace safecsv::writer
