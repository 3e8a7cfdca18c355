#pragma once

namespace safecsv::encoder {

    // A delimiter is any single valid code point except NUL, '"', CR, LF
    // and U+FFFD.
    bool valid_delimiter(char32_t cp) noexcept;

} // namespace safecsv::encoder
