#include <safecsv/encoder/delimiter.h>
#include <safecsv/encoding/utf8.h>

namespace safecsv::encoder {

    bool valid_delimiter(char32_t cp) noexcept {
        return cp != U'\0' && cp != U'"' && cp != U'\r' && cp != U'\n'
            && encoding::is_valid_code_point(cp) && cp != encoding::k_replacement_char;
    }

} // namespace safecsv::encoder
