#include <safecsv/encoder/quoting.h>
#include <safecsv/encoding/utf8.h>

#include <string>

namespace safecsv::encoder {

    bool field_needs_quotes(std::string_view field, char32_t delimiter,
        const policy::SafetyPolicy& p) {
        if (field.empty()) return false;
        if (field == "\\.") return true;
        if (p.force_quoting) return true;

        if (delimiter < 0x80u) {
            const char d = static_cast<char>(delimiter);
            for (char c : field) {
                if (c == '\n' || c == '\r' || c == '"' || c == d) return true;
            }
        }
        else {
            if (field.find_first_of("\"\r\n") != std::string_view::npos) return true;
            std::string d;
            encoding::append_utf8(d, delimiter);
            if (field.find(d) != std::string_view::npos) return true;
        }

        return encoding::is_space(encoding::decode_first(field).cp);
    }

} // namespace safecsv::encoder
