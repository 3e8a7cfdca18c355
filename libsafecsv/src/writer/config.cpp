#include <safecsv/writer/config.h>
#include <safecsv/encoding/utf8.h>

namespace safecsv::writer {

    bool parse_delimiter(std::string_view s, char32_t& out) noexcept {
        if (s.empty()) return false;
        if (s == "\\t" || s == "tab") { out = U'\t'; return true; }
        if (s == "comma") { out = U','; return true; }
        if (s == "semicolon") { out = U';'; return true; }
        if (s == "pipe") { out = U'|'; return true; }

        const auto r = encoding::decode_first(s);
        if (r.size != s.size()) return false; // more than one code point
        if (r.cp == encoding::k_replacement_char && s != "\xEF\xBF\xBD") return false;
        out = r.cp;
        return true;
    }

} // namespace safecsv::writer
