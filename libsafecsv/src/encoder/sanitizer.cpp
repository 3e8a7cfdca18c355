#include <safecsv/encoder/sanitizer.h>

namespace safecsv::encoder {

    bool needs_sanitizing(std::string_view field, const policy::SafetyPolicy& p) noexcept {
        if (field.empty()) return false;
        switch (field.front()) {
        case '=':  return p.escape_leading_equals;
        case '+':  return p.escape_leading_plus;
        case '-':  return p.escape_leading_minus;
        case '@':  return p.escape_leading_at;
        case '\t': return p.escape_leading_tab;
        case '\n': return p.escape_leading_line_feed;
        default:   return false;
        }
    }

    std::string_view sanitize_field(std::string_view field, const policy::SafetyPolicy& p,
        std::string& scratch) {
        if (!needs_sanitizing(field, p)) return field;
        scratch.clear();
        scratch.reserve(field.size() + 1);
        scratch.push_back(' ');
        scratch.append(field);
        return scratch;
    }

} // namespace safecsv::encoder
