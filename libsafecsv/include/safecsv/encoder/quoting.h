#pragma once
#include <string_view>
#include <safecsv/policy/safety_policy.h>

namespace safecsv::encoder {

    // Whether an (already sanitized) field must be enclosed in quotes.
    // In order:
    //   - ""              never quoted
    //   - "\."            always quoted (end-of-data marker in COPY streams)
    //   - force_quoting   always quoted
    //   - contains the delimiter, '"', '\r' or '\n'
    //   - first code point is Unicode white space
    bool field_needs_quotes(std::string_view field, char32_t delimiter,
        const policy::SafetyPolicy& p);

} // namespace safecsv::encoder
