#pragma once
#include <string_view>
#include <safecsv/writer/safe_writer.h>

namespace safecsv::writer {

    // Split one input line on SEP. Empty pieces are kept, so N separators
    // always give N+1 fields; an empty line gives one empty field.
    Record split_fields(std::string_view line, char sep);

    // Input separator: one byte, or "\t" / "tab". Returns false (OUT untouched)
    // for anything else.
    bool parse_input_separator(std::string_view s, char& out) noexcept;

} // namespace safecsv::writer
