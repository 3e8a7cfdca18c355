#pragma once
#include <string_view>
#include <system_error>
#include <safecsv/io/buffered_sink.h>
#include <safecsv/writer/config.h>

namespace safecsv::encoder {

    // Emit FIELD as "...": '"' doubled, '\n' written as the terminator,
    // '\r' dropped in CRLF mode (the following '\n' supplies it) and kept
    // in LF mode. Stops at the first sink error.
    std::error_code write_quoted_field(io::BufferedSink& out, std::string_view field,
        writer::LineTerminator term);

} // namespace safecsv::encoder
