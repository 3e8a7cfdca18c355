#include <safecsv/encoder/quoted_field.h>

namespace safecsv::encoder {

    std::error_code write_quoted_field(io::BufferedSink& out, std::string_view field,
        writer::LineTerminator term) {
        const bool crlf = term == writer::LineTerminator::crlf;

        if (auto ec = out.write_byte('"'); ec) return ec;
        while (!field.empty()) {
            std::size_t i = field.find_first_of("\"\r\n");
            if (i == std::string_view::npos) i = field.size();

            // Everything before the special character goes out verbatim.
            if (auto ec = out.write(field.substr(0, i)); ec) return ec;
            field.remove_prefix(i);
            if (field.empty()) break;

            std::error_code ec;
            switch (field.front()) {
            case '"':
                ec = out.write("\"\"");
                break;
            case '\r':
                if (!crlf) ec = out.write_byte('\r');
                break;
            case '\n':
                ec = crlf ? out.write("\r\n") : out.write_byte('\n');
                break;
            }
            field.remove_prefix(1);
            if (ec) return ec;
        }
        return out.write_byte('"');
    }

} // namespace safecsv::encoder
