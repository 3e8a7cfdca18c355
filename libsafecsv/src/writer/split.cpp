#include <safecsv/writer/split.h>

namespace safecsv::writer {

    Record split_fields(std::string_view line, char sep) {
        Record out;
        std::size_t pos = 0;
        while (true) {
            const std::size_t i = line.find(sep, pos);
            if (i == std::string_view::npos) {
                out.emplace_back(line.substr(pos));
                break;
            }
            out.emplace_back(line.substr(pos, i - pos));
            pos = i + 1;
        }
        return out;
    }

    bool parse_input_separator(std::string_view s, char& out) noexcept {
        if (s == "\\t" || s == "tab") { out = '\t'; return true; }
        if (s.size() != 1) return false;
        out = s.front();
        return true;
    }

} // namespace safecsv::writer
