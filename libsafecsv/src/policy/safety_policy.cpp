#include <safecsv/policy/safety_policy.h>

#include <array>

namespace safecsv::policy {

    namespace {

        struct SwitchName {
            std::string_view name;
            bool SafetyPolicy::* member;
        };

        // Order matches the sanitizer's priority, force-quotes first.
        constexpr std::array<SwitchName, 7> k_switches{ {
            { "force-quotes", &SafetyPolicy::force_quoting },
            { "equals",       &SafetyPolicy::escape_leading_equals },
            { "plus",         &SafetyPolicy::escape_leading_plus },
            { "minus",        &SafetyPolicy::escape_leading_minus },
            { "at",           &SafetyPolicy::escape_leading_at },
            { "tab",          &SafetyPolicy::escape_leading_tab },
            { "line-feed",    &SafetyPolicy::escape_leading_line_feed },
        } };

        std::string_view trim(std::string_view s) noexcept {
            while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
            while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
            return s;
        }

    } // namespace

    bool parse_policy(std::string_view s, SafetyPolicy& out) {
        s = trim(s);
        if (s == "full") { out = full_safety(); return true; }
        if (s == "escape-all") { out = escape_all_characters(); return true; }
        if (s == "none") { out = no_safety(); return true; }
        if (s.empty()) return false;

        SafetyPolicy tmp{};
        std::size_t pos = 0;
        while (pos <= s.size()) {
            const std::size_t comma = s.find(',', pos);
            const std::string_view tok = trim(comma == std::string_view::npos
                ? s.substr(pos) : s.substr(pos, comma - pos));
            if (tok.empty()) return false;

            bool found = false;
            for (const auto& sw : k_switches) {
                if (sw.name == tok) {
                    tmp.*(sw.member) = true;
                    found = true;
                    break;
                }
            }
            if (!found) return false;
            if (comma == std::string_view::npos) break;
            pos = comma + 1;
        }
        out = tmp;
        return true;
    }

    std::string to_string(const SafetyPolicy& p) {
        std::string out;
        for (const auto& sw : k_switches) {
            if (!(p.*(sw.member))) continue;
            if (!out.empty()) out.push_back(',');
            out.append(sw.name);
        }
        return out.empty() ? std::string("none") : out;
    }

} // namespace safecsv::policy
