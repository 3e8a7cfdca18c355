#pragma once
#include <string>
#include <string_view>

namespace safecsv::policy {

    // Independent switches; each one gates a single protective behavior.
    // The escape_leading_* switches prefix a space to a field whose first
    // byte is the named character.
    struct SafetyPolicy {
        bool force_quoting{ false };
        bool escape_leading_equals{ false };
        bool escape_leading_plus{ false };
        bool escape_leading_minus{ false };
        bool escape_leading_at{ false };
        bool escape_leading_tab{ false };
        bool escape_leading_line_feed{ false };

        bool operator==(const SafetyPolicy&) const = default;
    };

    // Every switch on.
    inline constexpr SafetyPolicy full_safety() noexcept {
        return { true, true, true, true, true, true, true };
    }

    // Every escape switch on, quoting left to the structural rules.
    inline constexpr SafetyPolicy escape_all_characters() noexcept {
        return { false, true, true, true, true, true, true };
    }

    // Plain RFC-4180 writer behavior.
    inline constexpr SafetyPolicy no_safety() noexcept {
        return {};
    }

    // Parse "full", "escape-all", "none", or a comma-separated list of
    // switch names: force-quotes, equals, plus, minus, at, tab, line-feed.
    // Returns false (OUT untouched) on an unknown or empty name.
    bool parse_policy(std::string_view s, SafetyPolicy& out);

    // Canonical comma-separated switch list; "none" when nothing is set.
    std::string to_string(const SafetyPolicy& p);

} // namespace safecsv::policy
