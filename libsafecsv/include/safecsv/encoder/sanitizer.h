#pragma once
#include <string>
#include <string_view>
#include <safecsv/policy/safety_policy.h>

namespace safecsv::encoder {

    // True if FIELD's first byte is guarded by an enabled switch. Checked in
    // priority order '=', '+', '-', '@', '\t', '\n'; at most one applies.
    bool needs_sanitizing(std::string_view field, const policy::SafetyPolicy& p) noexcept;

    // Returns FIELD unchanged, or a view of SCRATCH holding " " + FIELD.
    // The result is valid until SCRATCH is next modified.
    std::string_view sanitize_field(std::string_view field, const policy::SafetyPolicy& p,
        std::string& scratch);

} // namespace safecsv::encoder
