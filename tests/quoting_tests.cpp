#include <boost/test/unit_test.hpp>  // not the included runner
#include <safecsv/encoder/quoting.h>
#include <string>

using namespace safecsv::encoder;
using namespace safecsv::policy;

BOOST_AUTO_TEST_SUITE(quoting_suite)

BOOST_AUTO_TEST_CASE(empty_never_quoted) {
    BOOST_TEST(!field_needs_quotes("", U',', no_safety()));
    BOOST_TEST(!field_needs_quotes("", U',', full_safety()));
}

BOOST_AUTO_TEST_CASE(end_of_data_marker_always_quoted) {
    BOOST_TEST(field_needs_quotes("\\.", U',', no_safety()));
    BOOST_TEST(field_needs_quotes("\\.", U';', escape_all_characters()));
    BOOST_TEST(!field_needs_quotes("\\.x", U',', no_safety()));
    BOOST_TEST(!field_needs_quotes("\\", U',', no_safety()));
}

BOOST_AUTO_TEST_CASE(force_quoting) {
    SafetyPolicy p{};
    p.force_quoting = true;
    BOOST_TEST(field_needs_quotes("a", U',', p));
    BOOST_TEST(field_needs_quotes("123", U',', p));
}

BOOST_AUTO_TEST_CASE(structural_characters) {
    const auto p = no_safety();
    BOOST_TEST(field_needs_quotes("foo, bar", U',', p));
    BOOST_TEST(field_needs_quotes("say \"hi\"", U',', p));
    BOOST_TEST(field_needs_quotes("a\rb", U',', p));
    BOOST_TEST(field_needs_quotes("a\nb", U',', p));
    BOOST_TEST(!field_needs_quotes("foo, bar", U';', p));
    BOOST_TEST(field_needs_quotes("foo;bar", U';', p));
    BOOST_TEST(field_needs_quotes("a\tb", U'\t', p));
    BOOST_TEST(!field_needs_quotes("a\tb", U',', p));
}

BOOST_AUTO_TEST_CASE(multibyte_delimiter) {
    const auto p = no_safety();
    // U+2502 BOX DRAWINGS LIGHT VERTICAL
    BOOST_TEST(field_needs_quotes("left\xE2\x94\x82right", U'\u2502', p));
    // Shares a lead byte with U+2502 but is a different code point (U+2500).
    BOOST_TEST(!field_needs_quotes("left\xE2\x94\x80right", U'\u2502', p));
    BOOST_TEST(field_needs_quotes("a\"b", U'\u2502', p));
    BOOST_TEST(!field_needs_quotes("a,b", U'\u2502', p));
}

BOOST_AUTO_TEST_CASE(leading_unicode_space) {
    const auto p = no_safety();
    BOOST_TEST(field_needs_quotes(" x", U',', p));
    BOOST_TEST(field_needs_quotes("\tx", U',', p));
    BOOST_TEST(field_needs_quotes("\xC2\xA0x", U',', p));     // U+00A0
    BOOST_TEST(field_needs_quotes("\xE3\x80\x80x", U',', p)); // U+3000
    BOOST_TEST(!field_needs_quotes("x ", U',', p));
    BOOST_TEST(!field_needs_quotes("\xC3\xA9", U',', p));     // e-acute
    BOOST_TEST(!field_needs_quotes("\xC2", U',', p));         // malformed lead byte
}

BOOST_AUTO_TEST_CASE(sanitized_formula_quoted_for_leading_space) {
    // " =A1" starts with an ASCII space, which is white space.
    BOOST_TEST(field_needs_quotes(" =A1", U',', no_safety()));
}

BOOST_AUTO_TEST_CASE(decision_is_stable) {
    const std::string fields[] = { "", "\\.", "a,b", " lead", "plain", "q\"", "\xE3\x80\x80" };
    const SafetyPolicy policies[] = { no_safety(), escape_all_characters(), full_safety() };
    for (const auto& p : policies) {
        for (const auto& f : fields) {
            BOOST_TEST(field_needs_quotes(f, U',', p) == field_needs_quotes(f, U',', p));
        }
    }
}

BOOST_AUTO_TEST_SUITE_END()
