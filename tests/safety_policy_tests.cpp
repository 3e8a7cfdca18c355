#include <boost/test/unit_test.hpp>  // not the included runner
#include <safecsv/policy/safety_policy.h>

using namespace safecsv::policy;

BOOST_AUTO_TEST_SUITE(safety_policy_suite)

BOOST_AUTO_TEST_CASE(default_is_all_off) {
    const SafetyPolicy p{};
    BOOST_TEST(!p.force_quoting);
    BOOST_TEST(!p.escape_leading_equals);
    BOOST_TEST(!p.escape_leading_line_feed);
    BOOST_TEST((p == no_safety()));
}

BOOST_AUTO_TEST_CASE(full_safety_preset) {
    const auto p = full_safety();
    BOOST_TEST(p.force_quoting);
    BOOST_TEST(p.escape_leading_equals);
    BOOST_TEST(p.escape_leading_plus);
    BOOST_TEST(p.escape_leading_minus);
    BOOST_TEST(p.escape_leading_at);
    BOOST_TEST(p.escape_leading_tab);
    BOOST_TEST(p.escape_leading_line_feed);
}

BOOST_AUTO_TEST_CASE(escape_all_preset) {
    const auto p = escape_all_characters();
    BOOST_TEST(!p.force_quoting);
    BOOST_TEST(p.escape_leading_equals);
    BOOST_TEST(p.escape_leading_plus);
    BOOST_TEST(p.escape_leading_minus);
    BOOST_TEST(p.escape_leading_at);
    BOOST_TEST(p.escape_leading_tab);
    BOOST_TEST(p.escape_leading_line_feed);
    BOOST_TEST((p != full_safety()));
}

BOOST_AUTO_TEST_CASE(parse_presets) {
    SafetyPolicy p{};
    BOOST_TEST(parse_policy("full", p));
    BOOST_TEST((p == full_safety()));
    BOOST_TEST(parse_policy(" escape-all ", p));
    BOOST_TEST((p == escape_all_characters()));
    BOOST_TEST(parse_policy("none", p));
    BOOST_TEST((p == no_safety()));
}

BOOST_AUTO_TEST_CASE(parse_switch_list) {
    SafetyPolicy p{};
    BOOST_TEST(parse_policy("equals, at,line-feed", p));
    BOOST_TEST(p.escape_leading_equals);
    BOOST_TEST(p.escape_leading_at);
    BOOST_TEST(p.escape_leading_line_feed);
    BOOST_TEST(!p.force_quoting);
    BOOST_TEST(!p.escape_leading_plus);
    BOOST_TEST(to_string(p) == "equals,at,line-feed");
}

BOOST_AUTO_TEST_CASE(parse_rejects_unknown_and_leaves_out_untouched) {
    SafetyPolicy p = full_safety();
    BOOST_TEST(!parse_policy("equals,cr", p));
    BOOST_TEST(!parse_policy("", p));
    BOOST_TEST(!parse_policy("equals,", p));
    BOOST_TEST(!parse_policy(",,", p));
    BOOST_TEST((p == full_safety()));
}

BOOST_AUTO_TEST_CASE(to_string_canonical) {
    BOOST_TEST(to_string(no_safety()) == "none");
    BOOST_TEST(to_string(full_safety()) == "force-quotes,equals,plus,minus,at,tab,line-feed");

    SafetyPolicy back{};
    BOOST_TEST(parse_policy(to_string(escape_all_characters()), back));
    BOOST_TEST((back == escape_all_characters()));
}

BOOST_AUTO_TEST_SUITE_END()
