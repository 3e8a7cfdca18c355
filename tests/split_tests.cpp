#include <boost/test/unit_test.hpp>  // not the included runner
#include <safecsv/writer/split.h>
#include <safecsv/io/sink.h>
#include <safecsv/policy/safety_policy.h>
#include <string>

using namespace safecsv;
using namespace safecsv::writer;

BOOST_AUTO_TEST_SUITE(split_suite)

BOOST_AUTO_TEST_CASE(splits_on_separator) {
    const auto r = split_fields("a\tb\tc", '\t');
    BOOST_REQUIRE(r.size() == 3u);
    BOOST_TEST(r[0] == "a");
    BOOST_TEST(r[1] == "b");
    BOOST_TEST(r[2] == "c");
}

BOOST_AUTO_TEST_CASE(keeps_empty_pieces) {
    BOOST_TEST(split_fields("", '\t').size() == 1u);
    BOOST_TEST(split_fields("", '\t')[0].empty());

    const auto r = split_fields("\tx\t", '\t');
    BOOST_REQUIRE(r.size() == 3u);
    BOOST_TEST(r[0].empty());
    BOOST_TEST(r[1] == "x");
    BOOST_TEST(r[2].empty());
}

BOOST_AUTO_TEST_CASE(other_separator_leaves_tabs_in_fields) {
    const auto r = split_fields("a\tb|=c", '|');
    BOOST_REQUIRE(r.size() == 2u);
    BOOST_TEST(r[0] == "a\tb");
    BOOST_TEST(r[1] == "=c");
}

BOOST_AUTO_TEST_CASE(input_separator_parsing) {
    char c = 'x';
    BOOST_TEST(parse_input_separator("\\t", c));
    BOOST_TEST(c == '\t');
    BOOST_TEST(parse_input_separator("tab", c));
    BOOST_TEST(c == '\t');
    BOOST_TEST(parse_input_separator(";", c));
    BOOST_TEST(c == ';');

    c = 'x';
    BOOST_TEST(!parse_input_separator("", c));
    BOOST_TEST(!parse_input_separator(";;", c));
    BOOST_TEST(c == 'x');
}

BOOST_AUTO_TEST_CASE(split_line_encodes_safely) {
    io::StringSink sink;
    SafeWriter w(sink, policy::escape_all_characters());
    BOOST_TEST(!w.write(split_fields("7\t=HYPERLINK(\"http://x\")\t@home", '\t')));
    w.flush();
    BOOST_TEST(sink.str() == "7,\" =HYPERLINK(\"\"http://x\"\")\",\" @home\"\n");
}

BOOST_AUTO_TEST_SUITE_END()
