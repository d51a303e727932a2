#include "uri.hpp"
#include <boost/test/unit_test.hpp>
#include <string>
#include <vector>

using namespace switchyard;

namespace
{
auto split(string_view path)
{
	auto segments = split_path(path);
	return std::vector<std::string>(segments.begin(), segments.end());
}
}

BOOST_AUTO_TEST_SUITE(uri_tests)

BOOST_AUTO_TEST_CASE(split_segments)
{
	using V = std::vector<std::string>;
	BOOST_TEST(split("/") == V{ "" }, boost::test_tools::per_element());
	BOOST_TEST(split("/a") == V{ "a" }, boost::test_tools::per_element());
	BOOST_TEST(split("/a/b") == (V{ "a", "b" }), boost::test_tools::per_element());
	BOOST_TEST(split("/a/b/") == (V{ "a", "b", "" }), boost::test_tools::per_element());
	BOOST_TEST(split("/a//b") == (V{ "a", "", "b" }), boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(decode)
{
	BOOST_TEST(percent_decode("") == "");
	BOOST_TEST(percent_decode("plain") == "plain");
	BOOST_TEST(percent_decode("a%20b") == "a b");
	BOOST_TEST(percent_decode("%2F") == "/");
	BOOST_TEST(percent_decode("%2f%41") == "/A");
	BOOST_TEST(percent_decode("caf%C3%A9") == "caf\xC3\xA9");
	BOOST_TEST(percent_decode("a+b") == "a+b");
}

BOOST_AUTO_TEST_CASE(decode_malformed)
{
	BOOST_TEST(percent_decode("%") == "%");
	BOOST_TEST(percent_decode("%4") == "%4");
	BOOST_TEST(percent_decode("%zz") == "%zz");
	BOOST_TEST(percent_decode("100%") == "100%");
	BOOST_TEST(percent_decode("%%41") == "%A");
}

BOOST_AUTO_TEST_CASE(encode)
{
	BOOST_TEST(percent_encode("") == "");
	BOOST_TEST(percent_encode("AZaz09-._~") == "AZaz09-._~");
	BOOST_TEST(percent_encode("a b") == "a%20b");
	BOOST_TEST(percent_encode("a/b") == "a%2Fb");
	BOOST_TEST(percent_encode("caf\xC3\xA9") == "caf%C3%A9");
	BOOST_TEST(percent_decode(percent_encode("?x=1&y=%")) == "?x=1&y=%");
}

BOOST_AUTO_TEST_SUITE_END()
