#include "config_parser.hpp"
#include "source.hpp"
#include "test_config.hpp"
#include <boost/test/unit_test.hpp>
#include <boost/test/data/test_case.hpp>
#include <initializer_list>
#include <memory>
#include <utility>

using namespace switchyard;
using namespace switchyard::config::test;
using config::Table;
using boost::unit_test::data::make;

struct BadSample
{
	string_view text;
	std::size_t line;
	std::size_t column;
	std::string error_msg;
};

using SampleList = std::initializer_list<std::pair<string_view, Table>>;
using BadSampleList = std::initializer_list<BadSample>;

namespace switchyard
{
namespace config
{
static std::ostream &operator<<(std::ostream &stream, SampleList::const_reference sample)
{
	return stream << "TEXT{\"" << sample.first << "\"} -> " << sample.second;
}
}
}

static std::ostream &operator<<(std::ostream &stream, BadSampleList::const_reference sample)
{
	return stream << "TEXT{\"" << sample.text << "\"} -> error at "
		<< sample.line << ':' << sample.column << ": " << sample.error_msg;
}

namespace
{
auto source(string_view text)
{
	return std::make_shared<const Source>(std::string{ text });
}

const SampleList basic_samples = {
	{ "", tbl() },
	{ " \t\n\t ", tbl() },
	{ "# just a comment", tbl() },
	{ "# one\n  # two\n", tbl() },
	{ "  k  =  true  ", tbl() << prop("k", true) },
	{ "\tk\t=\ttrue\t", tbl() << prop("k", true) },
	{ "\nk\n=\ntrue\n", tbl() << prop("k", true) },
	{ "k=1", tbl() << prop("k", 1) },
	{ "k = v # trailing comment", tbl() << prop("k", "v") },
	{ "# header\nk = 1 # one\n# middle\nj = 2\n", tbl() << prop("k", 1) << prop("j", 2) },
};

const BadSampleList bad_samples = {
	{ "abc",          1, 4,  "expecting '='" },
	{ "a b",          1, 3,  "expecting '='" },
	{ "a 0",          1, 3,  "expecting '='" },
	{ "a =",          1, 4,  "expecting value" },
	{ "a = # nothing", 1, 4,  "expecting value" },
	{ "a = b c",      1, 8,  "expecting '='" },
	{ "a = 1\nb",     2, 2,  "expecting '='" },
	{ "= 1",          1, 1,  "can't parse" },
	{ "a = 1\n= 2",   2, 1,  "can't parse" },
};

const SampleList key_samples = {
	{ "snake_key_name = 1", tbl() << prop("snake_key_name", 1) },
	{ "CamelNameKey = 1", tbl() << prop("CamelNameKey", 1) },
	{ "key.dot.x = 1", tbl() << prop("key.dot.x", 1) },
	{ "key-dash = 1", tbl() << prop("key-dash", 1) },
	{ "key0123 = 1", tbl() << prop("key0123", 1) },
	{ "trueKey = 1", tbl() << prop("trueKey", 1) },
};

const SampleList bool_samples = {
	{ "key = true", tbl() << prop("key", true) },
	{ "key = false", tbl() << prop("key", false) },
	{ "key = true ", tbl() << prop("key", true) },
	{ "key = true # comment", tbl() << prop("key", true) },
};

const SampleList int_samples = {
	{ "key = 0", tbl() << prop("key", 0) },
	{ "key = -2147483647", tbl() << prop("key", -2147483647) },
	{ "key = +2147483647", tbl() << prop("key", +2147483647) },
	{ "key = 8080", tbl() << prop("key", 8080) },
	{ "key = 8080 # port", tbl() << prop("key", 8080) },
};

const SampleList string_samples = {
	{ "key = value", tbl() << prop("key", "value") },
	{ "key = truestring", tbl() << prop("key", "truestring") },
	{ "key = True", tbl() << prop("key", "True") },
	{ "key = 3.14", tbl() << prop("key", "3.14") },
	{ "key = 80abc", tbl() << prop("key", "80abc") },
	{ "key = 2147483648", tbl() << prop("key", "2147483648") },
	{ "key = conf/routes.conf", tbl() << prop("key", "conf/routes.conf") },
	{ R"(key = a/\._-z)", tbl() << prop("key", R"(a/\._-z)") },
	{ "key = 'value'", tbl() << prop("key", "value") },
	{ "key = ''", tbl() << prop("key", "") },
	{ "key = ' x '", tbl() << prop("key", " x ") },
	{ "key = 'a # b'", tbl() << prop("key", "a # b") },
	{ "key = 'true'", tbl() << prop("key", "true") },
	{ "key = '1'", tbl() << prop("key", "1") },
};

const SampleList config_samples = {
	{
		"routes = conf/routes.conf prefix = /app lint.shadowed = false",
		tbl()
			<< prop("routes", "conf/routes.conf")
			<< prop("prefix", "/app")
			<< prop("lint.shadowed", false)
	},
	{
		R"(
		# switchyard
		routes = routes.conf

		log.messages = console   # or a file
		log.level    = debug
		log.level    = info
		)",
		tbl()
			<< prop("routes", "routes.conf")
			<< prop("log.messages", "console")
			<< prop("log.level", "debug")
			<< prop("log.level", "info")
	},
};

void test(SampleList::const_reference sample)
{
	BOOST_TEST(config::parse(source(sample.first)) == sample.second,
		boost::test_tools::per_element());
}

void error(BadSampleList::const_reference sample)
{
	BOOST_CHECK_EXCEPTION(config::parse(source(sample.text)), config::SyntaxError,
		[&sample](const config::SyntaxError &exc)
		{
			BOOST_TEST_INFO("exception position " << exc.line() << ':' << exc.column());
			BOOST_TEST_INFO("exception: " << exc.what());
			auto msg = std::string{ exc.what() };
			return exc.line() == sample.line
				&& exc.column() == sample.column
				&& msg.find(sample.error_msg) != std::string::npos;
		});
}
}

BOOST_AUTO_TEST_SUITE(config_parser_tests)

BOOST_DATA_TEST_CASE(test_basic, make(basic_samples))
{
	test(sample);
}

BOOST_DATA_TEST_CASE(test_basic_bad, make(bad_samples))
{
	error(sample);
}

BOOST_DATA_TEST_CASE(test_key, make(key_samples))
{
	test(sample);
}

BOOST_DATA_TEST_CASE(test_bool, make(bool_samples))
{
	test(sample);
}

BOOST_DATA_TEST_CASE(test_int, make(int_samples))
{
	test(sample);
}

BOOST_DATA_TEST_CASE(test_string, make(string_samples))
{
	test(sample);
}

BOOST_DATA_TEST_CASE(test_config, make(config_samples))
{
	test(sample);
}

BOOST_AUTO_TEST_CASE(test_key_location)
{
	auto t = config::parse(std::make_shared<const Source>("a = 1\nb = 2\n", "test.ini"));
	static_cast<void>(t["a"]);
	BOOST_CHECK_EXCEPTION(t.throw_on_unknown_key(), config::BadKey,
		[](const config::BadKey& exc)
		{
			auto msg = std::string{ exc.what() };
			return exc.key() == "b"
				&& msg.find("test.ini") != std::string::npos
				&& msg.find("line 2") != std::string::npos;
		});
}

BOOST_AUTO_TEST_CASE(test_source_outlives_text)
{
	auto t = config::parse(source("k = v"));
	BOOST_TEST(t["k"].as<config::String>() == "v");
	BOOST_CHECK_THROW(t["k"].as<config::Integer>(), config::BadValue);
}

BOOST_AUTO_TEST_SUITE_END()
