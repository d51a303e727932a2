#include "test_routes.hpp"
#include "route.hpp"
#include <boost/test/unit_test.hpp>

using namespace switchyard;
using namespace switchyard::test;

namespace
{
struct ReverseFixture
{
	const RouteTable table = load_text(
		"GET  /page/{id}                      Pages.show\n"
		"GET  /home                           Pages.show(id:'home')\n"
		"POST /customer/{<[0-9]+>customerid}  Customers.create\n"
		"GET  /search                         Search.run\n"
		"GET  /c/{<[0-9]+>cid}/item/{id}      Items.show\n"
		"GET  /about                          Pages.fixed(page:'about')\n",
		"/app");

	auto url(string_view action, const Params& args = {}) const
	{
		auto r = reverse(table, action, args);
		return r ? r->url : std::string{ "<none>" };
	}
};
}

BOOST_FIXTURE_TEST_SUITE(reverse_tests, ReverseFixture)

BOOST_AUTO_TEST_CASE(path_params)
{
	auto r = reverse(table, "Customers.create", { { "customerid", "7" } });
	BOOST_TEST_REQUIRE(r.has_value());
	BOOST_TEST(r->method == Method::post);
	BOOST_TEST(r->url == "/app/customer/7");
}

BOOST_AUTO_TEST_CASE(first_buildable_route_wins)
{
	BOOST_TEST(url("Pages.show", { { "id", "42" } }) == "/app/page/42");
	BOOST_TEST(url("Pages.show", { { "id", "home" } }) == "/app/page/home");
	BOOST_TEST(url("Pages.show") == "/app/home");
}

BOOST_AUTO_TEST_CASE(constraints)
{
	BOOST_TEST(url("Customers.create", { { "customerid", "abc" } }) == "<none>");
	BOOST_TEST(url("Customers.create") == "<none>");
}

BOOST_AUTO_TEST_CASE(query_string)
{
	BOOST_TEST(url("Search.run", { { "q", "a b" }, { "page", "2" } }) == "/app/search?q=a%20b&page=2");
	BOOST_TEST(url("Items.show", { { "id", "x/y" }, { "extra", "1" }, { "cid", "3" } })
		== "/app/c/3/item/x%2Fy?extra=1");
}

BOOST_AUTO_TEST_CASE(static_arguments)
{
	BOOST_TEST(url("Pages.fixed") == "/app/about");
	BOOST_TEST(url("Pages.fixed", { { "page", "about" } }) == "/app/about");
	BOOST_TEST(url("Pages.fixed", { { "page", "other" } }) == "<none>");
}

BOOST_AUTO_TEST_CASE(unknown_action)
{
	BOOST_TEST(url("Nope.show") == "<none>");
	BOOST_TEST(url("Pages") == "<none>");
	BOOST_TEST(url("") == "<none>");
}

BOOST_AUTO_TEST_CASE(round_trip)
{
	const Params args = { { "cid", "12" }, { "id", "caf\xC3\xA9 au lait" } };
	auto r = reverse(table, "Items.show", args);
	BOOST_TEST_REQUIRE(r.has_value());

	auto result = match(table, to_string(r->method), r->url);
	auto m = std::get_if<Match>(&result);
	BOOST_TEST_REQUIRE(m);
	BOOST_TEST(m->route->action().reference() == "Items.show");
	BOOST_TEST((m->params == args));
}

BOOST_AUTO_TEST_SUITE_END()
