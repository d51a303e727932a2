#include "dispatcher.hpp"
#include "error.hpp"
#include "route.hpp"
#include "test_routes.hpp"
#include "modules/testing.hpp"
#include <boost/test/unit_test.hpp>
#include <atomic>
#include <thread>

using namespace switchyard;
using namespace switchyard::test;

namespace
{
struct DispatcherFixture
{
	DispatcherFixture()
	{
		modules::register_testing(*registry);
		registry->add("Greeter", "hello", [](const Call& call)
		{
			auto name = call.params.get("name");
			auto greeting = call.args().get("greeting");
			return std::string{ greeting ? *greeting : "hello" } + ", "
				+ std::string{ name ? *name : "nobody" };
		});
		dispatcher.publish(shared_table(
			"GET /                     Testing.index\n"
			"GET /echo/{id}            Testing.echo(mode:'x')\n"
			"GET /hello/{name}         Greeter.hello\n"
			"GET /hi/{name}            Greeter.hello(greeting:'hi')\n"
			"GET /nobody/{id}          Nobody.home\n"));
	}

	auto output(string_view method, string_view path)
	{
		auto outcome = dispatcher.dispatch(method, path, lg);
		auto handled = std::get_if<Handled>(&outcome);
		return handled ? handled->output : std::string{ "<unhandled>" };
	}

	const std::shared_ptr<ActionRegistry> registry = std::make_shared<ActionRegistry>();
	Dispatcher dispatcher{ registry };
	ComponentLogger lg{ "test" };
};

auto noop(const Call&)
{
	return std::string{};
}
}

BOOST_AUTO_TEST_SUITE(registry_tests)

BOOST_AUTO_TEST_CASE(add_find)
{
	ActionRegistry registry;
	registry.add("A", "a", noop);
	registry.add("A", "b", noop);
	registry.add("A.B", "a", noop);
	BOOST_TEST(registry.size() == 3u);

	BOOST_TEST(registry.find(Action{ "A", "a", {} }));
	BOOST_TEST(registry.find(Action{ "A.B", "a", { { "k", "v" } } }));
	BOOST_TEST(!registry.find(Action{ "A", "c", {} }));
	BOOST_TEST(!registry.find(Action{ "a", "a", {} }));
}

BOOST_AUTO_TEST_CASE(duplicate)
{
	ActionRegistry registry;
	registry.add("A", "a", noop);
	BOOST_CHECK_THROW(registry.add("A", "a", noop), Error);
	BOOST_TEST(registry.size() == 1u);
}

BOOST_AUTO_TEST_CASE(empty_handler)
{
	ActionRegistry registry;
	BOOST_CHECK_THROW(registry.add("A", "a", nullptr), Error);
	BOOST_TEST(registry.size() == 0u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(dispatcher_tests, DispatcherFixture)

BOOST_AUTO_TEST_CASE(handled)
{
	auto outcome = dispatcher.dispatch("GET", "/", lg);
	auto handled = std::get_if<Handled>(&outcome);
	BOOST_TEST_REQUIRE(handled);
	BOOST_TEST(handled->action == "Testing.index");
	BOOST_TEST(handled->output == "It works!");
}

BOOST_AUTO_TEST_CASE(call_carries_params_and_args)
{
	BOOST_TEST(output("GET", "/hello/bob") == "hello, bob");
	BOOST_TEST(output("GET", "/hi/J%20R") == "hi, J R");
	BOOST_TEST(output("GET", "/echo/42") == "Testing.echo(mode:'x') params={id: '42'}");
}

BOOST_AUTO_TEST_CASE(not_found)
{
	auto outcome = dispatcher.dispatch("POST", "/", lg);
	auto nf = std::get_if<NotFound>(&outcome);
	BOOST_TEST_REQUIRE(nf);
	BOOST_TEST(nf->method == "POST");
	BOOST_TEST(nf->path == "/");
}

BOOST_AUTO_TEST_CASE(unbound)
{
	auto outcome = dispatcher.dispatch("GET", "/nobody/7", lg);
	auto u = std::get_if<Unbound>(&outcome);
	BOOST_TEST_REQUIRE(u);
	BOOST_TEST(u->action == "Nobody.home");
	BOOST_TEST(*u->params.get("id") == "7");
}

BOOST_AUTO_TEST_CASE(no_table)
{
	Dispatcher empty{ registry };
	BOOST_TEST(!empty.table());
	BOOST_CHECK_THROW(empty.dispatch("GET", "/", lg), Error);
}

BOOST_AUTO_TEST_CASE(swap_keeps_snapshot)
{
	auto old_table = dispatcher.table();
	dispatcher.publish(shared_table("GET / Greeter.hello(greeting:'new')"));

	BOOST_TEST(output("GET", "/") == "new, nobody");
	BOOST_TEST(output("GET", "/hello/bob") == "<unhandled>");
	BOOST_TEST(old_table->size() == 5u);
	BOOST_TEST(winner(*old_table, "GET", "/hello/bob") == "Greeter.hello");
}

BOOST_AUTO_TEST_CASE(concurrent_swap)
{
	auto a = shared_table("GET /x Greeter.hello(greeting:'a')");
	auto b = shared_table("GET /x Greeter.hello(greeting:'b')");
	dispatcher.publish(a);

	std::atomic<bool> done{ false };
	std::atomic<int> bad{ 0 };
	std::thread reader{ [&]
	{
		ComponentLogger reader_lg{ "reader" };
		while (!done) {
			auto outcome = dispatcher.dispatch("GET", "/x", reader_lg);
			auto handled = std::get_if<Handled>(&outcome);
			if (!handled || (handled->output != "a, nobody" && handled->output != "b, nobody"))
				++bad;
		}
	} };

	for (int i = 0; i < 1000; ++i)
		dispatcher.publish(i % 2 ? a : b);
	done = true;
	reader.join();

	BOOST_TEST(bad.load() == 0);
}

BOOST_AUTO_TEST_SUITE_END()
