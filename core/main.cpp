#include "cmdline_parser.hpp"
#include "console.hpp"
#include "dispatcher.hpp"
#include "parameters.hpp"
#include "logs.hpp"
#include "modules/testing.hpp"
#include <iostream>
#include <exception>
#include <memory>

namespace
{
struct RequestToQuit : std::exception {};

constexpr auto exit_not_found = 2;

auto make_parameters(int argc, char *argv[])
{
	const auto parser = switchyard::CommandLineParser{};
	const auto cmdline = parser.parse(argc, argv);
	if (cmdline.has("help")) {
		parser.print_options(std::cerr);
		throw RequestToQuit{};
	}
	if (cmdline.has("version")) {
		std::cerr << "Switchyard 0.01\n";
		throw RequestToQuit{};
	}

	return cmdline.to_parameters();
}

auto make_registry()
{
	auto registry = std::make_shared<switchyard::ActionRegistry>();
	switchyard::modules::register_testing(*registry);
	return registry;
}
}

int main(int argc, char *argv[])
{
	using namespace switchyard;

	try {
		auto params = make_parameters(argc, argv);
		auto request = params.request;
		auto check = params.check;

		logs::preinit();
		Console console{ std::move(params), make_registry() };
		if (check) {
			console.check(std::cout);
		} else if (!request.empty()) {
			if (!console.resolve(request[0], request[1], std::cout))
				return exit_not_found;
		} else {
			console.run(std::cin, std::cout);
		}
	} catch(RequestToQuit&) {
		// nothing to do
	} catch(std::exception &error) {
		std::cerr << argv[0] << ": " << error.what() << std::endl;
		return 1;
	}
}
