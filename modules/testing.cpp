#include "testing.hpp"
#include "dispatcher.hpp"
#include "logger.hpp"
#include "route.hpp"
#include <sstream>

namespace switchyard
{
namespace
{
auto it_works(const Call&) -> std::string
{
	return "It works!";
}

auto echo_call(const Call& call) -> std::string
{
	std::ostringstream s;
	s << call.route.action() << " params=" << call.params;
	call.lg.trace("echo ", call.route.pattern().str());
	return s.str();
}
}

void modules::register_testing(ActionRegistry& registry)
{
	registry.add("Testing", "index", it_works);
	registry.add("Testing", "echo", echo_call);
}
}
