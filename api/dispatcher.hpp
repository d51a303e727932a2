#pragma once
#include "params.hpp"
#include "router.hpp"
#include "string_view.hpp"
#include <boost/core/noncopyable.hpp>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <variant>

namespace switchyard
{
class Logger;
class Route;
class RouteTable;
struct Action;

struct Call
{
	const Route& route;
	const Params& params;
	Logger& lg;

	auto args() const noexcept -> const Params&;
};

class ActionRegistry: boost::noncopyable
{
public:
	using Handler = std::function<std::string(const Call&)>;

	ActionRegistry() = default;

	// throws Error if already registered
	auto add(string_view target, string_view method, Handler handler) -> void;
	auto find(const Action& action) const -> const Handler*;
	auto size() const noexcept -> std::size_t { return handlers.size(); }

private:
	std::map<std::string, Handler, std::less<>> handlers;
};

struct Handled
{
	std::string action;
	std::string output;
};

// route matched, but nothing is registered for its action
struct Unbound
{
	std::string action;
	Params params;
};

using Outcome = std::variant<Handled, NotFound, Unbound>;

class Dispatcher: boost::noncopyable
{
public:
	explicit Dispatcher(std::shared_ptr<const ActionRegistry> registry);

	// Atomically replaces the table; in-flight dispatches keep the old one
	auto publish(std::shared_ptr<const RouteTable> table) noexcept -> void;
	auto table() const noexcept -> std::shared_ptr<const RouteTable>;

	auto dispatch(string_view method, string_view path, Logger& lg) const -> Outcome;

private:
	const std::shared_ptr<const ActionRegistry> registry;
	std::shared_ptr<const RouteTable> current;
};
}
