#include "dispatcher.hpp"
#include "error.hpp"
#include "logger.hpp"
#include "route_table.hpp"
#include <atomic>
#include <utility>

namespace switchyard
{
auto Call::args() const noexcept -> const Params&
{
	return route.action().args;
}

auto ActionRegistry::add(string_view target, string_view method, Handler handler) -> void
{
	auto reference = std::string{ target } + '.' + std::string{ method };
	if (!handler)
		throw Error{ "empty handler for action: " + reference };

	auto [it, inserted] = handlers.emplace(reference, std::move(handler));
	if (!inserted)
		throw Error{ "already exists handler for action: " + reference };
}

auto ActionRegistry::find(const Action& action) const -> const Handler*
{
	auto found = handlers.find(action.reference());
	return found == handlers.end() ? nullptr : &found->second;
}

Dispatcher::Dispatcher(std::shared_ptr<const ActionRegistry> registry):
	registry{ move(registry) }
{
}

auto Dispatcher::publish(std::shared_ptr<const RouteTable> table) noexcept -> void
{
	std::atomic_store(&current, std::move(table));
}

auto Dispatcher::table() const noexcept -> std::shared_ptr<const RouteTable>
{
	return std::atomic_load(&current);
}

auto Dispatcher::dispatch(string_view method, string_view path, Logger& lg) const -> Outcome
{
	// keeps the table alive even if a new one is published meanwhile
	const auto snapshot = table();
	if (!snapshot)
		throw Error{ "no route table published" };

	auto result = match(*snapshot, method, path);
	if (auto nf = std::get_if<NotFound>(&result)) {
		lg.trace(*nf);
		return std::move(*nf);
	}

	auto& m = std::get<Match>(result);
	auto& route = *m.route;
	auto reference = route.action().reference();
	lg.debug(method, " ", path, " -> ", route);

	auto handler = registry->find(route.action());
	if (!handler)
		return Unbound{ move(reference), std::move(m.params) };

	return Handled{ move(reference), (*handler)(Call{ route, m.params, lg }) };
}
}
