#include "route.hpp"
#include "route_table.hpp"
#include <utility>

namespace switchyard
{
Route::Route(Method method, PathPattern pattern, Action action,
	std::size_t order, std::size_t line):
	meth{ method },
	patt{ std::move(pattern) },
	act{ std::move(action) },
	ord{ order },
	ln{ line }
{
}

auto Route::accepts(Method m) const noexcept -> bool
{
	return meth == Method::any || meth == m;
}

auto operator<<(std::ostream& stream, const Route& route) -> std::ostream&
{
	return stream << '#' << route.order() << ' ' << route.method() << ' '
		<< route.pattern().str() << " -> " << route.action();
}

RouteTable::RouteTable(std::string prefix, std::vector<Route> routes):
	pfx{ move(prefix) },
	routes{ std::move(routes) }
{
}
}
