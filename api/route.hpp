#pragma once
#include "action.hpp"
#include "method.hpp"
#include "path_pattern.hpp"
#include <cstddef>

namespace switchyard
{
class Route
{
public:
	Route(Method method, PathPattern pattern, Action action,
		std::size_t order, std::size_t line);

	auto method() const noexcept -> Method { return meth; }
	auto pattern() const noexcept -> const PathPattern& { return patt; }
	auto action() const noexcept -> const Action& { return act; }
	// position among declared routes, the only priority key
	auto order() const noexcept -> std::size_t { return ord; }
	auto line() const noexcept -> std::size_t { return ln; }

	auto accepts(Method m) const noexcept -> bool;

private:
	Method meth;
	PathPattern patt;
	Action act;
	std::size_t ord;
	std::size_t ln;
};

auto operator<<(std::ostream& stream, const Route& route) -> std::ostream&;
}
