#pragma once
#include "params.hpp"
#include <ostream>
#include <string>
#include <tuple>

namespace switchyard
{
// Route target. Matching never looks inside it
struct Action
{
	std::string target;
	std::string method;
	Params args;

	auto reference() const -> std::string
	{
		return target + '.' + method;
	}
};

inline auto operator==(const Action& lhs, const Action& rhs) -> bool
{
	auto tie = [](const Action& a) { return std::tie(a.target, a.method, a.args); };
	return tie(lhs) == tie(rhs);
}

inline auto operator!=(const Action& lhs, const Action& rhs) -> bool
{
	return !(lhs == rhs);
}

auto operator<<(std::ostream& stream, const Action& action) -> std::ostream&;
}
