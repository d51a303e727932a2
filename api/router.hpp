#pragma once
#include "method.hpp"
#include "params.hpp"
#include "string_view.hpp"
#include <optional>
#include <ostream>
#include <string>
#include <variant>

namespace switchyard
{
class Route;
class RouteTable;

struct Match
{
	// owned by the table, valid as long as the table is
	const Route* route;
	Params params;
	std::string method;
	std::string path;
};

struct NotFound
{
	std::string method;
	std::string path;
};

using MatchResult = std::variant<Match, NotFound>;

auto operator==(const Match& lhs, const Match& rhs) -> bool;
auto operator==(const NotFound& lhs, const NotFound& rhs) -> bool;
auto operator<<(std::ostream& stream, const NotFound& nf) -> std::ostream&;

// First route in declaration order wins
auto match(const RouteTable& table, string_view method, string_view path) -> MatchResult;

struct Reverse
{
	Method method;
	std::string url;
};

// URL of the first route bound to "Controller.method" that can be built from args;
// args not consumed by the path go to the query string
auto reverse(const RouteTable& table, string_view action, const Params& args)
	-> std::optional<Reverse>;
}
