#pragma once
#include "string_view.hpp"
#include <string>
#include <utility>
#include <vector>

namespace switchyard
{
class Source;

// One declaration, views point into the source text
struct RouteLine
{
	struct Arg
	{
		string_view key;
		std::string value;
	};

	string_view method;
	string_view path;
	string_view action;
	std::vector<Arg> args;
};

// line must be a part of source.text(); throws LoadError
auto parse_route_line(const Source& source, string_view line) -> RouteLine;
}
