#pragma once
#include "route_table.hpp"
#include "string_view.hpp"
#include <filesystem>
#include <vector>

namespace switchyard
{
class Logger;
class Source;

/*
	Route file:
		# comment
		GET     /home                           Pages.show(id:'home')
		GET     /page/{id}                      Pages.show
		POST    /customer/{<[0-9]+>customerid}  Customers.create
	All or nothing: throws LoadError on the first bad line
 */
auto load(const Source& source, string_view prefix, Logger& lg,
	bool warn_shadowed = true) -> RouteTable;
auto load_file(const std::filesystem::path& path, string_view prefix, Logger& lg,
	bool warn_shadowed = true) -> RouteTable;

struct Shadowing
{
	const Route* route;
	const Route* by;
};

// Routes that can't ever match because an earlier route takes all their requests
auto find_shadowed(const RouteTable& table) -> std::vector<Shadowing>;
}
