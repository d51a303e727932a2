#pragma once
#include "route.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace switchyard
{
// Built once by the loader, read-only afterwards
class RouteTable
{
public:
	using const_iterator = std::vector<Route>::const_iterator;

	RouteTable(std::string prefix, std::vector<Route> routes);
	RouteTable(RouteTable&&) noexcept = default;
	RouteTable(const RouteTable&) = delete;

	auto operator=(RouteTable&&) noexcept -> RouteTable& = default;
	auto operator=(const RouteTable&) -> RouteTable& = delete;

	auto prefix() const noexcept -> const std::string& { return pfx; }
	auto size() const noexcept -> std::size_t { return routes.size(); }
	auto empty() const noexcept -> bool { return routes.empty(); }
	auto operator[](std::size_t i) const -> const Route& { return routes.at(i); }
	auto begin() const noexcept -> const_iterator { return routes.begin(); }
	auto end() const noexcept -> const_iterator { return routes.end(); }

private:
	std::string pfx;
	std::vector<Route> routes;
};
}
