#pragma once
#include "string_view.hpp"
#include <cstddef>
#include <initializer_list>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace switchyard
{
// Name/value pairs kept in insertion order
class Params
{
public:
	using value_type = std::pair<std::string, std::string>;
	using const_iterator = std::vector<value_type>::const_iterator;

	Params() = default;
	Params(std::initializer_list<value_type> init);

	auto add(std::string name, std::string value) -> void;

	[[nodiscard]] auto get(string_view name) const noexcept -> std::optional<string_view>;
	[[nodiscard]] auto contains(string_view name) const noexcept -> bool;

	auto size() const noexcept -> std::size_t { return items.size(); }
	auto empty() const noexcept -> bool { return items.empty(); }
	auto begin() const noexcept -> const_iterator { return items.begin(); }
	auto end() const noexcept -> const_iterator { return items.end(); }

	friend auto operator==(const Params& lhs, const Params& rhs) -> bool
	{
		return lhs.items == rhs.items;
	}
	friend auto operator!=(const Params& lhs, const Params& rhs) -> bool
	{
		return !(lhs == rhs);
	}

private:
	std::vector<value_type> items;
};

auto operator<<(std::ostream& stream, const Params& params) -> std::ostream&;
}
