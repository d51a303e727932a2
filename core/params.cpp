#include "params.hpp"
#include <boost/range/algorithm/find_if.hpp>

namespace switchyard
{
Params::Params(std::initializer_list<value_type> init):
	items{ init }
{
}

auto Params::add(std::string name, std::string value) -> void
{
	items.emplace_back(move(name), move(value));
}

auto Params::get(string_view name) const noexcept -> std::optional<string_view>
{
	auto it = boost::find_if(items, [name](const auto& item) { return item.first == name; });
	if (it == items.end())
		return {};
	return string_view{ it->second };
}

auto Params::contains(string_view name) const noexcept -> bool
{
	return get(name).has_value();
}

auto operator<<(std::ostream& stream, const Params& params) -> std::ostream&
{
	stream << '{';
	auto sep = ""sv;
	for (auto& [name, value] : params) {
		stream << sep << name << ": '" << value << '\'';
		sep = ", "sv;
	}
	return stream << '}';
}
}
