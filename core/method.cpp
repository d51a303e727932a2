#include "method.hpp"
#include <boost/algorithm/string/predicate.hpp>
#include <boost/range/algorithm/find_if.hpp>
#include <array>
#include <utility>

namespace switchyard
{
namespace
{
constexpr std::array<std::pair<string_view, Method>, 8> method_names = {{
	{ "GET"sv,     Method::get },
	{ "HEAD"sv,    Method::head },
	{ "POST"sv,    Method::post },
	{ "PUT"sv,     Method::put },
	{ "PATCH"sv,   Method::patch },
	{ "DELETE"sv,  Method::delete_ },
	{ "OPTIONS"sv, Method::options },
	{ "*"sv,       Method::any },
}};
}

auto parse_method(string_view token) noexcept -> std::optional<Method>
{
	auto it = boost::find_if(method_names, [token](const auto& m)
	{
		return boost::algorithm::iequals(m.first, token);
	});
	if (it == method_names.end())
		return {};
	return it->second;
}

auto to_string(Method m) noexcept -> string_view
{
	for (auto& [name, method] : method_names)
		if (method == m)
			return name;
	return "?"sv;
}

auto operator<<(std::ostream& stream, Method m) -> std::ostream&
{
	return stream << to_string(m);
}
}
