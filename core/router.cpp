#include "router.hpp"
#include "route_table.hpp"
#include "uri.hpp"
#include "visitor.hpp"
#include <boost/range/algorithm/find.hpp>
#include <tuple>
#include <vector>

namespace switchyard
{
namespace
{
auto extract(const PathPattern& pattern, const PathSegments& path) -> Params
{
	Params params;
	auto& segments = pattern.segments();
	for (std::size_t i = 0; i < segments.size(); ++i)
		if (auto param = std::get_if<ParamSegment>(&segments[i]))
			params.add(param->name, percent_decode(path[i]));
	return params;
}

auto bound_to(const Action& action, string_view reference) noexcept
{
	auto dot = reference.rfind('.');
	return dot != string_view::npos
		&& reference.substr(0, dot) == action.target
		&& reference.substr(dot + 1) == action.method;
}

auto build_url(const Route& route, const Params& args) -> std::optional<std::string>
{
	auto& static_args = route.action().args;
	for (auto& [name, value] : static_args) {
		auto given = args.get(name);
		if (given && *given != value)
			return {};
	}

	std::string url;
	std::vector<string_view> consumed;
	auto& pattern = route.pattern();
	auto& segments = pattern.segments();
	for (std::size_t i = 0; i < segments.size(); ++i) {
		url += '/';
		auto ok = visit(Visitor{
			[&url](const StaticSegment& s)
			{
				url += s.literal;
				return true;
			},
			[&](const ParamSegment& p)
			{
				auto value = args.get(p.name);
				if (!value || !pattern.accepts(i, *value))
					return false;
				url += percent_encode(*value);
				consumed.push_back(p.name);
				return true;
			},
		}, segments[i]);
		if (!ok)
			return {};
	}

	auto sep = '?';
	for (auto& [name, value] : args) {
		if (boost::find(consumed, name) != consumed.end() || static_args.contains(name))
			continue;
		url += sep;
		url += percent_encode(name);
		url += '=';
		url += percent_encode(value);
		sep = '&';
	}
	return url;
}
}

auto operator==(const Match& lhs, const Match& rhs) -> bool
{
	auto tie = [](const Match& m) { return std::tie(m.route, m.params, m.method, m.path); };
	return tie(lhs) == tie(rhs);
}

auto operator==(const NotFound& lhs, const NotFound& rhs) -> bool
{
	return lhs.method == rhs.method && lhs.path == rhs.path;
}

auto operator<<(std::ostream& stream, const NotFound& nf) -> std::ostream&
{
	return stream << "no route found for method[" << nf.method << "] and path[" << nf.path << "]";
}

auto match(const RouteTable& table, string_view method, string_view path) -> MatchResult
{
	const auto m = parse_method(method);
	if (!m || *m == Method::any || path.empty() || path.front() != '/')
		return NotFound{ std::string{ method }, std::string{ path } };

	const auto segments = split_path(path);
	for (auto& route : table) {
		if (!route.accepts(*m))
			continue;
		if (!route.pattern().match(segments))
			continue;
		return Match{ &route, extract(route.pattern(), segments),
			std::string{ method }, std::string{ path } };
	}

	return NotFound{ std::string{ method }, std::string{ path } };
}

auto reverse(const RouteTable& table, string_view action, const Params& args)
	-> std::optional<Reverse>
{
	for (auto& route : table) {
		if (!bound_to(route.action(), action))
			continue;
		if (auto url = build_url(route, args))
			return Reverse{ route.method(), std::move(*url) };
	}
	return {};
}
}
