#include "loader.hpp"
#include "error.hpp"
#include "logger.hpp"
#include "route_parser.hpp"
#include "source.hpp"
#include "visitor.hpp"
#include <string>
#include <utility>

namespace switchyard
{
namespace
{
auto trim(string_view s) noexcept
{
	auto blank = [](char c) { return c == ' ' || c == '\t'; };
	while (!s.empty() && blank(s.front()))
		s.remove_prefix(1);
	while (!s.empty() && blank(s.back()))
		s.remove_suffix(1);
	return s;
}

auto normalize_prefix(string_view prefix)
{
	while (!prefix.empty() && prefix.back() == '/')
		prefix.remove_suffix(1);

	if (!prefix.empty() && prefix.front() != '/')
		throw LoadError{ "servlet prefix must start with '/': " + std::string{ prefix } };
	if (prefix.find_first_of("{}") != string_view::npos)
		throw LoadError{ "servlet prefix can't contain parameters: " + std::string{ prefix } };

	return std::string{ prefix };
}

auto make_pattern(const Source& source, const RouteLine& line, const std::string& prefix)
{
	if (line.path.front() != '/')
		throw source.error(line.path.begin(), "path must start with '/'");

	try {
		return PathPattern{ prefix + std::string{ line.path } };
	} catch (PatternError& e) {
		throw source.error(line.path.begin() + (e.where() - prefix.size()), e.what());
	}
}

auto make_action(const Source& source, const RouteLine& line)
{
	const auto ref = line.action;
	const auto dot = ref.rfind('.');
	if (dot == string_view::npos)
		throw source.error(ref.begin(), "expecting Controller.method, got: " + std::string{ ref });

	const auto target = ref.substr(0, dot);
	const auto method = ref.substr(dot + 1);
	if (target.empty() || method.empty() || target.front() == '.' || target.back() == '.'
			|| target.find("..") != string_view::npos)
		throw source.error(ref.begin(), "malformed action: " + std::string{ ref });

	Action action{ std::string{ target }, std::string{ method }, {} };
	for (auto& arg : line.args) {
		if (action.args.contains(arg.key))
			throw source.error(arg.key.begin(), "duplicate argument: " + std::string{ arg.key });
		action.args.add(std::string{ arg.key }, arg.value);
	}
	return action;
}

auto segment_covers(const PathPattern& earlier, const PathPattern& later, std::size_t i)
{
	return visit(Visitor{
		[](const StaticSegment& a, const StaticSegment& b)
		{
			return a.literal == b.literal;
		},
		[](const StaticSegment&, const ParamSegment&)
		{
			return false;
		},
		[&](const ParamSegment&, const StaticSegment& b)
		{
			return earlier.accepts(i, b.literal);
		},
		[&](const ParamSegment& a, const ParamSegment& b)
		{
			if (!a.constraint)
				return !later.accepts(i, {});
			return a.constraint == b.constraint;
		},
	}, earlier.segments()[i], later.segments()[i]);
}

auto covers(const Route& earlier, const Route& later)
{
	if (earlier.method() != Method::any && earlier.method() != later.method())
		return false;

	auto& a = earlier.pattern();
	auto& b = later.pattern();
	if (a.segments().size() != b.segments().size())
		return false;

	for (std::size_t i = 0; i < a.segments().size(); ++i)
		if (!segment_covers(a, b, i))
			return false;

	return true;
}
}

auto load(const Source& source, string_view prefix, Logger& lg, bool warn_shadowed) -> RouteTable
{
	auto effective_prefix = normalize_prefix(prefix);
	const auto text = source.text();
	const auto& name = source.name().empty() ? std::string{ "<text>" } : source.name();

	std::vector<Route> routes;
	for (std::size_t pos = 0, line_no = 1; pos <= text.size(); ++line_no) {
		auto eol = text.find('\n', pos);
		if (eol == string_view::npos)
			eol = text.size();
		auto line = text.substr(pos, eol - pos);
		pos = eol + 1;

		if (!line.empty() && line.back() == '\r')
			line.remove_suffix(1);
		line = trim(line);
		if (line.empty() || line.front() == '#')
			continue;

		auto parsed = parse_route_line(source, line);
		auto method = parse_method(parsed.method);
		if (!method)
			throw source.error(parsed.method.begin(), "unknown method: " + std::string{ parsed.method });

		auto pattern = make_pattern(source, parsed, effective_prefix);
		auto action = make_action(source, parsed);
		auto& route = routes.emplace_back(*method, std::move(pattern), std::move(action),
			routes.size(), line_no);
		lg.debug(name, ":", line_no, ": ", route);
	}

	RouteTable table{ move(effective_prefix), std::move(routes) };
	lg.info("loaded ", table.size(), " routes from ", name);

	if (warn_shadowed)
		for (auto& s : find_shadowed(table))
			lg.warning(name, ":", s.route->line(), ": route ", *s.route,
				" is shadowed by ", *s.by, " declared at line ", s.by->line());

	return table;
}

auto load_file(const std::filesystem::path& path, string_view prefix, Logger& lg,
	bool warn_shadowed) -> RouteTable
{
	auto source = Source::read(path);
	return load(*source, prefix, lg, warn_shadowed);
}

auto find_shadowed(const RouteTable& table) -> std::vector<Shadowing>
{
	std::vector<Shadowing> result;
	for (auto later = table.begin(); later != table.end(); ++later) {
		for (auto earlier = table.begin(); earlier != later; ++earlier) {
			if (covers(*earlier, *later)) {
				result.push_back({ &*later, &*earlier });
				break;
			}
		}
	}
	return result;
}
}
