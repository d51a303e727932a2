#pragma once
#include "string_view.hpp"
#include "uri.hpp"
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace switchyard
{
struct StaticSegment
{
	std::string literal;
};

struct ParamSegment
{
	std::string name;
	// empty means one or more characters except '/'
	std::optional<std::string> constraint;
};

using Segment = std::variant<StaticSegment, ParamSegment>;

auto operator==(const StaticSegment& lhs, const StaticSegment& rhs) -> bool;
auto operator==(const ParamSegment& lhs, const ParamSegment& rhs) -> bool;

/*
	Compiled path template:
		/customer/{id}
		/customer/{<[0-9]+>customerid}
	throws PatternError
 */
class PathPattern
{
public:
	struct Matcher
	{
		virtual ~Matcher() = default;

		virtual auto match(string_view s) const -> bool = 0;
	};

	explicit PathPattern(string_view tmpl);
	PathPattern(PathPattern&&) noexcept = default;
	PathPattern(const PathPattern&) = delete;
	~PathPattern() = default;

	auto operator=(PathPattern&&) noexcept -> PathPattern& = default;
	auto operator=(const PathPattern&) -> PathPattern& = delete;

	auto str() const noexcept -> const std::string& { return tmpl; }
	auto segments() const noexcept -> const std::vector<Segment>& { return segs; }
	auto param_names() const -> std::vector<string_view>;

	auto match(const PathSegments& path) const -> bool;
	auto accepts(std::size_t index, string_view segment) const -> bool;

private:
	std::string tmpl;
	std::vector<Segment> segs;
	std::vector<std::unique_ptr<const Matcher>> matchers;
};
}
