#include "path_pattern.hpp"
#include "error.hpp"
#include <boost/range/algorithm/find.hpp>
#include <boost/regex.hpp>
#include <algorithm>
#include <cctype>
#include <utility>

namespace switchyard
{
namespace
{
class LiteralMatcher: public PathPattern::Matcher
{
public:
	explicit LiteralMatcher(std::string literal): literal{ move(literal) } {}
	auto match(string_view s) const noexcept -> bool override
	{
		return s == literal;
	}
private:
	const std::string literal;
};

class AnySegmentMatcher: public PathPattern::Matcher
{
public:
	auto match(string_view s) const noexcept -> bool override
	{
		return !s.empty() && s.find('/') == string_view::npos;
	}
};

class RegexMatcher: public PathPattern::Matcher
{
public:
	explicit RegexMatcher(const std::string& s): re{ s } {}
	auto match(string_view s) const -> bool override
	{
		try {
			return boost::regex_match(s.begin(), s.end(), re);
		} catch (boost::regex_error&) {
			// match complexity limit exceeded: the segment is rejected
			return false;
		}
	}
private:
	const boost::regex re;
};

struct MatchBuilder
{
	using result_type = std::unique_ptr<const PathPattern::Matcher>;

	auto operator()(const StaticSegment& s) const -> result_type
	{
		return std::make_unique<LiteralMatcher>(s.literal);
	}
	auto operator()(const ParamSegment& s) const -> result_type
	{
		if (s.constraint)
			return std::make_unique<RegexMatcher>(*s.constraint);
		return std::make_unique<AnySegmentMatcher>();
	}
};

struct Token
{
	string_view text;
	std::size_t pos;
};

// Splits on '/' outside of braces, so constraints may use {n,m} quantifiers
auto tokenize(string_view tmpl) -> std::vector<Token>
{
	if (tmpl.empty() || tmpl.front() != '/')
		throw PatternError{ 0, "path must start with '/'" };

	std::vector<Token> tokens;
	std::size_t start = 1;
	std::size_t open_pos = 0;
	int depth = 0;
	for (std::size_t i = 1; i < tmpl.size(); ++i) {
		switch (tmpl[i]) {
		case '{':
			if (depth++ == 0)
				open_pos = i;
			break;
		case '}':
			if (depth == 0)
				throw PatternError{ i, "unbalanced '}'" };
			--depth;
			break;
		case '/':
			if (depth == 0) {
				tokens.push_back({ tmpl.substr(start, i - start), start });
				start = i + 1;
			}
			break;
		}
	}
	if (depth != 0)
		throw PatternError{ open_pos, "unbalanced '{'" };

	tokens.push_back({ tmpl.substr(start), start });
	return tokens;
}

auto valid_name(string_view name) noexcept
{
	auto word_char = [](char c) { return std::isalnum(static_cast<unsigned char>(c)) || c == '_'; };
	return !name.empty()
		&& !std::isdigit(static_cast<unsigned char>(name.front()))
		&& std::all_of(name.begin(), name.end(), word_char);
}

auto make_segment(const Token& t) -> Segment
{
	auto text = t.text;
	if (text.find_first_of("{}") == string_view::npos)
		return StaticSegment{ std::string{ text } };

	if (text.front() != '{' || text.back() != '}')
		throw PatternError{ t.pos, "parameter must fill the whole segment: " + std::string{ text } };

	auto body = text.substr(1, text.size() - 2);
	auto name = body;
	auto name_pos = t.pos + 1;
	std::optional<std::string> constraint;

	//  {<regex>name}: the regex ends at the last '>'
	if (!body.empty() && body.front() == '<') {
		auto close = body.rfind('>');
		if (close == string_view::npos)
			throw PatternError{ t.pos + 1, "unterminated constraint" };
		if (close == 1)
			throw PatternError{ t.pos + 1, "empty constraint" };
		constraint = std::string{ body.substr(1, close - 1) };
		name = body.substr(close + 1);
		name_pos = t.pos + 2 + close;
	}

	if (name.empty())
		throw PatternError{ name_pos, "empty parameter name" };
	if (!valid_name(name))
		throw PatternError{ name_pos, "invalid parameter name: " + std::string{ name } };

	return ParamSegment{ std::string{ name }, move(constraint) };
}
}

auto operator==(const StaticSegment& lhs, const StaticSegment& rhs) -> bool
{
	return lhs.literal == rhs.literal;
}

auto operator==(const ParamSegment& lhs, const ParamSegment& rhs) -> bool
{
	return lhs.name == rhs.name && lhs.constraint == rhs.constraint;
}

PathPattern::PathPattern(string_view tmpl):
	tmpl{ tmpl }
{
	std::vector<std::string> names;
	for (auto& token : tokenize(tmpl)) {
		auto& segment = segs.emplace_back(make_segment(token));

		if (auto param = std::get_if<ParamSegment>(&segment)) {
			if (boost::find(names, param->name) != names.end())
				throw PatternError{ token.pos, "duplicate parameter name: " + param->name };
			names.push_back(param->name);
		}

		try {
			matchers.push_back(visit(MatchBuilder{}, segment));
		} catch (boost::regex_error& e) {
			throw PatternError{ token.pos, "invalid constraint in " + std::string{ token.text }
				+ ": " + e.what() };
		}
	}
}

auto PathPattern::param_names() const -> std::vector<string_view>
{
	std::vector<string_view> names;
	for (auto& segment : segs)
		if (auto param = std::get_if<ParamSegment>(&segment))
			names.push_back(param->name);
	return names;
}

auto PathPattern::match(const PathSegments& path) const -> bool
{
	if (path.size() != matchers.size())
		return false;

	for (std::size_t i = 0; i < path.size(); ++i)
		if (!matchers[i]->match(path[i]))
			return false;

	return true;
}

auto PathPattern::accepts(std::size_t index, string_view segment) const -> bool
{
	return matchers.at(index)->match(segment);
}
}
