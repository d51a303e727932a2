#define BOOST_SPIRIT_X3_NO_FILESYSTEM
#include "route_parser.hpp"
#include "source.hpp"
#include <boost/spirit/home/x3.hpp>
#include <boost/fusion/adapted/struct/adapt_struct.hpp>
#include <boost/range/iterator_range.hpp>

/*
	line   ::= method path action [ '(' [ arg { ',' arg } ] ')' ]
	arg    ::= key ':' value
	value  ::= '\'' chars '\'' | '"' chars '"'
 */

namespace
{
using Iterator = switchyard::string_view::const_iterator;
using Range = boost::iterator_range<Iterator>;

namespace ast
{
struct Arg
{
	Range key;
	std::string value;
};

struct Line
{
	Range method;
	Range path;
	Range action;
	std::vector<Arg> args;
};
}
}

BOOST_FUSION_ADAPT_STRUCT(ast::Arg, key, value);
BOOST_FUSION_ADAPT_STRUCT(ast::Line, method, path, action, args);

namespace
{
namespace grammar
{
using namespace boost::spirit::x3;

const rule<struct MethodId, Range> method = "method";
const rule<struct PathId, Range> path = "path";
const rule<struct ActionId, Range> action = "action";
const rule<struct KeyId, Range> key = "argument name";
const rule<struct ValueId, std::string> value = "quoted value";
const rule<struct ArgId, ast::Arg> arg = "argument";
const rule<struct ArgListId, std::vector<ast::Arg>> arg_list = "argument list";
const rule<struct LineId, ast::Line> line = "route";

const auto word = lexeme[+graph];
const auto ident = lexeme[(alpha | char_('_')) >> *(alnum | char_('_'))];

const auto method_def = raw[word];
const auto path_def = raw[word];
const auto action_def = raw[lexeme[+(alnum | char_("_$."))]];
const auto key_def = raw[ident];
const auto value_def =
	  lexeme['\'' > *~char_('\'') > '\'']
	| lexeme['"' > *~char_('"') > '"']
	;
const auto arg_def = key > ':' > value;
const auto arg_list_def = '(' > -(arg % ',') > ')';
const auto line_def = method > path > action > -arg_list;

BOOST_SPIRIT_DEFINE(method, path, action, key, value, arg, arg_list, line);
}

auto to_view(const Range& r) noexcept
{
	return switchyard::string_view{ r.begin(), static_cast<std::size_t>(r.size()) };
}
}

namespace switchyard
{
auto parse_route_line(const Source& source, string_view text) -> RouteLine
{
	auto begin = text.begin();
	const auto end = text.end();
	ast::Line ast;

	try {
		if (!phrase_parse(begin, end, grammar::line, grammar::blank, ast))
			throw source.error(begin, "expecting route declaration");
	} catch (grammar::expectation_failure<Iterator>& e) {
		throw source.error(e.where(), "expecting " + e.which());
	}

	if (begin != end)
		throw source.error(begin, "unexpected input");

	RouteLine result{ to_view(ast.method), to_view(ast.path), to_view(ast.action), {} };
	for (auto& arg : ast.args)
		result.args.push_back({ to_view(arg.key), std::move(arg.value) });
	return result;
}
}
