#define BOOST_SPIRIT_X3_NO_FILESYSTEM
#include "config_parser.hpp"
#include "source.hpp"
#include <boost/assert.hpp>
#include <boost/spirit/home/x3.hpp>
#include <boost/spirit/home/x3/support/ast/variant.hpp>
#include <boost/fusion/adapted/struct/adapt_struct.hpp>
#include <boost/range/iterator_range.hpp>
#include <string>
#include <utility>
#include <vector>

/*
	value ::= bool | int | string
	stmt  ::= key = value
	table ::= stmt*
 */

namespace
{
using Iterator = switchyard::string_view::const_iterator;
using Range = boost::iterator_range<Iterator>;

namespace ast
{
namespace x3 = boost::spirit::x3;

struct Value : x3::variant<
		switchyard::config::Boolean,
		switchyard::config::Integer,
		switchyard::config::String
	>
{
	using base_type::base_type;
	using base_type::operator=;
};

struct Stmt
{
	Range key;
	Value val;
};
}
}

BOOST_FUSION_ADAPT_STRUCT(ast::Stmt, key, val);

namespace
{
namespace grammar
{
using namespace boost::spirit::x3;

const rule<struct KeyId, Range> key = "key";
const rule<struct ValueId, ast::Value> value = "value";
const rule<struct StmtId, ast::Stmt> stmt = "statement";
const rule<struct TableId, std::vector<ast::Stmt>> table = "table";

const auto bool_kw = lexeme[bool_ >> !(graph - '=')];
const auto integer = lexeme[int32 >> !graph];
const auto single_quoted_string = lexeme['\'' >> *~char_('\'') >> '\''];
const auto unquoted_string = lexeme[+graph] - bool_kw;
const auto string = single_quoted_string | unquoted_string;

static_assert(std::is_same_v<decltype(int32)::attribute_type, switchyard::config::Integer>);

const auto key_def = raw[lexeme[+(alnum | char_("_.-"))]];
const auto value_def =
	  bool_kw
	| integer
	| string
	;
const auto stmt_def = key > '=' > value;
const auto table_def = *stmt;

const auto comment = '#' >> *(char_ - eol);
const auto skipper = space | comment;

BOOST_SPIRIT_DEFINE(key, value, stmt, table);
}

struct PropertyMaker : boost::static_visitor<switchyard::config::Property>
{
	PropertyMaker(std::string key, switchyard::config::Property::Location loc):
		key{ move(key) },
		loc{ std::move(loc) }
	{}

	template <typename T>
	auto operator()(const T& v) const
	{
		return switchyard::config::Property{ key, v, loc };
	}

private:
	const std::string key;
	const switchyard::config::Property::Location loc;
};

auto make_error(const switchyard::Source& source, Iterator where, const std::string& msg)
{
	auto [line, column] = source.location(where);
	return switchyard::config::SyntaxError{ line, column, source.describe(where, msg) };
}
}

namespace switchyard
{
namespace config
{
auto parse(std::shared_ptr<const Source> source) -> Table
{
	const auto text = source->text();
	auto begin = text.begin();
	const auto end = text.end();
	std::vector<ast::Stmt> stmts;

	try {
		auto parsed = phrase_parse(begin, end, grammar::table, grammar::skipper, stmts);
		BOOST_ASSERT(parsed);
	} catch (grammar::expectation_failure<Iterator>& e) {
		throw make_error(*source, e.where(), "expecting " + e.which());
	}

	if (begin != end)
		throw make_error(*source, begin, "can't parse");

	Table result;
	for (auto& stmt : stmts) {
		PropertyMaker maker{ { stmt.key.begin(), stmt.key.end() }, { source, stmt.key.begin() } };
		result.add(boost::apply_visitor(maker, stmt.val.get()));
	}
	return result;
}
}
}
