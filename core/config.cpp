#include "config.hpp"
#include "source.hpp"
#include "visitor.hpp"
#include <boost/concept_check.hpp>
#include <boost/range/algorithm/find_if.hpp>
#include <algorithm>
#include <ostream>
#include <tuple>
#include <utility>

namespace switchyard
{
namespace config
{
namespace
{
BOOST_CONCEPT_ASSERT((boost::ForwardIterator<Table::const_iterator>));

struct KeyIs
{
	const string_view key;

	template <typename Entry>
	auto operator()(const Entry& e) const
	{
		return e.prop.key() == key;
	}
};
}

Error::Error(const std::string& msg): runtime_error{ msg }
{}

SyntaxError::SyntaxError(std::size_t line, std::size_t column, const std::string& what):
	Error{ what },
	ln{ line },
	col{ column }
{
}

BadKey::BadKey(const std::string& key, const std::string& msg):
	Error{ "key \"" + key + "\": " + msg },
	k{ key }
{
}

BadValue::BadValue(const std::string& key, const std::string& expected, const std::string& obtained,
	const std::string& msg):
	BadKey{ key, msg },
	exp{ expected },
	obt{ obtained }
{
}

Property::Property(std::string key, EmptyType, std::optional<Location> loc):
	k{ move(key) },
	loc{ move(loc) }
{
}

Property::Property(std::string key, Boolean val, std::optional<Location> loc):
	k{ move(key) },
	val{ val },
	loc{ move(loc) }
{
}

Property::Property(std::string key, Integer val, std::optional<Location> loc):
	k{ move(key) },
	val{ val },
	loc{ move(loc) }
{
}

Property::Property(std::string key, String val, std::optional<Location> loc):
	k{ move(key) },
	val{ std::move(val) },
	loc{ move(loc) }
{
}

Property::Property(std::string key, const char* val, std::optional<Location> loc):
	Property{ move(key), String{ val }, move(loc) }
{
}

auto Property::has_value() const noexcept -> bool
{
	return !std::holds_alternative<std::monostate>(val);
}

auto Property::describe(const std::string& msg) const -> std::string
{
	if (!loc)
		return msg;
	return loc->source->describe(loc->where, msg);
}

auto Property::raise_type_error(string_view expected) const -> void
{
	auto obtained = visit(Visitor{
		[](std::monostate) { return std::string{ "empty" }; },
		[](Boolean) { return std::string{ type_name<Boolean>() }; },
		[](Integer) { return std::string{ type_name<Integer>() }; },
		[](const String&) { return std::string{ type_name<String>() }; },
	}, val);
	auto exp = std::string{ expected };
	throw BadValue{ k, exp, obtained, describe("expected: " + exp + ", but got: " + obtained) };
}

auto operator==(const Property& lhs, const Property& rhs) noexcept -> bool
{
	return std::tie(lhs.k, lhs.val) == std::tie(rhs.k, rhs.val);
}

auto operator!=(const Property& lhs, const Property& rhs) noexcept -> bool
{
	return !(lhs == rhs);
}

auto operator<<(std::ostream& stream, const Property& p) -> std::ostream&
{
	stream << p.k << " = ";
	visit(Visitor{
		[&stream](std::monostate) { stream << "<empty>"; },
		[&stream](Boolean b) { stream << (b ? "true" : "false"); },
		[&stream](Integer i) { stream << i; },
		[&stream](const String& s) { stream << '\'' << s << '\''; },
	}, p.val);
	return stream;
}

auto Table::add(Property val) -> Table&
{
	entries.push_back({ std::move(val), false });
	return *this;
}

auto Table::empty_value(string_view name) const -> const Property&
{
	return empty_values.emplace_back(std::string{ name });
}

auto Table::operator[](string_view name) const -> const Property&
{
	return get_unique(name);
}

auto Table::get_unique(string_view name) const -> const Property&
{
	const KeyIs pred{ name };
	const auto end = entries.end();

	auto it = boost::find_if(entries, pred);
	if (it == end)
		return empty_value(name);

	auto it2 = std::find_if(next(it), end, pred);
	if (it2 != end)
		throw BadKey{ it2->prop.key(), it2->prop.describe("non-unique") };

	it->used = true;
	return it->prop;
}

auto Table::begin() const -> const_iterator
{
	return const_iterator{ entries.begin() };
}

auto Table::end() const -> const_iterator
{
	return const_iterator{ entries.end() };
}

auto Table::throw_on_unknown_key() const -> void
{
	for (auto& e : entries)
		if (!e.used)
			throw BadKey{ e.prop.key(), e.prop.describe("unknown key") };
}

auto operator==(const Table& lhs, const Table& rhs) noexcept -> bool
{
	return std::equal(lhs.begin(), lhs.end(), rhs.begin(), rhs.end());
}

auto operator!=(const Table& lhs, const Table& rhs) noexcept -> bool
{
	return !(lhs == rhs);
}

auto operator<<(std::ostream& stream, const Table& t) -> std::ostream&
{
	stream << '{';
	const char* sep = "";
	for (auto& p : t) {
		stream << sep << p;
		sep = ", ";
	}
	return stream << '}';
}
}
}
