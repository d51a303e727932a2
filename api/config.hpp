#pragma once
#include "string_view.hpp"
#include <boost/iterator/transform_iterator.hpp>
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <list>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace switchyard
{
class Source;

namespace config
{
class Error: public std::runtime_error
{
public:
	explicit Error(const std::string& msg);
};

class SyntaxError: public Error
{
public:
	SyntaxError(std::size_t line, std::size_t column, const std::string& what);

	auto line() const noexcept -> std::size_t { return ln; }
	auto column() const noexcept -> std::size_t { return col; }

private:
	const std::size_t ln;
	const std::size_t col;
};

class BadKey: public Error
{
public:
	BadKey(const std::string& key, const std::string& msg);
	auto key() const noexcept -> const std::string& { return k; }
private:
	const std::string k;
};

class BadValue: public BadKey
{
public:
	BadValue(const std::string& key, const std::string& expected, const std::string& obtained,
		const std::string& msg);
	auto expected() const noexcept -> const std::string& { return exp; }
	auto obtained() const noexcept -> const std::string& { return obt; }
private:
	const std::string exp;
	const std::string obt;
};

using Boolean = bool;
using Integer = std::int32_t;
using String = std::string;

class Property
{
public:
	// where the key is written, for error messages
	struct Location
	{
		std::shared_ptr<const Source> source;
		string_view::const_iterator where;
	};

	struct EmptyType {};
	static constexpr EmptyType empty{};

	template <typename T, typename... Ts>
	static constexpr bool one_of = std::disjunction_v<std::is_same<T, Ts>...>;

	template <typename T>
	static constexpr bool supported_type = one_of<T, Boolean, Integer, String>;

	explicit Property(std::string key, EmptyType = empty, std::optional<Location> loc = {});
	Property(std::string key, Boolean val, std::optional<Location> loc = {});
	Property(std::string key, Integer val, std::optional<Location> loc = {});
	Property(std::string key, String val, std::optional<Location> loc = {});
	Property(std::string key, const char* val, std::optional<Location> loc = {});

	[[nodiscard]] auto has_value() const noexcept -> bool;
	explicit operator bool() const noexcept { return has_value(); }

	[[nodiscard]] auto key() const noexcept -> const std::string& { return k; }

	// throws BadKey if empty, BadValue on type mismatch
	template <typename T>
	auto as() const -> const T&;

	template <typename T>
	auto get_or(T default_value) const -> T
	{
		return has_value() ? as<T>() : default_value;
	}

	auto describe(const std::string& msg) const -> std::string;

	friend auto operator==(const Property& lhs, const Property& rhs) noexcept -> bool;
	friend auto operator!=(const Property& lhs, const Property& rhs) noexcept -> bool;
	// key = value, strings quoted
	friend auto operator<<(std::ostream& stream, const Property& p) -> std::ostream&;

private:
	template <typename T>
	static constexpr auto type_name() noexcept -> string_view
	{
		if constexpr (std::is_same_v<T, Boolean>)
			return "boolean";
		else if constexpr (std::is_same_v<T, Integer>)
			return "integer";
		else
			return "string";
	}

	[[noreturn]] auto raise_type_error(string_view expected) const -> void;

	std::string k;
	std::variant<std::monostate, Boolean, Integer, String> val;
	std::optional<Location> loc;
};

template <typename T>
auto Property::as() const -> const T&
{
	static_assert(supported_type<T>, "config::Property: unsupported value type");

	if (auto v = std::get_if<T>(&val))
		return *v;
	if (!has_value())
		throw BadKey{ k, describe("not found") };
	raise_type_error(type_name<T>());
}

// Flat list of key = value statements, keys may repeat
class Table
{
	struct Entry
	{
		Property prop;
		mutable bool used;
	};

	struct PropertyOf
	{
		auto operator()(const Entry& e) const noexcept -> const Property& { return e.prop; }
	};

public:
	using value_type = Property;
	using const_iterator = boost::transform_iterator<PropertyOf,
		std::vector<Entry>::const_iterator>;

	Table() = default;

	auto add(Property val) -> Table&;

	// Missing keys give an empty property
	[[nodiscard]] auto operator[](string_view name) const -> const Property&;
	[[nodiscard]] auto get_unique(string_view name) const -> const Property&;

	auto size() const noexcept -> std::size_t { return entries.size(); }
	auto begin() const -> const_iterator;
	auto end() const -> const_iterator;

	// throws BadKey for the first key nobody asked for
	auto throw_on_unknown_key() const -> void;

	friend auto operator==(const Table& lhs, const Table& rhs) noexcept -> bool;
	friend auto operator!=(const Table& lhs, const Table& rhs) noexcept -> bool;
	friend auto operator<<(std::ostream& stream, const Table& t) -> std::ostream&;

private:
	auto empty_value(string_view name) const -> const Property&;

	std::vector<Entry> entries;
	mutable std::list<Property> empty_values;
};
}
}
