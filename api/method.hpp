#pragma once
#include "string_view.hpp"
#include <optional>
#include <ostream>

namespace switchyard
{
enum class Method
{
	get,
	head,
	post,
	put,
	patch,
	delete_,
	options,
	any,
};

// Case-insensitive; "*" yields Method::any
auto parse_method(string_view token) noexcept -> std::optional<Method>;
auto to_string(Method m) noexcept -> string_view;

auto operator<<(std::ostream& stream, Method m) -> std::ostream&;
}
