#pragma once
#include "string_view.hpp"
#include <boost/container/small_vector.hpp>
#include <string>

namespace switchyard
{
using PathSegments = boost::container::small_vector<string_view, 16>;

// "/a/b/" -> {"a", "b", ""}; the leading '/' is dropped, empty segments are kept
auto split_path(string_view path) -> PathSegments;

// Malformed escapes are copied as is, '+' is left untouched
auto percent_decode(string_view s) -> std::string;
auto percent_encode(string_view s) -> std::string;
}
