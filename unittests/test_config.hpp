#pragma once
#include "config.hpp"
#include <string>
#include <utility>

namespace switchyard
{
namespace config
{
namespace test
{
template <typename T>
auto prop(std::string key, T value)
{
	return Property{ move(key), std::move(value) };
}

inline auto tbl()
{
	return Table{};
}

inline auto operator<<(Table t, Property&& p)
{
	t.add(std::move(p));
	return t;
}
}
}
}
