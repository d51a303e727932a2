#pragma once

namespace switchyard
{
// Overload set of lambdas for std::visit
template <typename... Ts>
struct Visitor: Ts...
{
	using Ts::operator()...;
};

template <typename... Ts>
Visitor(Ts...) -> Visitor<Ts...>;
}
