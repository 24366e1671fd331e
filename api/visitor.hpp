#pragma once

namespace twig
{
template <typename... Ts>
struct Visitor : Ts...
{
	using Ts::operator()...;
};

template <typename... Ts>
Visitor(Ts...) -> Visitor<Ts...>;

template <typename...>
inline constexpr bool dependent_false = false;
}
