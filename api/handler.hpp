#pragma once
#include "capture.hpp"
#include "error.hpp"
#include "response.hpp"
#include "string_view.hpp"
#include "visitor.hpp"
#include <boost/numeric/conversion/cast.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>

namespace twig
{
namespace handler
{
template <typename F>
struct Signature: Signature<decltype(&F::operator())> {};

template <typename R, typename... Args>
struct Signature<R (*)(Args...)>
{
	using Result = R;
	using Arguments = std::tuple<Args...>;
	static constexpr std::size_t arity = sizeof...(Args);
};

template <typename R, typename... Args>
struct Signature<R (Args...)>: Signature<R (*)(Args...)> {};

template <typename C, typename R, typename... Args>
struct Signature<R (C::*)(Args...)>: Signature<R (*)(Args...)> {};

template <typename C, typename R, typename... Args>
struct Signature<R (C::*)(Args...) const>: Signature<R (*)(Args...)> {};

template <typename T>
struct IsOptional: std::false_type {};

template <typename T>
struct IsOptional<std::optional<T>>: std::true_type {};

// Converts capture number index (from 0) to a handler parameter.
template <typename T>
auto convert(const Capture& c, std::size_t index) -> std::decay_t<T>
{
	using V = std::decay_t<T>;

	if constexpr (std::is_same_v<V, Capture>) {
		return c;
	} else if constexpr (std::is_same_v<V, std::string> || std::is_same_v<V, string_view>) {
		if (auto s = std::get_if<std::string>(&c))
			return V{ *s };
		throw CaptureTypeMismatch{ index, "string" };
	} else if constexpr (std::is_integral_v<V> && !std::is_same_v<V, bool>) {
		auto i = std::get_if<Integer>(&c);
		if (!i)
			throw CaptureTypeMismatch{ index, "integer" };
		try {
			return boost::numeric_cast<V>(*i);
		} catch (boost::numeric::bad_numeric_cast&) {
			throw CaptureTypeMismatch{ index, "integer of this width" };
		}
	} else if constexpr (std::is_floating_point_v<V>) {
		return std::visit(Visitor{
			[index](const std::string&) -> V { throw CaptureTypeMismatch{ index, "number" }; },
			[](Integer i) { return static_cast<V>(i); },
			[](Real r) { return static_cast<V>(r); },
		}, c);
	} else {
		static_assert(dependent_false<T>, "unsupported handler parameter type");
	}
}

template <typename Block, std::size_t... I>
decltype(auto) invoke_typed(Block& block, const CaptureList& captures, std::index_sequence<I...>)
{
	using Args = typename Signature<std::decay_t<Block>>::Arguments;
	return block(convert<std::tuple_element_t<I, Args>>(captures[I], I)...);
}

// A block takes the whole capture list, nothing, or one parameter per
// capture.
template <typename Block>
decltype(auto) invoke(Block& block, const CaptureList& captures)
{
	if constexpr (std::is_invocable_v<Block&, const CaptureList&>) {
		return block(captures);
	} else if constexpr (std::is_invocable_v<Block&>) {
		return block();
	} else {
		constexpr auto arity = Signature<std::decay_t<Block>>::arity;
		if (captures.size() != arity)
			throw ArityMismatch{ arity, captures.size() };
		return invoke_typed(block, captures, std::make_index_sequence<arity>{});
	}
}

// A string result becomes the body unless something was written already.
template <typename Result>
void apply_result(Response& response, const Result& result)
{
	using R = std::decay_t<Result>;

	if constexpr (IsOptional<R>::value) {
		if (result)
			apply_result(response, *result);
	} else if constexpr (std::is_pointer_v<R> && std::is_convertible_v<R, string_view>) {
		if (result && response.empty())
			response.write(result);
	} else if constexpr (std::is_convertible_v<const R&, string_view>) {
		if (response.empty())
			response.write(result);
	} else {
		static_assert(dependent_false<R>, "unsupported block result type");
	}
}

template <typename Block>
void run(Response& response, Block& block, const CaptureList& captures)
{
	using Result = decltype(invoke(block, captures));

	if constexpr (std::is_void_v<Result>)
		invoke(block, captures);
	else
		apply_result(response, invoke(block, captures));
}
}
}
