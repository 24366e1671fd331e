#include "dispatcher.hpp"
#include "error.hpp"
#include "logger.hpp"
#include "path_cursor.hpp"
#include "pattern_cache.hpp"
#include <charconv>
#include <optional>
#include <sstream>
#include <system_error>

namespace twig
{
namespace
{
auto describe(const Matcher& m) -> std::string
{
	std::ostringstream s;
	s << m;
	return s.str();
}

auto integer_pattern() -> const CompiledPattern&
{
	static const CompiledPattern p{ "(\\d+)" };
	return p;
}

auto to_integer(const std::string& digits) -> std::optional<Integer>
{
	Integer value{};
	const auto last = digits.data() + digits.size();
	const auto [ptr, ec] = std::from_chars(digits.data(), last, value);
	if (ec != std::errc{} || ptr != last)
		return std::nullopt;
	return value;
}

class Dispatcher
{
public:
	Dispatcher(const Matcher& self, MatchContext& ctx): self{ self }, ctx{ ctx } {}

	bool operator()(const Literal& m) const
	{
		return ctx.cursor.consume_literal(m.text);
	}

	bool operator()(const Wildcard&) const
	{
		return match_segment();
	}

	bool operator()(const TypedWildcard& m) const
	{
		switch (m.kind) {
		case TypedWildcard::Kind::string: return match_segment();
		case TypedWildcard::Kind::integer: return match_integer();
		}
		throw UnsupportedMatcher{ describe(self) };
	}

	bool operator()(const Pattern& m) const
	{
		const auto compiled = ctx.patterns.get_or_compile(m.source);
		const auto snapshot = ctx.cursor.snapshot();
		auto groups = ctx.cursor.consume_pattern(*compiled);
		if (!groups)
			return false;

		if (!m.decode) {
			for (auto& g : *groups)
				ctx.captures.emplace_back(move(g));
			return true;
		}

		try {
			auto decoded = m.decode(move(*groups));
			ctx.captures.insert(ctx.captures.end(),
				std::make_move_iterator(decoded.begin()),
				std::make_move_iterator(decoded.end()));
		} catch (...) {
			ctx.cursor.restore(snapshot);
			throw;
		}
		return true;
	}

	bool operator()(const Alternation& m) const
	{
		for (auto& element : m.elements) {
			if (evaluate(element, ctx)) {
				if (auto literal = std::get_if<Literal>(&element.variant()))
					ctx.captures.emplace_back(literal->text);
				return true;
			}
		}
		return false;
	}

	bool operator()(const Conjunction& m) const
	{
		const auto snapshot = ctx.cursor.snapshot();
		const auto captured = ctx.captures.size();
		for (auto& entry : m.entries) {
			if (!evaluate(entry.matcher, ctx)) {
				ctx.cursor.restore(snapshot);
				ctx.captures.erase(ctx.captures.begin() + captured, ctx.captures.end());
				return false;
			}
		}
		return true;
	}

	bool operator()(const BooleanLiteral& m) const
	{
		return m.value;
	}

	bool operator()(const Predicate& m) const
	{
		if (!m.test)
			throw UnsupportedMatcher{ describe(self) };
		return m.test();
	}

	bool operator()(const Terminal&) const
	{
		return ctx.cursor.is_empty();
	}

private:
	bool match_segment() const
	{
		auto segment = ctx.cursor.consume_segment();
		if (!segment)
			return false;
		ctx.captures.emplace_back(std::string{ *segment });
		return true;
	}

	bool match_integer() const
	{
		const auto snapshot = ctx.cursor.snapshot();
		auto groups = ctx.cursor.consume_pattern(integer_pattern());
		if (!groups)
			return false;

		auto value = to_integer(groups->front());
		if (!value) {
			ctx.lg.debug("integer segment out of range: ", groups->front());
			ctx.cursor.restore(snapshot);
			return false;
		}
		ctx.captures.emplace_back(*value);
		return true;
	}

	const Matcher& self;
	MatchContext& ctx;
};
}

auto evaluate(const Matcher& matcher, MatchContext& ctx) -> bool
{
	if (matcher.variant().valueless_by_exception())
		throw UnsupportedMatcher{ describe(matcher) };

	return std::visit(Dispatcher{ matcher, ctx }, matcher.variant());
}
}
