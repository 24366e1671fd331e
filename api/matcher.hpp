#pragma once
#include "capture.hpp"
#include <functional>
#include <iosfwd>
#include <string>
#include <variant>
#include <vector>

namespace twig
{
class Matcher;
using MatcherList = std::vector<Matcher>;

// "/text" followed by '/' or end of path; text may contain '/'.
struct Literal
{
	std::string text;
};

// One non-empty segment, captured as a string.
struct Wildcard {};

struct TypedWildcard
{
	enum class Kind
	{
		string,
		integer,
	};

	Kind kind;
};

// Regular expression matching whole segments from the cursor. Groups are
// captured as strings unless decode converts them.
struct Pattern
{
	using Decoder = std::function<CaptureList(std::vector<std::string> groups)>;

	std::string source;
	Decoder decode;
};

// First element that matches wins. A matching Literal pushes its text.
struct Alternation
{
	MatcherList elements;
};

// Every entry has to match, in order. Keys only label the entries when
// matchers are printed or logged; matching never reads them.
struct Conjunction
{
	struct Entry;

	std::vector<Entry> entries;
};

struct BooleanLiteral
{
	bool value;
};

struct Predicate
{
	std::function<bool()> test;
};

// Whole path consumed.
struct Terminal {};

class Matcher
{
public:
	using Variant = std::variant<
		Literal,
		Wildcard,
		TypedWildcard,
		Pattern,
		Alternation,
		Conjunction,
		BooleanLiteral,
		Predicate,
		Terminal
	>;

	Matcher(const char* text): v{ Literal{ text } } {}
	Matcher(std::string text): v{ Literal{ std::move(text) } } {}
	Matcher(Literal m): v{ std::move(m) } {}
	Matcher(Wildcard m): v{ m } {}
	Matcher(TypedWildcard m): v{ m } {}
	Matcher(Pattern m): v{ std::move(m) } {}
	Matcher(Alternation m): v{ std::move(m) } {}
	Matcher(Conjunction m): v{ std::move(m) } {}
	Matcher(BooleanLiteral m): v{ m } {}
	Matcher(Predicate m): v{ std::move(m) } {}
	Matcher(Terminal m): v{ m } {}

	auto variant() const noexcept -> const Variant& { return v; }

private:
	Variant v;
};

struct Conjunction::Entry
{
	std::string key;
	Matcher matcher;
};

auto operator<<(std::ostream& stream, const Matcher& m) -> std::ostream&;
auto operator<<(std::ostream& stream, const MatcherList& list) -> std::ostream&;

inline const Matcher segment = Wildcard{};
inline const Matcher integer = TypedWildcard{ TypedWildcard::Kind::integer };
inline const Matcher term = Terminal{};

auto pattern(std::string source, Pattern::Decoder decode = {}) -> Matcher;
auto one_of(MatcherList elements) -> Matcher;
auto all_of(std::vector<Conjunction::Entry> entries) -> Matcher;
auto predicate(std::function<bool()> test) -> Matcher;
}
