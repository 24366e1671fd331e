#include "matcher.hpp"
#include <ostream>

namespace twig
{
namespace
{
struct MatcherPrinter
{
	std::ostream& s;

	void operator()(const Literal& m) const { s << '"' << m.text << '"'; }
	void operator()(const Wildcard&) const { s << "segment"; }
	void operator()(const TypedWildcard& m) const
	{
		switch (m.kind) {
		case TypedWildcard::Kind::string: s << "String"; return;
		case TypedWildcard::Kind::integer: s << "Integer"; return;
		}
		s << "TypedWildcard(" << static_cast<int>(m.kind) << ")";
	}
	void operator()(const Pattern& m) const { s << "~\"" << m.source << '"'; }
	void operator()(const Alternation& m) const { s << m.elements; }
	void operator()(const Conjunction& m) const
	{
		s << "(";
		const char* sep = "";
		for (auto& e : m.entries) {
			s << sep << e.key << ": " << e.matcher;
			sep = " ";
		}
		s << ")";
	}
	void operator()(const BooleanLiteral& m) const { s << (m.value ? "true" : "false"); }
	void operator()(const Predicate& m) const { s << (m.test ? "predicate" : "empty predicate"); }
	void operator()(const Terminal&) const { s << "end"; }
};
}

auto operator<<(std::ostream& stream, const Matcher& m) -> std::ostream&
{
	if (m.variant().valueless_by_exception())
		return stream << "valueless matcher";

	std::visit(MatcherPrinter{ stream }, m.variant());
	return stream;
}

auto operator<<(std::ostream& stream, const MatcherList& list) -> std::ostream&
{
	stream << "[";
	const char* sep = "";
	for (auto& m : list) {
		stream << sep << m;
		sep = ", ";
	}
	return stream << "]";
}

auto pattern(std::string source, Pattern::Decoder decode) -> Matcher
{
	return Pattern{ move(source), move(decode) };
}

auto one_of(MatcherList elements) -> Matcher
{
	return Alternation{ move(elements) };
}

auto all_of(std::vector<Conjunction::Entry> entries) -> Matcher
{
	return Conjunction{ move(entries) };
}

auto predicate(std::function<bool()> test) -> Matcher
{
	return Predicate{ move(test) };
}
}
