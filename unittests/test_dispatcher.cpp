#include "match_fixture.hpp"
#include "error.hpp"
#include "matcher.hpp"
#include <boost/test/unit_test.hpp>
#include <boost/test/data/test_case.hpp>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace twig;
using twig::test::Matching;
using twig::test::list;
using boost::unit_test::data::make;

namespace
{
struct FailureSample
{
	std::string name;
	Matcher matcher;
	std::string path;
};

auto failure_samples() -> std::vector<FailureSample>
{
	return {
		{ "literal partial segment", "users", "/users123" },
		{ "literal other segment", "users", "/posts/users" },
		{ "wildcard on root", segment, "/" },
		{ "wildcard on empty", segment, "" },
		{ "integer on word", integer, "/abc" },
		{ "integer on mixed", integer, "/12abc" },
		{ "integer overflow", integer, "/99999999999999999999" },
		{ "pattern", pattern("[0-9]{4}"), "/123" },
		{ "alternation", one_of({ "a", "b" }), "/c/a" },
		{ "conjunction second fails", all_of({ { "x", "a" }, { "y", "b" } }), "/a/c" },
		{ "conjunction first fails", all_of({ { "x", "a" }, { "y", "b" } }), "/b/a" },
		{ "false", BooleanLiteral{ false }, "/x" },
		{ "predicate", predicate([] { return false; }), "/x" },
		{ "terminal", term, "/x" },
		{ "terminal on slash", term, "/" },
	};
}

auto operator<<(std::ostream& stream, const FailureSample& s) -> std::ostream&
{
	return stream << s.name << ": " << s.matcher << " on \"" << s.path << "\"";
}
}

BOOST_AUTO_TEST_SUITE(dispatcher_tests)

BOOST_DATA_TEST_CASE(test_no_mutation_on_failure, make(failure_samples()))
{
	Matching m{ sample.path };
	m.captures.push_back(std::string{ "before" });

	BOOST_TEST(!m.eval(sample.matcher));
	BOOST_TEST(m.remaining() == sample.path);
	BOOST_TEST(m.captures == list({ std::string{ "before" } }));
}

BOOST_AUTO_TEST_CASE(test_literal)
{
	Matching m{ "/users/123" };
	BOOST_TEST(m.eval("users"));
	BOOST_TEST(m.remaining() == "/123");
	BOOST_TEST(m.captures.empty());
}

BOOST_AUTO_TEST_CASE(test_literal_with_slash)
{
	Matching m{ "/api/v1/items" };
	BOOST_TEST(m.eval(std::string{ "api/v1" }));
	BOOST_TEST(m.remaining() == "/items");
}

BOOST_AUTO_TEST_CASE(test_wildcard)
{
	Matching m{ "/alice/posts" };
	BOOST_TEST(m.eval(segment));
	BOOST_TEST(m.captures == list({ std::string{ "alice" } }));
	BOOST_TEST(m.remaining() == "/posts");
}

BOOST_AUTO_TEST_CASE(test_typed_string)
{
	Matching m{ "/42" };
	BOOST_TEST(m.eval(TypedWildcard{ TypedWildcard::Kind::string }));
	BOOST_TEST(m.captures == list({ std::string{ "42" } }));
	BOOST_TEST(m.remaining() == "");
}

BOOST_AUTO_TEST_CASE(test_typed_integer)
{
	Matching m{ "/123/x" };
	BOOST_TEST(m.eval(integer));
	BOOST_TEST(m.captures == list({ Integer{ 123 } }));
	BOOST_TEST(m.remaining() == "/x");
}

BOOST_AUTO_TEST_CASE(test_typed_integer_leading_zeros)
{
	Matching m{ "/007" };
	BOOST_TEST(m.eval(integer));
	BOOST_TEST(m.captures == list({ Integer{ 7 } }));
}

BOOST_AUTO_TEST_CASE(test_typed_integer_limit)
{
	Matching m{ "/9223372036854775807" };
	BOOST_TEST(m.eval(integer));
	BOOST_TEST(m.captures == list({ Integer{ 9223372036854775807 } }));
}

BOOST_AUTO_TEST_CASE(test_typed_integer_negative)
{
	Matching m{ "/-5" };
	BOOST_TEST(!m.eval(integer));
	BOOST_TEST(m.remaining() == "/-5");
}

BOOST_AUTO_TEST_CASE(test_unknown_typed_wildcard)
{
	Matching m{ "/x" };
	const Matcher bad = TypedWildcard{ static_cast<TypedWildcard::Kind>(42) };
	BOOST_CHECK_THROW(m.eval(bad), UnsupportedMatcher);
	BOOST_TEST(m.remaining() == "/x");
}

BOOST_AUTO_TEST_CASE(test_pattern_groups)
{
	Matching m{ "/2024-05/report" };
	BOOST_TEST(m.eval(pattern("(\\d{4})-(\\d{2})")));
	BOOST_TEST(m.captures == list({ std::string{ "2024" }, std::string{ "05" } }));
	BOOST_TEST(m.remaining() == "/report");
}

BOOST_AUTO_TEST_CASE(test_pattern_without_groups)
{
	Matching m{ "/abc/def" };
	BOOST_TEST(m.eval(pattern("[a-z]+")));
	BOOST_TEST(m.captures.empty());
	BOOST_TEST(m.remaining() == "/def");
}

BOOST_AUTO_TEST_CASE(test_pattern_is_cached)
{
	Matching m{ "/a/b" };
	BOOST_TEST(m.eval(pattern("[a-z]")));
	BOOST_TEST(m.eval(pattern("[a-z]")));
	BOOST_TEST(m.cache.size() == 1u);
	BOOST_TEST(static_cast<bool>(m.cache.get("[a-z]")));
}

BOOST_AUTO_TEST_CASE(test_pattern_decoder)
{
	Matching m{ "/v2.5" };
	const auto version = pattern("v(\\d+)\\.(\\d+)", [](std::vector<std::string> groups) {
		CaptureList decoded;
		for (auto& g : groups)
			decoded.emplace_back(Integer{ std::stoll(g) });
		return decoded;
	});

	BOOST_TEST(m.eval(version));
	BOOST_TEST(m.captures == list({ Integer{ 2 }, Integer{ 5 } }));
	BOOST_TEST(m.remaining() == "");
}

BOOST_AUTO_TEST_CASE(test_pattern_decoder_throws)
{
	Matching m{ "/x" };
	const auto failing = pattern("x", [](std::vector<std::string>) -> CaptureList {
		throw std::invalid_argument{ "cannot decode" };
	});

	BOOST_CHECK_THROW(m.eval(failing), std::invalid_argument);
	BOOST_TEST(m.remaining() == "/x");
	BOOST_TEST(m.captures.empty());

	Matching deeper{ "/x/y" };
	BOOST_CHECK_THROW(deeper.eval(failing), std::invalid_argument);
	BOOST_TEST(deeper.remaining() == "/x/y");
	BOOST_TEST(deeper.cursor.consumed() == "");
}

BOOST_AUTO_TEST_CASE(test_bad_pattern)
{
	Matching m{ "/x" };
	BOOST_CHECK_THROW(m.eval(pattern("(x")), PatternCompilationError);
	BOOST_TEST(m.remaining() == "/x");
	BOOST_TEST(m.cache.size() == 0u);
}

BOOST_AUTO_TEST_CASE(test_alternation_literal_capture)
{
	Matching m{ "/bar/baz" };
	BOOST_TEST(m.eval(one_of({ "foo", "bar" })));
	BOOST_TEST(m.captures == list({ std::string{ "bar" } }));
	BOOST_TEST(m.remaining() == "/baz");
}

BOOST_AUTO_TEST_CASE(test_alternation_first_wins)
{
	Matching m{ "/a/b" };
	BOOST_TEST(m.eval(one_of({ "a/b", "a" })));
	BOOST_TEST(m.captures == list({ std::string{ "a/b" } }));
	BOOST_TEST(m.remaining() == "");
}

BOOST_AUTO_TEST_CASE(test_alternation_non_literal)
{
	Matching m{ "/17" };
	BOOST_TEST(m.eval(one_of({ "x", integer })));
	BOOST_TEST(m.captures == list({ Integer{ 17 } }));
}

BOOST_AUTO_TEST_CASE(test_alternation_empty)
{
	Matching m{ "/x" };
	BOOST_TEST(!m.eval(one_of({})));
	BOOST_TEST(m.remaining() == "/x");
}

BOOST_AUTO_TEST_CASE(test_conjunction)
{
	Matching m{ "/items/9" };
	BOOST_TEST(m.eval(all_of({ { "path", "items" }, { "id", integer } })));
	BOOST_TEST(m.captures == list({ Integer{ 9 } }));
	BOOST_TEST(m.remaining() == "");
}

BOOST_AUTO_TEST_CASE(test_conjunction_rollback)
{
	Matching m{ "/items/9/x" };
	const auto conj = all_of({
		{ "path", "items" },
		{ "id", integer },
		{ "end", term },
	});

	BOOST_TEST(!m.eval(conj));
	BOOST_TEST(m.captures.empty());
	BOOST_TEST(m.remaining() == "/items/9/x");
}

BOOST_AUTO_TEST_CASE(test_conjunction_empty)
{
	Matching m{ "/x" };
	BOOST_TEST(m.eval(all_of({})));
	BOOST_TEST(m.remaining() == "/x");
}

BOOST_AUTO_TEST_CASE(test_conjunction_keys_are_labels)
{
	Matching a{ "/items/9" };
	Matching b{ "/items/9" };
	BOOST_TEST(a.eval(all_of({ { "path", "items" }, { "id", integer } })));
	BOOST_TEST(b.eval(all_of({ { "integer", "items" }, { "method", integer } })));
	BOOST_TEST(a.captures == b.captures);
	BOOST_TEST(a.remaining() == b.remaining());

	std::ostringstream s;
	s << all_of({ { "id", integer } });
	BOOST_TEST(s.str() == "(id: Integer)");
}

BOOST_AUTO_TEST_CASE(test_boolean)
{
	Matching m{ "/x" };
	BOOST_TEST(m.eval(BooleanLiteral{ true }));
	BOOST_TEST(m.remaining() == "/x");
	BOOST_TEST(m.captures.empty());
}

BOOST_AUTO_TEST_CASE(test_predicate)
{
	int calls = 0;
	Matching m{ "/x" };
	BOOST_TEST(m.eval(predicate([&calls] { ++calls; return true; })));
	BOOST_TEST(calls == 1);
	BOOST_TEST(m.remaining() == "/x");
}

BOOST_AUTO_TEST_CASE(test_empty_predicate)
{
	Matching m{ "/x" };
	BOOST_CHECK_THROW(m.eval(predicate({})), UnsupportedMatcher);
}

BOOST_AUTO_TEST_CASE(test_terminal)
{
	Matching m{ "" };
	BOOST_TEST(m.eval(term));
	BOOST_TEST(m.captures.empty());
}

BOOST_AUTO_TEST_CASE(test_root_idioms)
{
	Matching by_literal{ "/" };
	BOOST_TEST(by_literal.eval(""));
	BOOST_TEST(by_literal.remaining() == "");

	Matching by_terminal{ "/" };
	BOOST_TEST(!by_terminal.eval(term));

	Matching empty_path{ "" };
	BOOST_TEST(!empty_path.eval(""));
	BOOST_TEST(empty_path.eval(term));

	Matching deeper{ "/foo" };
	BOOST_TEST(!deeper.eval(""));
	BOOST_TEST(!deeper.eval(term));
}

BOOST_AUTO_TEST_CASE(test_printing)
{
	std::ostringstream s;
	s << MatcherList{ "a", segment, integer, pattern("\\d+"), one_of({ "x", "y" }),
		all_of({ { "k", "v" } }), BooleanLiteral{ true }, term };
	BOOST_TEST(s.str() == "[\"a\", segment, Integer, ~\"\\d+\", [\"x\", \"y\"], (k: \"v\"), true, end]");
}

BOOST_AUTO_TEST_SUITE_END()
