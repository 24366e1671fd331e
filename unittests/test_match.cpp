#include "match_fixture.hpp"
#include "error.hpp"
#include "match.hpp"
#include "matcher.hpp"
#include <boost/test/unit_test.hpp>
#include <functional>
#include <string>

using namespace twig;
using twig::test::Matching;
using twig::test::list;

namespace
{
// Records the captures a continuation was given.
struct Recorder
{
	void operator()(const CaptureList& c)
	{
		++calls;
		captures = c;
	}

	int calls = 0;
	CaptureList captures;
};

auto method_check(const std::string& method, const std::string& expected) -> Matcher
{
	return predicate([method, expected] { return method == expected; });
}
}

BOOST_AUTO_TEST_SUITE(match_tests)

BOOST_AUTO_TEST_CASE(test_users_id)
{
	Matching m{ "/users/123" };
	Recorder r;
	BOOST_TEST(try_match({ "users", integer }, m.ctx, std::ref(r)));
	BOOST_TEST(r.calls == 1);
	BOOST_TEST(r.captures == list({ Integer{ 123 } }));
	BOOST_TEST(m.remaining() == "");
}

BOOST_AUTO_TEST_CASE(test_partial_segment)
{
	Matching m{ "/users123" };
	Recorder r;
	BOOST_TEST(!try_match({ "users" }, m.ctx, std::ref(r)));
	BOOST_TEST(r.calls == 0);
	BOOST_TEST(m.remaining() == "/users123");
}

BOOST_AUTO_TEST_CASE(test_root_with_method)
{
	Matching get{ "/" };
	Recorder r1;
	BOOST_TEST(try_match({ "", term, method_check("GET", "GET") }, get.ctx, std::ref(r1)));
	BOOST_TEST(r1.calls == 1);

	Matching post{ "/" };
	Recorder r2;
	BOOST_TEST(!try_match({ "", term, method_check("POST", "GET") }, post.ctx, std::ref(r2)));
	BOOST_TEST(r2.calls == 0);
	BOOST_TEST(post.remaining() == "/");
}

BOOST_AUTO_TEST_CASE(test_terminal_with_method)
{
	Matching get{ "" };
	BOOST_TEST(try_match({ term, method_check("GET", "GET") }, get.ctx, [](const CaptureList&) {}));

	Matching post{ "" };
	BOOST_TEST(!try_match({ term, method_check("POST", "GET") }, post.ctx, [](const CaptureList&) {}));
}

BOOST_AUTO_TEST_CASE(test_alternation)
{
	Matching m{ "/bar/baz" };
	Recorder r;
	BOOST_TEST(try_match({ one_of({ "foo", "bar" }) }, m.ctx, std::ref(r)));
	BOOST_TEST(r.captures == list({ std::string{ "bar" } }));
	BOOST_TEST(m.remaining() == "/baz");
}

BOOST_AUTO_TEST_CASE(test_trailing_slash)
{
	Matching without{ "/foo/bar/" };
	BOOST_TEST(!try_match({ "foo/bar", term }, without.ctx, [](const CaptureList&) {}));
	BOOST_TEST(without.remaining() == "/foo/bar/");

	Matching with{ "/foo/bar/" };
	BOOST_TEST(try_match({ "foo/bar/", term }, with.ctx, [](const CaptureList&) {}));
	BOOST_TEST(with.remaining() == "");
}

BOOST_AUTO_TEST_CASE(test_rollback_after_partial_success)
{
	Matching m{ "/a/1/b/2" };
	m.captures = list({ std::string{ "outer" } });

	Recorder r;
	BOOST_TEST(!try_match({ "a", integer, "b", segment, "c" }, m.ctx, std::ref(r)));
	BOOST_TEST(r.calls == 0);
	BOOST_TEST(m.remaining() == "/a/1/b/2");
	BOOST_TEST(m.captures == list({ std::string{ "outer" } }));
}

BOOST_AUTO_TEST_CASE(test_capture_order)
{
	Matching m{ "/x/7/y/z" };
	Recorder r;
	BOOST_TEST(try_match({ segment, integer, one_of({ "q", "y" }), segment }, m.ctx, std::ref(r)));
	BOOST_TEST(r.captures == list({
		std::string{ "x" }, Integer{ 7 }, std::string{ "y" }, std::string{ "z" } }));
}

BOOST_AUTO_TEST_CASE(test_empty_matcher_list)
{
	Matching m{ "/anything" };
	Recorder r;
	BOOST_TEST(try_match({}, m.ctx, std::ref(r)));
	BOOST_TEST(r.calls == 1);
	BOOST_TEST(r.captures.empty());
	BOOST_TEST(m.remaining() == "/anything");
}

BOOST_AUTO_TEST_CASE(test_nested_captures_do_not_leak)
{
	Matching m{ "/users/5/posts/9" };
	CaptureList outer_seen;
	CaptureList inner_seen;

	const bool matched = try_match({ "users", integer }, m.ctx, [&](const CaptureList& outer) {
		try_match({ "posts", integer }, m.ctx, [&](const CaptureList& inner) {
			inner_seen = inner;
			BOOST_TEST(m.captures.empty());
		});
		outer_seen = outer;
		BOOST_TEST(m.captures.empty());
	});

	BOOST_TEST(matched);
	BOOST_TEST(outer_seen == list({ Integer{ 5 } }));
	BOOST_TEST(inner_seen == list({ Integer{ 9 } }));
	BOOST_TEST(m.captures.empty());
	BOOST_TEST(m.remaining() == "");
}

BOOST_AUTO_TEST_CASE(test_nested_failure_keeps_outer_progress)
{
	Matching m{ "/users/5/comments" };
	bool inner_called = false;
	std::string left_after_inner;

	BOOST_TEST(try_match({ "users", integer }, m.ctx, [&](const CaptureList&) {
		inner_called = try_match({ "posts" }, m.ctx, [](const CaptureList&) {});
		left_after_inner = m.remaining();
	}));

	BOOST_TEST(!inner_called);
	BOOST_TEST(left_after_inner == "/comments");
}

BOOST_AUTO_TEST_CASE(test_first_match_wins)
{
	Matching m{ "/a/b" };
	int taken = 0;

	if (!try_match({ "a", "c" }, m.ctx, [&](const CaptureList&) { taken = 1; })
		&& !try_match({ "a", "b" }, m.ctx, [&](const CaptureList&) { taken = 2; }))
		taken = 3;
	try_match({ term }, m.ctx, [&](const CaptureList&) { taken *= 10; });

	BOOST_TEST(taken == 20);
}

BOOST_AUTO_TEST_CASE(test_continuation_exception_restores_list)
{
	Matching m{ "/x" };
	m.captures = list({ Integer{ 1 } });

	struct Unwind {};
	BOOST_CHECK_THROW(try_match({ segment }, m.ctx, [](const CaptureList&) { throw Unwind{}; }),
		Unwind);

	BOOST_TEST(m.captures == list({ Integer{ 1 } }));
	BOOST_TEST(m.remaining() == "");
}

BOOST_AUTO_TEST_CASE(test_evaluation_error_restores_list)
{
	Matching m{ "/x/y" };
	m.captures = list({ Integer{ 1 } });

	BOOST_CHECK_THROW(try_match({ segment, predicate({}) }, m.ctx, [](const CaptureList&) {}),
		UnsupportedMatcher);
	BOOST_TEST(m.captures == list({ Integer{ 1 } }));
}

BOOST_AUTO_TEST_SUITE_END()
