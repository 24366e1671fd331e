#pragma once
#include "capture.hpp"
#include "dispatcher.hpp"
#include "match.hpp"
#include "path_cursor.hpp"
#include "pattern_cache.hpp"
#include "stub_logger.hpp"
#include <boost/test/unit_test.hpp>
#include <ostream>
#include <string>

namespace boost
{
namespace test_tools
{
namespace tt_detail
{
template <>
struct print_log_value<twig::Capture>
{
	void operator()(std::ostream& stream, const twig::Capture& c)
	{
		twig::operator<<(stream, c);
	}
};

template <>
struct print_log_value<twig::CaptureList>
{
	void operator()(std::ostream& stream, const twig::CaptureList& list)
	{
		twig::operator<<(stream, list);
	}
};
}
}
}

namespace twig
{
namespace test
{
// Cursor, captures and cache of one request.
struct Matching
{
	explicit Matching(std::string path): cursor{ std::move(path) } {}

	auto eval(const Matcher& m) -> bool
	{
		return evaluate(m, ctx);
	}

	auto remaining() const -> std::string
	{
		return std::string{ cursor.remaining() };
	}

	PathCursor cursor;
	CaptureList captures;
	PatternCache cache;
	MatchContext ctx{ cursor, captures, cache, slg };
};

inline auto list(std::initializer_list<Capture> captures) -> CaptureList
{
	return captures;
}
}
}
