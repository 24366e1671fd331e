#pragma once
#include "capture.hpp"
#include "matcher.hpp"

namespace twig
{
class Logger;
class PathCursor;
class PatternCache;

struct MatchContext
{
	PathCursor& cursor;
	CaptureList& captures;
	PatternCache& patterns;
	Logger& lg;
};

// On success the cursor is advanced by exactly what was matched and the
// captures are appended. On failure neither is modified.
// throws UnsupportedMatcher, PatternCompilationError
auto evaluate(const Matcher& matcher, MatchContext& ctx) -> bool;
}
