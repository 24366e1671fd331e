#pragma once
#include "dispatcher.hpp"
#include "logger.hpp"
#include "path_cursor.hpp"
#include <boost/core/noncopyable.hpp>
#include <utility>

namespace twig
{
namespace detail
{
// Gives one match attempt an empty capture list and puts the enclosing
// attempt's list back when the attempt ends.
class CaptureScope: boost::noncopyable
{
public:
	explicit CaptureScope(CaptureList& captures):
		captures{ captures },
		saved{ std::exchange(captures, CaptureList{}) }
	{}

	~CaptureScope()
	{
		if (active)
			captures = std::move(saved);
	}

	auto release() -> CaptureList
	{
		active = false;
		return std::exchange(captures, std::move(saved));
	}

private:
	CaptureList& captures;
	CaptureList saved;
	bool active = true;
};
}

// Evaluates the matchers in order and invokes on_success with their
// captures when all of them match. Otherwise the cursor and the capture
// list are left as they were and false is returned. The cursor stays
// advanced after a successful match.
template <typename Continuation>
auto try_match(const MatcherList& matchers, MatchContext& ctx, Continuation&& on_success) -> bool
{
	const auto snapshot = ctx.cursor.snapshot();
	detail::CaptureScope scope{ ctx.captures };

	for (auto& m : matchers) {
		if (!evaluate(m, ctx)) {
			ctx.lg.trace("no match ", matchers, " at \"", ctx.cursor.remaining(), "\"");
			ctx.cursor.restore(snapshot);
			return false;
		}
	}

	const CaptureList captures = scope.release();
	ctx.lg.trace("matched ", matchers, ", captures ", captures,
		", remaining \"", ctx.cursor.remaining(), "\"");
	std::forward<Continuation>(on_success)(captures);
	return true;
}
}
