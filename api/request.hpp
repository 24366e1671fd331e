#pragma once
#include "capture.hpp"
#include "dispatcher.hpp"
#include "environment.hpp"
#include "halt.hpp"
#include "handler.hpp"
#include "match.hpp"
#include "matcher.hpp"
#include "path_cursor.hpp"
#include "response.hpp"
#include "string_view.hpp"
#include <boost/core/noncopyable.hpp>
#include <string>
#include <utility>
#include <vector>

namespace twig
{
class Application;
class Logger;
class PatternCache;

// Routing state of one request. Every verb that matches runs its block and
// then commits the response by throwing Halt, so at most one branch of a
// routing tree is ever taken.
class Request: boost::noncopyable
{
public:
	Request(const Environment& env, Response& response, PatternCache& patterns, Logger& lg);

	// Match without committing: the continuation decides what to do.
	template <typename Continuation>
	auto try_match(const MatcherList& matchers, Continuation&& on_success) -> bool
	{
		return twig::try_match(matchers, ctx, std::forward<Continuation>(on_success));
	}

	template <typename Block> void on(const MatcherList& matchers, Block&& block)
	{
		if_match(matchers, block);
	}
	template <typename Block> void on(Block&& block)
	{
		always(block);
	}

	// Like on, but the whole path has to be consumed.
	template <typename Block> void is(MatcherList matchers, Block&& block)
	{
		matchers.push_back(term);
		if_match(matchers, block);
	}
	template <typename Block> void is(Block&& block)
	{
		if (cursor.is_empty())
			always(block);
	}

	template <typename Block> void get(MatcherList matchers, Block&& block)
	{
		if (is_get())
			is(std::move(matchers), block);
	}
	template <typename Block> void get(Block&& block)
	{
		if (is_get())
			always(block);
	}

	template <typename Block> void post(MatcherList matchers, Block&& block)
	{
		if (is_method("POST"))
			is(std::move(matchers), block);
	}
	template <typename Block> void post(Block&& block)
	{
		if (is_method("POST"))
			always(block);
	}

	// GET with exactly "/" left.
	template <typename Block> void root(Block&& block)
	{
		if (cursor.remaining() == "/" && is_get())
			always(block);
	}

	[[noreturn]] void halt();
	[[noreturn]] void halt(Response::Finished finished);

	// throws RedirectError for GET requests
	[[noreturn]] void redirect();
	[[noreturn]] void redirect(std::string path, int status = 302);

	// Dispatches the rest of the path to another application and commits
	// with its response.
	[[noreturn]] void run(const Application& app);

	// Matcher that is true when the request method is one of names. It refers
	// to this request and must not outlive it.
	auto method_is(std::vector<std::string> names) const -> Matcher;
	auto is_method(string_view name) const -> bool;

	auto method() const noexcept -> const std::string& { return env.method; }
	auto is_get() const noexcept -> bool { return env.method == "GET"; }
	auto path() const -> std::string;
	auto matched_path() const -> std::string;
	auto remaining_path() const noexcept -> string_view { return cursor.remaining(); }

	auto response() noexcept -> Response& { return resp; }
	// For matchers evaluated outside of a verb.
	auto context() noexcept -> MatchContext& { return ctx; }
	auto logger() noexcept -> Logger& { return lg; }

private:
	template <typename Block> void if_match(const MatcherList& matchers, Block& block)
	{
		twig::try_match(matchers, ctx, [this, &block](const CaptureList& captures) {
			handler::run(resp, block, captures);
			halt();
		});
	}

	template <typename Block> [[noreturn]] void always(Block& block)
	{
		handler::run(resp, block, CaptureList{});
		halt();
	}

	const Environment& env;
	Response& resp;
	Logger& lg;
	PathCursor cursor;
	CaptureList captures;
	MatchContext ctx;
};
}
