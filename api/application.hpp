#pragma once
#include "environment.hpp"
#include "handler.hpp"
#include "pattern_cache.hpp"
#include "request.hpp"
#include "response.hpp"
#include <boost/core/noncopyable.hpp>
#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <type_traits>
#include <utility>

namespace twig
{
// Owner of a routing tree and of the compiled patterns it uses. call may be
// used from many threads at once as long as the route block allows it.
class Application: boost::noncopyable
{
public:
	using Route = std::function<void(Request&)>;

	struct RouteResult
	{
		enum class State
		{
			// a verb committed the response
			matched,
			// the route block returned, default outcome
			exhausted,
			// routing error, set by Resolver only
			failed,
		};

		State state;
		Response::Finished response;
	};

	Application(std::string name, Route route);

	// The block may return a string result like the verb blocks do.
	template <typename Block>
	Application(std::string name, Block block):
		Application{ std::move(name), wrap(std::move(block)) }
	{}

	// throws twig::Error for broken routing trees
	auto route(const Environment& env) const -> RouteResult;
	auto call(const Environment& env) const -> Response::Finished;

	auto name() const noexcept -> const std::string& { return app_name; }
	auto patterns() const noexcept -> PatternCache& { return cache; }

private:
	template <typename Block>
	static auto wrap(Block block) -> Route
	{
		return [block = std::move(block)](Request& r) {
			using Result = std::invoke_result_t<const Block&, Request&>;
			if constexpr (std::is_void_v<Result>)
				block(r);
			else
				handler::apply_result(r.response(), block(r));
		};
	}

	const std::string app_name;
	const Route block;
	mutable PatternCache cache;
	mutable std::atomic<std::uint64_t> last_request{ 0 };
};

auto operator<<(std::ostream& stream, Application::RouteResult::State state) -> std::ostream&;
}
