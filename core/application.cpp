#include "application.hpp"
#include "halt.hpp"
#include "logger_imp.hpp"
#include <ostream>

namespace twig
{
Application::Application(std::string name, Route route):
	app_name{ std::move(name) },
	block{ std::move(route) }
{
}

auto Application::route(const Environment& env) const -> RouteResult
{
	const auto full_path = env.script_name + env.path_info;
	RequestLogger lg{ app_name, ++last_request, env.method, full_path };

	Response response;
	Request r{ env, response, cache, lg };

	lg.trace("routing \"", env.path_info, "\"");
	RouteResult result{ RouteResult::State::exhausted, {} };
	try {
		if (block)
			block(r);
		result.response = response.finish();
		lg.debug("no route matched, ", result.response);
	} catch (Halt& halt) {
		result = { RouteResult::State::matched, std::move(halt.result) };
		lg.debug("halted, ", result.response);
	}

	lg.access(env.method, " ", full_path, " ", result.response.status, " ", result.state);
	return result;
}

auto Application::call(const Environment& env) const -> Response::Finished
{
	return route(env).response;
}

auto operator<<(std::ostream& stream, Application::RouteResult::State state) -> std::ostream&
{
	switch (state) {
	case Application::RouteResult::State::matched: return stream << "matched";
	case Application::RouteResult::State::exhausted: return stream << "exhausted";
	case Application::RouteResult::State::failed: return stream << "failed";
	}
	return stream << static_cast<int>(state);
}
}
