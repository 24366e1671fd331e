#include "resolver.hpp"
#include "error.hpp"
#include "logger_imp.hpp"

namespace twig
{
auto Resolver::resolve(const Environment& env) const -> Application::RouteResult
{
	try {
		return app.route(env);
	} catch (Error& e) {
		ApplicationLogger lg{ app.name() };
		lg.error(env.method, " ", env.script_name, env.path_info, ": ", e.what());

		Response response;
		response.status = 500;
		response.write(status_string(500));
		return { Application::RouteResult::State::failed, response.finish() };
	}
}
}
