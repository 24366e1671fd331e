#include "manager.hpp"
#include "logs.hpp"
#include "options.hpp"
#include "parameters.hpp"
#include "resolver.hpp"
#include "route_script.hpp"
#include "route_tree.hpp"

namespace twig
{
Manager::Manager(const Parameters& params):
	config_path{ params.config_path },
	method{ params.method },
	script_name{ params.script_name },
	paths{ params.paths }
{
	lg.debug("loading route script ", config_path);

	auto script = script::parse(std::make_shared<script::File>(config_path));
	const Options opts{ script.settings };
	logs::init(opts);

	routes = script.routes;
	app = std::make_unique<const Application>(opts.name,
		[routes = routes](Request& r) { (*routes)(r); });

	lg.trace("manager created");
	lg.debug("application ", app->name(), ", ", routes->nodes().size(), " top level routes");
}

Manager::~Manager()
{
	lg.trace("manager destroyed");
}

auto Manager::resolve(const std::string& path) -> Application::RouteResult
{
	return Resolver{ *app }.resolve({ method, script_name, path });
}

auto Manager::run(std::ostream& out) -> bool
{
	if (paths.empty())
		lg.warning("no paths to resolve");

	auto n_failed = 0;
	for (auto& path : paths) {
		const auto result = resolve(path);
		if (result.state == Application::RouteResult::State::failed)
			++n_failed;
		out << result.response.status << '\t' << path << '\t'
			<< result.response.body_text() << '\n';
	}

	if (n_failed)
		lg.error(n_failed, " of ", paths.size(), " paths failed");
	return n_failed == 0;
}
}
