#pragma once
#include "application.hpp"
#include "logger_imp.hpp"
#include <boost/core/noncopyable.hpp>
#include <boost/filesystem/path.hpp>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace twig
{
struct Parameters;
class RouteTree;

// Loads the route script, sets up logging and resolves the requested paths.
class Manager: boost::noncopyable
{
public:
	explicit Manager(const Parameters& params);
	~Manager();

	auto resolve(const std::string& path) -> Application::RouteResult;
	// Prints "STATUS<TAB>path<TAB>body" per path, returns false if
	// any path failed with a routing error.
	auto run(std::ostream& out) -> bool;

private:
	GlobalLogger lg;
	const boost::filesystem::path config_path;
	const std::string method;
	const std::string script_name;
	const std::vector<std::string> paths;
	std::shared_ptr<const RouteTree> routes;
	std::unique_ptr<const Application> app;
};
}
