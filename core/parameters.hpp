#pragma once
#include <string>
#include <vector>

namespace twig
{
struct Parameters
{
	std::string config_path;
	std::string method;
	std::string script_name;
	std::vector<std::string> paths;
};
}
