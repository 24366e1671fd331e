#pragma once
#include <string>

namespace twig
{
struct Environment
{
	std::string method;
	// Prefix already routed by enclosing applications.
	std::string script_name;
	std::string path_info;
};
}
