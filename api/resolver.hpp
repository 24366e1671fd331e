#pragma once
#include "application.hpp"
#include "environment.hpp"
#include "response.hpp"

namespace twig
{
// Runs requests against an application. Routing errors become a
// "500 Internal Server Error" response and are logged, other exceptions
// propagate.
class Resolver
{
public:
	explicit Resolver(const Application& app) noexcept: app{ app } {}

	auto resolve(const Environment& env) const -> Application::RouteResult;

private:
	const Application& app;
};
}
