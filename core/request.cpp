#include "request.hpp"
#include "application.hpp"
#include "error.hpp"
#include "logger.hpp"
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/range/algorithm/find.hpp>

namespace twig
{
Request::Request(const Environment& env, Response& response, PatternCache& patterns, Logger& lg):
	env{ env },
	resp{ response },
	lg{ lg },
	cursor{ env.path_info },
	ctx{ cursor, captures, patterns, lg }
{
}

void Request::halt()
{
	halt(resp.finish());
}

void Request::halt(Response::Finished finished)
{
	throw Halt{ std::move(finished) };
}

void Request::redirect()
{
	if (is_get())
		throw RedirectError{ "must provide path argument to redirect for GET requests" };
	redirect(path());
}

void Request::redirect(std::string path, int status)
{
	lg.debug("redirect to ", path, " with ", status);
	resp.redirect(std::move(path), status);
	halt();
}

void Request::run(const Application& app)
{
	const Environment mounted{
		env.method,
		env.script_name + std::string{ cursor.consumed() },
		std::string{ cursor.remaining() },
	};
	lg.debug("run ", app.name(), " at ", mounted.script_name);
	halt(app.call(mounted));
}

auto Request::method_is(std::vector<std::string> names) const -> Matcher
{
	for (auto& name : names)
		boost::algorithm::to_upper(name);

	return predicate([&method = env.method, names = std::move(names)] {
		return boost::range::find(names, method) != names.end();
	});
}

auto Request::is_method(string_view name) const -> bool
{
	return env.method == name;
}

auto Request::path() const -> std::string
{
	return env.script_name + env.path_info;
}

auto Request::matched_path() const -> std::string
{
	return env.script_name + std::string{ cursor.consumed() };
}
}
