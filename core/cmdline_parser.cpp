#include "cmdline_parser.hpp"
#include "parameters.hpp"
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/cmdline.hpp>
#include <vector>

#ifndef TWIG_CONFIG_PATH
# define TWIG_CONFIG_PATH ./routes.twig
#endif

namespace twig
{
namespace
{
namespace po = boost::program_options;

auto make_desc()
{
	po::options_description desc{ "twig-resolve routes request paths with a route script.\n"
		"Usage: twig-resolve [options] path...\nOptions are:" };
	desc.add_options()
		("config,c",
			po::value<std::string>()
				->value_name("path")
				->default_value(BOOST_STRINGIZE(TWIG_CONFIG_PATH)),
			"route script path")
		("method,m",
			po::value<std::string>()
				->value_name("name")
				->default_value("GET"),
			"request method")
		("script-name",
			po::value<std::string>()
				->value_name("prefix")
				->default_value(""),
			"path prefix already routed")
		("help,h", "print help and exit")
		("version,v", "print version and exit");

	return desc;
}

auto make_hidden()
{
	po::options_description desc;
	desc.add_options()
		("path", po::value<std::vector<std::string>>(), "request path");

	return desc;
}
}

CommandLineParser::CommandLineParser():
	desc{ make_desc() },
	hidden{ make_hidden() }
{
	positional.add("path", -1);
}

auto CommandLineParser::parse(int argc, const char *const argv[]) const -> CommandLine
{
	namespace style = po::command_line_style;

	po::options_description all;
	all.add(desc).add(hidden);

	CommandLine result;
	auto options = po::command_line_parser(argc, argv)
		.options(all)
		.positional(positional)
		.style(style::default_style & ~style::allow_guessing)
		.run();
	store(options, result.vars);
	notify(result.vars);

	return result;
}

auto CommandLineParser::print_options(std::ostream &stream) const -> void
{
	stream << desc;
}

auto CommandLine::has(const std::string &parameter) const noexcept -> bool
{
	return vars.count(parameter) > 0;
}

auto CommandLine::to_parameters() const -> Parameters
{
	Parameters p;
	p.config_path = vars["config"].as<std::string>();
	p.method = boost::algorithm::to_upper_copy(vars["method"].as<std::string>());
	p.script_name = vars["script-name"].as<std::string>();
	if (has("path"))
		p.paths = vars["path"].as<std::vector<std::string>>();

	return p;
}
}
