#include "cmdline_parser.hpp"
#include "parameters.hpp"
#include "logs.hpp"
#include "manager.hpp"
#include <iostream>
#include <exception>

namespace
{
struct RequestToQuit : std::exception {};

auto make_parameters(int argc, char *argv[])
{
	const auto parser = twig::CommandLineParser{};
	const auto cmdline = parser.parse(argc, argv);
	if (cmdline.has("help")) {
		parser.print_options(std::cerr);
		throw RequestToQuit{};
	}
	if (cmdline.has("version")) {
		std::cerr << "twig-resolve 0.1\n";
		throw RequestToQuit{};
	}

	return cmdline.to_parameters();
}
}

int main(int argc, char *argv[])
{
	try {
		auto params = make_parameters(argc, argv);

		twig::logs::preinit();
		twig::Manager man{ params };
		if (!man.run(std::cout))
			return 2;
	} catch(RequestToQuit&) {
		// nothing to do
	} catch(std::exception &error) {
		std::cerr << argv[0] << ": " << error.what() << std::endl;
		return 1;
	}
}
