#pragma once
#include <boost/core/noncopyable.hpp>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace twig
{
namespace script
{
struct Setting;
}

class Options: boost::noncopyable
{
public:
	struct Error: std::runtime_error
	{
		explicit Error(const std::string& s):
			runtime_error("options error: " + s) {}
	};

	struct LogTypes
	{
		enum class Severity {
			error,
			warning,
			info,
			debug,
			trace,
		};

		struct Null {};
		struct Console {};
		struct File { std::string path; };

		struct MessagesLog
		{
			std::variant<Console, File> dest;
			Severity level = Severity::info;
		};
		struct AccessLog
		{
			std::variant<Console, File, Null> dest;
		};
		struct Logs
		{
			MessagesLog messages;
			AccessLog access;
		};
	};

	Options() = default;
	explicit Options(const std::vector<script::Setting>& settings);

	std::string name = "twig";
	LogTypes::Logs log = {
		{ LogTypes::Console{}, LogTypes::Severity::info },
		{ LogTypes::Null{} }
	};
};
}
