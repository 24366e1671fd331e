#include "options.hpp"
#include "route_script.hpp"
#include <set>
#include <unordered_map>

namespace twig
{
using std::string;

namespace
{
auto parse_msg_dest(const string& s) -> decltype(Options::LogTypes::MessagesLog::dest)
{
	if (s == "console")
		return Options::LogTypes::Console{};
	return Options::LogTypes::File{ s };
}

auto parse_access_dest(const string& s) -> decltype(Options::LogTypes::AccessLog::dest)
{
	if (s == "null")
		return Options::LogTypes::Null{};
	if (s == "console")
		return Options::LogTypes::Console{};
	return Options::LogTypes::File{ s };
}

auto parse_severity(const string& s) -> Options::LogTypes::Severity
{
	using Severity = Options::LogTypes::Severity;
	static const std::unordered_map<string, Severity> severities = {
		{ "error",   Severity::error },
		{ "warning", Severity::warning },
		{ "info",    Severity::info },
		{ "debug",   Severity::debug },
		{ "trace",   Severity::trace },
	};

	auto it = severities.find(s);
	if (it == severities.end())
		throw Options::Error{ "unknown severity: " + s };
	return it->second;
}
}

Options::Options(const std::vector<script::Setting>& settings)
{
	std::set<string> seen;
	for (auto& setting : settings) {
		auto& key = setting.key;
		auto& value = setting.value;
		if (!seen.insert(key).second)
			throw Error{ "duplicate key: " + key };

		if (key == "name") {
			if (value.empty())
				throw Error{ "empty application name" };
			name = value;
		} else if (key == "log.level") {
			log.messages.level = parse_severity(value);
		} else if (key == "log.messages") {
			log.messages.dest = parse_msg_dest(value);
		} else if (key == "log.access") {
			log.access.dest = parse_access_dest(value);
		} else {
			throw Error{ "unknown key: " + key };
		}
	}
}
}
