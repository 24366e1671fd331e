#include "logs.hpp"
#include "logger_imp.hpp"
#include "options.hpp"
#include "string_view.hpp"
#include <boost/assert.hpp>
#include <boost/log/attributes/clock.hpp>
#include <boost/log/core/core.hpp>
#include <boost/log/expressions/formatters/date_time.hpp>
#include <boost/log/expressions/formatters/if.hpp>
#include <boost/log/expressions/formatters/stream.hpp>
#include <boost/log/expressions/keyword.hpp>
#include <boost/log/expressions/message.hpp>
#include <boost/log/expressions/predicates/has_attr.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/phoenix/operator.hpp>
#include <array>
#include <iostream>
#include <stdexcept>
#include <string>

namespace twig
{
Logger::Severity logs::severity_level = Logger::Severity::info;
bool logs::access_enabled = false;

namespace
{
constexpr std::array severity_strings = {
	"!!! "sv,
	"ERR "sv,
	"WRN "sv,
	"INF "sv,
	"DBG "sv,
	"TRC "sv,
};

static_assert(severity_strings[static_cast<int>(Logger::Severity::error)] == "ERR "sv);
static_assert(severity_strings[static_cast<int>(Logger::Severity::trace)] == "TRC "sv);
}

static auto operator<<(std::ostream& s, Logger::Severity sev) -> std::ostream&
{
	return s << severity_strings[static_cast<int>(sev)];
}

static auto operator<<(std::ostream& s, LoggerImp::Message msg) -> std::ostream&
{
	for (auto p = msg.first; p; p = p->next)
		p->print(s);
	return s;
}

namespace
{
auto convert(Options::LogTypes::Severity s) -> Logger::Severity
{
	using opt = Options::LogTypes::Severity;
	using lg = Logger::Severity;
	switch (s) {
	case opt::trace: return lg::trace;
	case opt::debug: return lg::debug;
	case opt::info: return lg::info;
	case opt::warning: return lg::warning;
	case opt::error: return lg::error;
	}
	BOOST_ASSERT(0);
	return lg::error;
}

BOOST_LOG_ATTRIBUTE_KEYWORD(kw_lazymessage, LoggerImp::attr_name.lazy_message,
	LoggerImp::Message)
BOOST_LOG_ATTRIBUTE_KEYWORD(kw_severity, LoggerImp::attr_name.severity, Logger::Severity)
BOOST_LOG_ATTRIBUTE_KEYWORD(kw_application, LoggerImp::attr_name.application, std::string)
BOOST_LOG_ATTRIBUTE_KEYWORD(kw_request, LoggerImp::attr_name.request, RequestIdent)
BOOST_LOG_ATTRIBUTE_KEYWORD(kw_method, LoggerImp::attr_name.method, std::string)
BOOST_LOG_ATTRIBUTE_KEYWORD(kw_path, LoggerImp::attr_name.path, std::string)
BOOST_LOG_ATTRIBUTE_KEYWORD(kw_time, LoggerImp::attr_name.time,
	boost::log::attributes::local_clock::value_type)

template <typename Filter, typename Fmt>
struct LogAdder
{
	LogAdder(Filter filter, Fmt fmt): filter{ filter }, fmt{ fmt } {}

	bool operator()(const Options::LogTypes::Null&) const { return false; }
	bool operator()(const Options::LogTypes::Console&) const
	{
		boost::log::add_console_log(std::clog, filter, fmt);
		return true;
	}
	bool operator()(const Options::LogTypes::File& f) const
	{
		using namespace boost::log;

		add_file_log(
			keywords::file_name = f.path,
			keywords::open_mode = std::ios_base::app | std::ios_base::out,
			keywords::auto_flush = true,
			filter,
			fmt
		);
		return true;
	}

	Filter filter;
	Fmt fmt;
};

bool add_messages_sink(const Options::LogTypes::MessagesLog& log)
{
	using namespace boost::log;

	return visit(LogAdder{
		keywords::filter =
			!expressions::has_attr(kw_time),
		keywords::format = expressions::stream
			<< kw_severity
			<< expressions::if_(expressions::has_attr(kw_application))
			[
				expressions::stream << "[" << kw_application << "] "
			]
			<< expressions::if_(expressions::has_attr(kw_request))
			[
				expressions::stream << "#" << kw_request << " "
				<< kw_method << " " << kw_path << ": "
			]
			<< kw_lazymessage
		}, log.dest);
}

bool add_access_sink(const Options::LogTypes::AccessLog& log)
{
	using namespace boost::log;

	return visit(LogAdder{
		keywords::filter =
			expressions::has_attr(kw_time),
		keywords::format = expressions::stream
			<< expressions::format_date_time(kw_time, "%y-%m-%d %T") << " "
			<< kw_application << " "
			<< "#" << kw_request << " "
			<< kw_lazymessage
		}, log.dest);
}
}

void logs::preinit()
{
	const Options::LogTypes::MessagesLog startup_log{
		Options::LogTypes::Console{},
		Options::LogTypes::Severity::info
	};
	add_messages_sink(startup_log);
}

void logs::init(const Options& opt)
{
	severity_level = convert(opt.log.messages.level);

	if (severity_level > Logger::compiled_level)
		throw std::runtime_error{ "requested log level ("
			+ std::to_string(static_cast<int>(severity_level))
			+ ") is too high, supported: "
			+ std::to_string(TWIG_LOG_LEVEL) };

	boost::log::core::get()->remove_all_sinks();

	add_messages_sink(opt.log.messages);
	access_enabled = add_access_sink(opt.log.access);
}
}
