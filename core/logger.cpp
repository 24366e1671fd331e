#include "logger.hpp"
#include "logger_imp.hpp"

namespace twig
{
namespace
{
auto impl(Logger* lg) -> LoggerImp*
{
	return static_cast<LoggerImp*>(lg);
}
}

bool Logger::open(Severity s)
{
	if (s > logs::severity_level)
		return false;

	return impl(this)->open_message(s);
}

void Logger::push(const BasePrinter& p) noexcept
{
	impl(this)->push(p);
}

void Logger::commit()
{
	impl(this)->finalize();
}
}
