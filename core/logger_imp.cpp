#include "logger_imp.hpp"
#include <boost/log/attributes/attribute_value_impl.hpp>
#include <boost/log/attributes/clock.hpp>

namespace twig
{
using boost::log::attributes::make_attribute_value;

const LoggerImp::AttrName LoggerImp::attr_name{};

namespace
{
const boost::log::attributes::local_clock clock_attr{};
}

auto LoggerImp::add(const boost::log::attribute_name& name,
	const boost::log::attribute& attr) -> Attribute
{
	return lg.add_attribute(name, attr).first;
}

auto LoggerImp::open_internal() -> bool
{
	rec = lg.open_record();
	if (!rec)
		return false;

	insert_attributes();
	msg = {};
	return true;
}

auto LoggerImp::open_message(Severity s) -> bool
{
	if (!open_internal())
		return false;
	attributes().insert(attr_name.severity, make_attribute_value(s));
	return true;
}

auto LoggerImp::open_access() -> bool
{
	if (!open_internal())
		return false;
	attributes().insert(attr_name.time, clock_attr.get_value());
	return true;
}

void LoggerImp::push(const BasePrinter& p) noexcept
{
	if (!msg.first)
		msg.first = &p;
	if (msg.last)
		msg.last->next = &p;
	msg.last = &p;
}

void LoggerImp::finalize()
{
	attributes().insert(attr_name.lazy_message, make_attribute_value(msg));
	lg.push_record(std::move(rec));
}

void ApplicationLogger::insert_attributes()
{
	GlobalLogger::insert_attributes();

	if (!name.empty())
		attributes().insert(attr_name.application, make_attribute_value(name));
}

void RequestLogger::insert_attributes()
{
	ApplicationLogger::insert_attributes();

	attributes().insert(attr_name.request, make_attribute_value(id));
	attributes().insert(attr_name.method, make_attribute_value(std::string{ method }));
	attributes().insert(attr_name.path, make_attribute_value(std::string{ path }));
}

LoggerImp::AttrName::AttrName():
	lazy_message{ "LazyMessage" },
	time{ "TimeStamp" },
	severity{ "Severity" },
	application{ "Application" },
	request{ "RequestID" },
	method{ "Method" },
	path{ "Path" }
{
}
}
