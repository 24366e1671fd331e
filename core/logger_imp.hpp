#pragma once
#include "logger.hpp"
#include "string_view.hpp"
#include <boost/core/noncopyable.hpp>
#include <boost/log/core/record.hpp>
#include <boost/log/sources/logger.hpp>
#include <cstdint>
#include <string>

namespace twig
{
using RequestIdent = std::uint64_t;

namespace logs
{
extern Logger::Severity severity_level;
extern bool access_enabled;
}

class LoggerImp: public Logger, boost::noncopyable
{
public:
	using Attribute = boost::log::attribute_set::iterator;

	struct AttrName
	{
		AttrName();

		boost::log::attribute_name lazy_message;
		boost::log::attribute_name time;
		boost::log::attribute_name severity;
		boost::log::attribute_name application;
		boost::log::attribute_name request;
		boost::log::attribute_name method;
		boost::log::attribute_name path;
	};

	struct Message
	{
		const BasePrinter* first;
		const BasePrinter* last;
	};

	LoggerImp() = default;
	virtual ~LoggerImp() = default;

	template <typename... Args> void access(const Args&... args)
	{
		if (logs::access_enabled && open_access())
			chain(args...);
	}

	auto add(const boost::log::attribute_name& name,
		const boost::log::attribute& attr) -> Attribute;
	// false when no sink accepts the record
	auto open_message(Severity s) -> bool;
	auto open_access() -> bool;
	void push(const BasePrinter& p) noexcept;
	void finalize();

	static const AttrName attr_name;

protected:
	virtual void insert_attributes() = 0;

	auto attributes() noexcept -> boost::log::attribute_value_set&
	{
		return rec.attribute_values();
	}

private:
	auto open_internal() -> bool;

	boost::log::sources::logger lg;
	boost::log::record rec;
	Message msg{};
};

struct GlobalLogger: LoggerImp
{
	void insert_attributes() override {}
};

struct ApplicationLogger: GlobalLogger
{
	explicit ApplicationLogger(std::string name):
		name{ std::move(name) }
	{}

	void insert_attributes() override;

	const std::string name;
};

struct RequestLogger: ApplicationLogger
{
	RequestLogger(std::string app, RequestIdent id,
		string_view method, string_view path):
		ApplicationLogger{ std::move(app) },
		id{ id },
		method{ method },
		path{ path }
	{}

	void insert_attributes() override;

	const RequestIdent id;
	const string_view method;
	const string_view path;
};
}
