#include "logger_imp.hpp"
#include <boost/log/attributes/attribute_value_impl.hpp>

namespace switchyard
{
using boost::log::attributes::make_attribute_value;

const LoggerImp::AttrName LoggerImp::attr_name{};

auto LoggerImp::open_message(Severity s) -> bool
{
	rec = lg.open_record();
	if (!rec)
		return false;

	insert_attributes();
	attributes().insert(attr_name.severity, make_attribute_value(s));
	msg = {};
	return true;
}

void LoggerImp::push(BasePrinter& c) noexcept
{
	const auto p = &c;
	if (!msg.first)
		msg.first = p;
	if (msg.last)
		msg.last->next = p;
	msg.last = p;
}

void LoggerImp::finalize()
{
	attributes().insert(attr_name.lazy_message, make_attribute_value(msg));
	lg.push_record(std::move(rec));
}

void ComponentLogger::insert_attributes()
{
	if (!name.empty())
		attributes().insert(attr_name.component, make_attribute_value(name));
}

LoggerImp::AttrName::AttrName():
	lazy_message{ "LazyMessage" },
	severity{ "Severity" },
	component{ "Component" }
{
}

namespace
{
LoggerImp* impl(Logger* lg)
{
	return static_cast<LoggerImp*>(lg);
}
}

bool Logger::open(Severity s)
{
	extern Severity log_severity_level;

	if (s > log_severity_level)
		return false;

	return impl(this)->open_message(s);
}

void Logger::push(BasePrinter& c) noexcept
{
	impl(this)->push(c);
}

template <> void Logger::log1<>()
{
	impl(this)->finalize();
}
}
