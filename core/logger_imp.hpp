#pragma once
#include "logger.hpp"
#include "string_view.hpp"
#include <boost/core/noncopyable.hpp>
#include <boost/log/core/record.hpp>
#include <boost/log/sources/logger.hpp>

namespace switchyard
{
class LoggerImp: public Logger, boost::noncopyable
{
public:
	struct AttrName
	{
		AttrName();

		boost::log::attribute_name lazy_message;
		boost::log::attribute_name severity;
		boost::log::attribute_name component;
	};

	struct Message
	{
		BasePrinter* first;
		BasePrinter* last;
	};

	LoggerImp() = default;
	LoggerImp(const LoggerImp& rhs) = delete;
	virtual ~LoggerImp() = default;

	LoggerImp& operator=(const LoggerImp&) = delete;

	auto open_message(Severity s) -> bool;
	void push(BasePrinter& c) noexcept;
	void finalize();

	static const AttrName attr_name;

protected:
	virtual void insert_attributes() = 0;

	boost::log::attribute_value_set& attributes() noexcept
	{
		return rec.attribute_values();
	}

private:
	boost::log::sources::logger lg;
	boost::log::record rec;
	Message msg{};
};

// Not thread-safe: every thread owns its loggers
struct ComponentLogger: LoggerImp
{
	explicit ComponentLogger(string_view name = {}) noexcept:
		name{ name }
	{}

	void insert_attributes() override;

	const string_view name;
};
}
