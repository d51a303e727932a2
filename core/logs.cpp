#include "logs.hpp"
#include "logger_imp.hpp"
#include "options.hpp"
#include "string_view.hpp"
#include <boost/log/core/core.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/expressions/keyword.hpp>
#include <boost/log/expressions/message.hpp>
#include <boost/log/expressions/formatters/if.hpp>
#include <boost/log/expressions/formatters/stream.hpp>
#include <boost/log/expressions/predicates/has_attr.hpp>
#include <boost/phoenix/operator.hpp>
#include <array>
#include <iostream>
#include <stdexcept>
#include <string>

namespace switchyard
{
Logger::Severity log_severity_level = Logger::Severity::info;

constexpr std::array severity_strings = {
	"!!! "sv,
	"ERR "sv,
	"WRN "sv,
	"INF "sv,
	"DBG "sv,
	"TRC "sv,
};

static std::ostream& operator<<(std::ostream& s, Logger::Severity sev)
{
	return s << severity_strings[static_cast<int>(sev)];
}

static std::ostream& operator<<(std::ostream& s, LoggerImp::Message msg)
{
	for (auto c = msg.first; c; c = c->next)
		c->print(s);
	return s;
}

namespace
{
static_assert(severity_strings[static_cast<int>(Logger::Severity::error)] == "ERR "sv);
static_assert(severity_strings[static_cast<int>(Logger::Severity::trace)] == "TRC "sv);

Logger::Severity convert(Options::LogTypes::Severity s)
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
	return lg::error;
}

BOOST_LOG_ATTRIBUTE_KEYWORD(kw_lazymessage, LoggerImp::attr_name.lazy_message,
	LoggerImp::Message)
BOOST_LOG_ATTRIBUTE_KEYWORD(kw_severity, LoggerImp::attr_name.severity, Logger::Severity)
BOOST_LOG_ATTRIBUTE_KEYWORD(kw_component, LoggerImp::attr_name.component, string_view)

template <typename Fmt>
struct SinkAdder
{
	explicit SinkAdder(Fmt fmt): fmt{ fmt } {}

	void operator()(const Options::LogTypes::Console&) const
	{
		boost::log::add_console_log(std::clog, fmt);
	}
	void operator()(const Options::LogTypes::File& f) const
	{
		using namespace boost::log;

		add_file_log(
			keywords::file_name = f.path,
			keywords::auto_flush = true,
			fmt
		);
	}
	Fmt fmt;
};

void add_messages_sink(const Options::LogTypes::MessagesLog& log)
{
	using namespace boost::log;

	visit(SinkAdder{
		keywords::format = expressions::stream
			<< kw_severity
			<< expressions::if_(expressions::has_attr(kw_component))
			[
				expressions::stream << "[" << kw_component << "] "
			]
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
	boost::log::core::get()->remove_all_sinks();
	add_messages_sink(startup_log);
}

void logs::init(const Options& opt)
{
	log_severity_level = convert(opt.log.level);

	if (log_severity_level > Logger::severity_barrier)
		throw std::runtime_error{ "requested log level ("
			+ std::to_string(static_cast<int>(log_severity_level))
			+ ") is too high, supported: "
			+ std::to_string(SWITCHYARD_LOG_LEVEL) };

	boost::log::core::get()->remove_all_sinks();
	add_messages_sink(opt.log);
}
}
