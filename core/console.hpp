#pragma once
#include "dispatcher.hpp"
#include "logger_imp.hpp"
#include "parameters.hpp"
#include "string_view.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/core/noncopyable.hpp>
#include <istream>
#include <memory>
#include <ostream>
#include <thread>

namespace switchyard
{
class Options;

// Front end of the executable: owns the live route table and answers requests
class Console: boost::noncopyable
{
public:
	// throws on the first load failure
	Console(Parameters params, std::shared_ptr<const ActionRegistry> registry);
	~Console();

	auto check(std::ostream& out) const -> void;
	// false on a routing miss
	auto resolve(string_view method, string_view path, std::ostream& out) -> bool;
	// Serves commands until end of input, SIGHUP reloads meanwhile
	auto run(std::istream& in, std::ostream& out) -> void;
	// Keeps the current table if anything goes wrong
	auto reload(Logger& lg) -> bool;

private:
	auto load_options(Logger& lg) const -> std::unique_ptr<Options>;
	auto command(string_view line, std::ostream& out) -> void;
	auto reverse_command(std::istream& words, std::ostream& out) const -> void;
	auto wait_reload() -> void;
	auto stop_signals() noexcept -> void;

	const Parameters params;
	ComponentLogger lg{ "console" };
	ComponentLogger signal_lg{ "reload" };
	Dispatcher dispatcher;
	boost::asio::io_context signal_ctx;
	boost::asio::signal_set reload_signals;
	std::thread signal_thread;
};
}
