#include "console.hpp"
#include "config.hpp"
#include "config_parser.hpp"
#include "loader.hpp"
#include "logs.hpp"
#include "options.hpp"
#include "route_table.hpp"
#include "source.hpp"
#include "visitor.hpp"
#include <boost/algorithm/string/predicate.hpp>
#include <boost/asio/post.hpp>
#include <csignal>
#include <filesystem>
#include <future>
#include <sstream>
#include <string>

namespace switchyard
{
namespace
{
auto print(std::ostream& out, const Outcome& outcome)
{
	visit(Visitor{
		[&out](const Handled& h)
		{
			out << "200 " << h.action << '\n' << h.output << '\n';
		},
		[&out](const NotFound& nf)
		{
			out << "404 " << nf << '\n';
		},
		[&out](const Unbound& u)
		{
			out << "501 no handler for " << u.action << ' ' << u.params << '\n';
		},
	}, outcome);
}

auto trim(string_view s) noexcept
{
	auto blank = [](char c) { return c == ' ' || c == '\t' || c == '\r'; };
	while (!s.empty() && blank(s.front()))
		s.remove_prefix(1);
	while (!s.empty() && blank(s.back()))
		s.remove_suffix(1);
	return s;
}

auto load_table(const Options& opts, Logger& lg)
{
	return std::make_shared<const RouteTable>(
		load_file(opts.routes_path, opts.prefix, lg, opts.lint_shadowed));
}
}

Console::Console(Parameters params, std::shared_ptr<const ActionRegistry> registry):
	params{ std::move(params) },
	dispatcher{ std::move(registry) },
	signal_ctx{ 1 },
	reload_signals{ signal_ctx, SIGHUP }
{
	auto opts = load_options(lg);
	logs::init(*opts);
	lg.debug("config_path ", this->params.config_path);
	dispatcher.publish(load_table(*opts, lg));

	lg.trace("console created");
}

Console::~Console()
{
	stop_signals();
	lg.trace("console destroyed");
}

auto Console::load_options(Logger& lg) const -> std::unique_ptr<Options>
{
	std::unique_ptr<Options> opts;
	auto& path = params.config_path;
	if (params.config_required || std::filesystem::exists(path)) {
		auto config = config::parse(Source::read(path));
		lg.debug("config ", path, ": ", config);
		opts = std::make_unique<Options>(config, path.parent_path());
	} else {
		lg.debug("no config at ", path, ", using defaults");
		opts = std::make_unique<Options>();
	}

	if (params.routes)
		opts->routes_path = *params.routes;
	if (params.prefix)
		opts->prefix = *params.prefix;
	return opts;
}

auto Console::check(std::ostream& out) const -> void
{
	auto table = dispatcher.table();
	out << table->size() << " routes, prefix '" << table->prefix() << "'\n";
	for (auto& route : *table)
		out << route << " (line " << route.line() << ")\n";
	for (auto& s : find_shadowed(*table))
		out << "shadowed: " << *s.route << " by " << *s.by << '\n';
}

auto Console::resolve(string_view method, string_view path, std::ostream& out) -> bool
{
	auto outcome = dispatcher.dispatch(method, path, lg);
	print(out, outcome);
	return !std::holds_alternative<NotFound>(outcome);
}

auto Console::run(std::istream& in, std::ostream& out) -> void
{
	lg.trace("console started");

	wait_reload();
	signal_thread = std::thread{ [this] { signal_ctx.run(); } };

	for (std::string line; std::getline(in, line);) {
		auto cmd = trim(line);
		if (cmd.empty() || cmd.front() == '#')
			continue;
		command(cmd, out);
		out.flush();
	}

	stop_signals();
	lg.trace("console finished");
}

auto Console::reload(Logger& lg) -> bool
{
	lg.debug("reloading routes");

	try {
		auto opts = load_options(lg);
		auto table = load_table(*opts, lg);
		logs::init(*opts);
		dispatcher.publish(table);
		lg.info("reload: ", table->size(), " routes active");
		return true;
	} catch (std::exception& e) {
		lg.warning("reload failed, keeping previous routes: ", e.what());
		return false;
	}
}

auto Console::command(string_view line, std::ostream& out) -> void
{
	std::istringstream words{ std::string{ line } };
	std::string verb;
	words >> verb;

	if (boost::algorithm::iequals(verb, "RELOAD")) {
		// reloads run on the signal thread only, one at a time
		std::packaged_task<bool()> task{ [this] { return reload(signal_lg); } };
		auto reloaded = task.get_future();
		boost::asio::post(signal_ctx, std::move(task));
		if (reloaded.get())
			out << "reloaded " << dispatcher.table()->size() << " routes\n";
		else
			out << "reload failed\n";
		return;
	}

	if (boost::algorithm::iequals(verb, "REVERSE")) {
		reverse_command(words, out);
		return;
	}

	std::string path, extra;
	if (!(words >> path) || words >> extra) {
		out << "400 expecting METHOD PATH\n";
		return;
	}
	resolve(verb, path, out);
}

auto Console::reverse_command(std::istream& words, std::ostream& out) const -> void
{
	std::string action;
	if (!(words >> action)) {
		out << "400 expecting REVERSE Controller.method [key=value...]\n";
		return;
	}

	Params args;
	for (std::string arg; words >> arg;) {
		auto eq = arg.find('=');
		if (eq == std::string::npos || eq == 0) {
			out << "400 expecting key=value, got: " << arg << '\n';
			return;
		}
		args.add(arg.substr(0, eq), arg.substr(eq + 1));
	}

	if (auto r = reverse(*dispatcher.table(), action, args))
		out << "200 " << r->method << ' ' << r->url << '\n';
	else
		out << "404 no route for " << action << ' ' << args << '\n';
}

auto Console::wait_reload() -> void
{
	reload_signals.async_wait([this](const boost::system::error_code& ec, int sig)
	{
		if (ec)
			return;
		signal_lg.info("caught signal #", sig);
		reload(signal_lg);
		wait_reload();
	});
}

auto Console::stop_signals() noexcept -> void
{
	signal_ctx.stop();
	if (signal_thread.joinable())
		signal_thread.join();
}
}
