#include "options.hpp"
#include "config.hpp"
#include <unordered_map>

using std::string;

namespace switchyard
{
namespace
{
decltype(Options::LogTypes::MessagesLog::dest) parse_msg_dest(const string& s,
	const std::filesystem::path& base_dir)
{
	if (s == "console")
		return Options::LogTypes::Console{};
	std::filesystem::path p{ s };
	return Options::LogTypes::File{ (p.is_relative() ? base_dir / p : p).string() };
}

Options::LogTypes::Severity parse_severity(const string& s)
{
	using severity = Options::LogTypes::Severity;
	static const std::unordered_map<string, severity> severities = {
		{ "error",   severity::error },
		{ "warning", severity::warning },
		{ "info",    severity::info },
		{ "debug",   severity::debug },
		{ "trace",   severity::trace },
	};

	auto it = severities.find(s);
	if (it == severities.end())
		throw Options::Error{ "unknown severity: " + s };
	return it->second;
}
}

Options::Options(const config::Table& config, const std::filesystem::path& base_dir)
{
	using namespace config;

	if (auto& routes_it = config["routes"]; routes_it) {
		std::filesystem::path p{ routes_it.as<String>() };
		routes_path = p.is_relative() ? base_dir / p : p;
	}

	if (auto& prefix_it = config["prefix"]; prefix_it)
		prefix = prefix_it.as<String>();

	lint_shadowed = config["lint.shadowed"].get_or(true);

	if (auto& log_messages_it = config["log.messages"]; log_messages_it)
		log.dest = parse_msg_dest(log_messages_it.as<String>(), base_dir);

	if (auto& log_level_it = config["log.level"]; log_level_it)
		log.level = parse_severity(log_level_it.as<String>());

	config.throw_on_unknown_key();
}
}
