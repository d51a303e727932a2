#include "cmdline_parser.hpp"
#include "parameters.hpp"
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/cmdline.hpp>
#include <vector>

#ifndef SWITCHYARD_CONFIG_PATH
# define SWITCHYARD_CONFIG_PATH ./switchyard.ini
#endif

namespace po = boost::program_options;

namespace switchyard
{
namespace
{
auto make_desc()
{
	po::options_description desc{ "Switchyard resolves requests against a route file. Usage:\n"
		"  switchyard [options] [METHOD PATH]\nOptions are" };
	desc.add_options()
		("config,c",
			po::value<std::string>()
				->value_name("path")
				->default_value(BOOST_STRINGIZE(SWITCHYARD_CONFIG_PATH)),
			"config file path")
		("routes,r", po::value<std::string>()->value_name("path"), "route file path")
		("prefix,p", po::value<std::string>()->value_name("prefix"), "servlet prefix")
		("check", "load the route file, print the table and exit")
		("help,h", "print help and exit")
		("version,v", "print version and exit");

	return desc;
}

auto make_hidden()
{
	po::options_description hidden;
	hidden.add_options()
		("request", po::value<std::vector<std::string>>(), "METHOD PATH");
	return hidden;
}
}

CommandLineParser::CommandLineParser():
	desc{ make_desc() },
	hidden{ make_hidden() }
{
	positional.add("request", 2);
}

auto CommandLineParser::parse(int argc, const char *const argv[]) const -> CommandLine
{
	namespace style = po::command_line_style;

	po::options_description all;
	all.add(desc).add(hidden);

	CommandLine result;
	auto options = po::command_line_parser{ argc, argv }
		.options(all)
		.positional(positional)
		.style(style::default_style & ~style::allow_guessing)
		.run();
	store(options, result.vars);
	notify(result.vars);

	if (result.has("request")) {
		if (result.vars["request"].as<std::vector<std::string>>().size() != 2)
			throw po::error{ "request needs both METHOD and PATH" };
		if (result.has("check"))
			throw po::error{ "--check can't be combined with a request" };
	}

	return result;
}

auto CommandLineParser::print_options(std::ostream &stream) const -> void
{
	stream << desc;
}

auto CommandLine::has(const std::string &parameter) const noexcept -> bool
{
	return vars.count(parameter) > 0;
}

auto CommandLine::to_parameters() const -> Parameters
{
	Parameters p;
	auto& config = vars["config"];
	p.config_path = config.as<std::string>();
	p.config_required = !config.defaulted();
	if (has("routes"))
		p.routes = vars["routes"].as<std::string>();
	if (has("prefix"))
		p.prefix = vars["prefix"].as<std::string>();
	p.check = has("check");
	if (has("request"))
		p.request = vars["request"].as<std::vector<std::string>>();

	return p;
}
}
