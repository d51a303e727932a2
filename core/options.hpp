#pragma once
#include <boost/core/noncopyable.hpp>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <variant>

namespace switchyard
{
namespace config
{
class Table;
}

class Options: boost::noncopyable
{
public:
	struct Error: std::runtime_error
	{
		explicit Error(const std::string& s):
			runtime_error("options error: " + s) {}
	};

	struct LogTypes
	{
		enum class Severity {
			error,
			warning,
			info,
			debug,
			trace,
		};

		struct Console {};
		struct File { std::string path; };

		struct MessagesLog
		{
			std::variant<Console, File> dest;
			Severity level = Severity::info;
		};
	};

	Options() = default;
	// relative paths in config are taken from base_dir
	Options(const config::Table& config, const std::filesystem::path& base_dir);

	std::filesystem::path routes_path = "routes.conf";
	std::string prefix;
	bool lint_shadowed = true;
	LogTypes::MessagesLog log = { LogTypes::Console{}, LogTypes::Severity::info };
};
}
