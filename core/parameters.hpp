#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace switchyard
{
// What the command line asked for; overrides the config file
struct Parameters
{
	std::filesystem::path config_path;
	bool config_required = false;
	std::optional<std::string> routes;
	std::optional<std::string> prefix;
	bool check = false;
	// METHOD PATH, empty for the interactive mode
	std::vector<std::string> request;
};
}
