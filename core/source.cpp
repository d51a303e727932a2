#define BOOST_SPIRIT_X3_NO_FILESYSTEM
#include "source.hpp"
#include <vector>
#include <boost/spirit/home/x3/support/utility/error_reporting.hpp>
#include <algorithm>
#include <fstream>
#include <system_error>
#include <sstream>

namespace switchyard
{
namespace
{
auto read_file(const std::filesystem::path& path)
{
	std::ifstream f{ path, std::ios::in | std::ios::binary | std::ios::ate };
	if (!f.is_open())
		throw LoadError{ "can't open file: " + path.string() };

	std::error_code ec;
	auto size = f.tellg();
	if (!std::filesystem::is_regular_file(path, ec) || size == std::streampos{ -1 })
		throw LoadError{ "can't read file: " + path.string() };

	f.seekg(0, std::ios::beg);
	std::string data(static_cast<std::size_t>(size), 0);
	if (!f.read(data.data(), size))
		throw LoadError{ "can't read file: " + path.string() };

	return data;
}
}

//TODO proper tab handling in column numbers
struct Source::Priv
{
	Priv(std::string text, std::string filename):
		name{ move(filename) },
		data{ move(text) },
		error_handler{ view().begin(), view().end(), error_stream, name }
	{
	}

	auto view() const noexcept -> string_view
	{
		return { data.data(), data.size() };
	}

	const std::string name;
	const std::string data;
	mutable std::stringstream error_stream{ std::ios::out };
	boost::spirit::x3::error_handler<Iterator> error_handler;
};

Source::Source(std::string data, std::string name):
	p{ std::make_unique<Priv>(move(data), move(name)) }
{
}

Source::~Source() = default;

auto Source::read(const std::filesystem::path& path) -> std::shared_ptr<const Source>
{
	return std::make_shared<Source>(read_file(path), path.string());
}

auto Source::name() const noexcept -> const std::string&
{
	return p->name;
}

auto Source::text() const noexcept -> string_view
{
	return p->view();
}

auto Source::location(Iterator where) const -> std::pair<std::size_t, std::size_t>
{
	auto first = text().begin();
	auto line = 1 + static_cast<std::size_t>(std::count(first, where, '\n'));
	auto line_start = where;
	while (line_start != first && *(line_start - 1) != '\n')
		--line_start;
	return { line, static_cast<std::size_t>(where - line_start) + 1 };
}

auto Source::describe(Iterator where, const std::string& msg) const -> std::string
{
	p->error_stream.str({});
	p->error_handler(where, msg);
	return p->error_stream.str();
}

auto Source::error(Iterator where, const std::string& msg) const -> LoadError
{
	auto [line, column] = location(where);
	return LoadError{ line, column, describe(where, msg) };
}
}
