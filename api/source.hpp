#pragma once
#include "error.hpp"
#include "string_view.hpp"
#include <boost/core/noncopyable.hpp>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <utility>

namespace switchyard
{
// Text being parsed, with position-aware diagnostics
class Source: boost::noncopyable
{
public:
	using Iterator = string_view::const_iterator;

	explicit Source(std::string data, std::string name = {});
	~Source();

	// throws LoadError
	static auto read(const std::filesystem::path& path) -> std::shared_ptr<const Source>;

	auto name() const noexcept -> const std::string&;
	auto text() const noexcept -> string_view;

	// 1-based line and column
	auto location(Iterator where) const -> std::pair<std::size_t, std::size_t>;
	auto describe(Iterator where, const std::string& msg) const -> std::string;
	auto error(Iterator where, const std::string& msg) const -> LoadError;

private:
	struct Priv;
	const std::unique_ptr<Priv> p;
};
}
