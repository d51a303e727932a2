#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

namespace switchyard
{
struct Error: std::runtime_error
{
	explicit Error(const std::string& msg):
		runtime_error{ msg } {}
};

// Route source can't be read or contains a bad declaration
class LoadError: public Error
{
public:
	using Position = std::size_t;

	LoadError(Position line, Position column, const std::string& what):
		Error{ what },
		ln{ line },
		col{ column }
	{}

	explicit LoadError(const std::string& what):
		LoadError{ 0, 0, what } {}

	// 1-based, 0 when the error concerns the whole source
	auto line() const noexcept -> Position { return ln; }
	auto column() const noexcept -> Position { return col; }

private:
	const Position ln;
	const Position col;
};

class PatternError: public Error
{
public:
	using Position = std::size_t;

	PatternError(Position where, const std::string& what):
		Error{ what },
		pos{ where }
	{}

	// offset inside the path template
	auto where() const noexcept -> Position { return pos; }

private:
	const Position pos;
};
}
