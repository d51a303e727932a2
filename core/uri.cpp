#include "uri.hpp"
#include <cctype>

namespace switchyard
{
namespace
{
auto hex_value(char c) noexcept -> int
{
	if (c >= '0' && c <= '9')
		return c - '0';
	if (c >= 'a' && c <= 'f')
		return c - 'a' + 10;
	if (c >= 'A' && c <= 'F')
		return c - 'A' + 10;
	return -1;
}

auto unreserved(char c) noexcept -> bool
{
	return std::isalnum(static_cast<unsigned char>(c))
		|| c == '-' || c == '.' || c == '_' || c == '~';
}
}

auto split_path(string_view path) -> PathSegments
{
	PathSegments segments;
	if (!path.empty() && path.front() == '/')
		path.remove_prefix(1);

	for (;;) {
		auto slash = path.find('/');
		segments.push_back(path.substr(0, slash));
		if (slash == string_view::npos)
			break;
		path.remove_prefix(slash + 1);
	}
	return segments;
}

auto percent_decode(string_view s) -> std::string
{
	std::string result;
	result.reserve(s.size());

	for (std::size_t i = 0; i < s.size(); ++i) {
		if (s[i] == '%' && i + 2 < s.size()) {
			auto hi = hex_value(s[i + 1]);
			auto lo = hex_value(s[i + 2]);
			if (hi >= 0 && lo >= 0) {
				result += static_cast<char>(hi * 16 + lo);
				i += 2;
				continue;
			}
		}
		result += s[i];
	}
	return result;
}

auto percent_encode(string_view s) -> std::string
{
	static constexpr auto digits = "0123456789ABCDEF"sv;

	std::string result;
	result.reserve(s.size());

	for (auto c : s) {
		if (unreserved(c)) {
			result += c;
		} else {
			auto byte = static_cast<unsigned char>(c);
			result += '%';
			result += digits[byte >> 4];
			result += digits[byte & 0x0f];
		}
	}
	return result;
}
}
