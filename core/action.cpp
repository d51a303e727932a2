#include "action.hpp"

namespace switchyard
{
auto operator<<(std::ostream& stream, const Action& action) -> std::ostream&
{
	stream << action.target << '.' << action.method;
	if (action.args.empty())
		return stream;

	stream << '(';
	auto sep = ""sv;
	for (auto& [name, value] : action.args) {
		stream << sep << name << ":'" << value << '\'';
		sep = ", "sv;
	}
	return stream << ')';
}
}
