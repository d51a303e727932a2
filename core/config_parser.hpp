#pragma once
#include "config.hpp"
#include <memory>

namespace switchyard
{
class Source;

namespace config
{
// throws SyntaxError
auto parse(std::shared_ptr<const Source> source) -> Table;
}
}
