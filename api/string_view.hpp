#pragma once
#include <string_view>

namespace switchyard
{
using std::string_view;
using namespace std::string_view_literals;
}
