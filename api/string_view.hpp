#pragma once
#include <string_view>

using std::string_view;
using namespace std::string_view_literals;
