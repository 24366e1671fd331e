#pragma once
#include "logger_imp.hpp"

namespace twig
{
namespace test
{
inline GlobalLogger slg;
}
}
