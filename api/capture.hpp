#pragma once
#include <cstdint>
#include <iosfwd>
#include <string>
#include <variant>
#include <vector>

namespace twig
{
using Integer = std::int64_t;
using Real = double;

using Capture = std::variant<std::string, Integer, Real>;
using CaptureList = std::vector<Capture>;

auto operator<<(std::ostream& stream, const Capture& c) -> std::ostream&;
auto operator<<(std::ostream& stream, const CaptureList& list) -> std::ostream&;
}
