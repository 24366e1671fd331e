#include "capture.hpp"
#include "visitor.hpp"
#include <ostream>

namespace twig
{
auto operator<<(std::ostream& stream, const Capture& c) -> std::ostream&
{
	std::visit(Visitor{
		[&stream](const std::string& s) { stream << '"' << s << '"'; },
		[&stream](Integer i) { stream << i; },
		[&stream](Real r) { stream << r; },
	}, c);
	return stream;
}

auto operator<<(std::ostream& stream, const CaptureList& list) -> std::ostream&
{
	stream << "[";
	const char* sep = "";
	for (auto& c : list) {
		stream << sep << c;
		sep = ", ";
	}
	return stream << "]";
}
}
