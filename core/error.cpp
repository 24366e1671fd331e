#include "error.hpp"

namespace twig
{
Error::Error(const std::string& msg): runtime_error{ msg }
{
}

UnsupportedMatcher::UnsupportedMatcher(const std::string& matcher):
	Error{ "unsupported matcher: " + matcher }
{
}

PatternCompilationError::PatternCompilationError(const std::string& source, const std::string& reason):
	Error{ "bad pattern \"" + source + "\": " + reason },
	src{ source }
{
}

ArityMismatch::ArityMismatch(std::size_t expected, std::size_t obtained):
	Error{ "handler takes " + std::to_string(expected) + " arguments, "
		+ std::to_string(obtained) + " captured" },
	exp{ expected },
	obt{ obtained }
{
}

CaptureTypeMismatch::CaptureTypeMismatch(std::size_t index, const std::string& expected):
	Error{ "capture #" + std::to_string(index) + " is not convertible to " + expected },
	idx{ index }
{
}
}
