#pragma once
#include "response.hpp"

namespace twig
{
// Terminal commit. Thrown by the request verbs once a response is final and
// caught by Application only; not an error, so not a std::exception.
struct Halt
{
	Response::Finished result;
};
}
