#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

namespace twig
{
class Error : public std::runtime_error
{
public:
	explicit Error(const std::string& msg);
};

class UnsupportedMatcher : public Error
{
public:
	explicit UnsupportedMatcher(const std::string& matcher);
};

class PatternCompilationError : public Error
{
public:
	PatternCompilationError(const std::string& source, const std::string& reason);
	auto source() const noexcept -> const std::string& { return src; }
private:
	const std::string src;
};

class ArityMismatch : public Error
{
public:
	ArityMismatch(std::size_t expected, std::size_t obtained);
	auto expected() const noexcept -> std::size_t { return exp; }
	auto obtained() const noexcept -> std::size_t { return obt; }
private:
	const std::size_t exp;
	const std::size_t obt;
};

class CaptureTypeMismatch : public Error
{
public:
	CaptureTypeMismatch(std::size_t index, const std::string& expected);
	auto index() const noexcept -> std::size_t { return idx; }
private:
	const std::size_t idx;
};

class RedirectError : public Error
{
public:
	using Error::Error;
};
}
