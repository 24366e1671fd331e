#pragma once
#include <ostream>
#include <utility>

#ifndef TWIG_LOG_LEVEL
#  define TWIG_LOG_LEVEL 3
#endif

static_assert(TWIG_LOG_LEVEL >= 1 && TWIG_LOG_LEVEL <= 5,
	"TWIG_LOG_LEVEL should be in [1(error), 5(trace)]");

namespace twig
{
// Messages are not formatted unless a sink accepts them: arguments are
// chained as printers and rendered by the backend.
class Logger
{
public:
	enum class Severity
	{
		error   = 1,
		warning = 2,
		info    = 3,
		debug   = 4,
		trace   = 5,
	};

	static constexpr Severity compiled_level = Severity{ TWIG_LOG_LEVEL };

	template <typename... Args> void error(Args&&... args)
	{
		message<Severity::error>(std::forward<Args>(args)...);
	}
	template <typename... Args> void warning(Args&&... args)
	{
		message<Severity::warning>(std::forward<Args>(args)...);
	}
	template <typename... Args> void info(Args&&... args)
	{
		message<Severity::info>(std::forward<Args>(args)...);
	}
	template <typename... Args> void debug(Args&&... args)
	{
		message<Severity::debug>(std::forward<Args>(args)...);
	}
	template <typename... Args> void trace(Args&&... args)
	{
		message<Severity::trace>(std::forward<Args>(args)...);
	}

	template <Severity S, typename... Args> void message(Args&&... args);

	struct BasePrinter
	{
		virtual ~BasePrinter() = default;
		virtual void print(std::ostream& stream) const = 0;

		mutable const BasePrinter* next{};
	};

	template <typename T> class Printer;

	Logger(Logger&&) = delete;
	Logger& operator=(const Logger&) = delete;
	Logger& operator=(Logger&&) = delete;

protected:
	Logger() = default;
	Logger(const Logger&) = default;
	~Logger() = default;

	void chain() { commit(); }
	template <typename T, typename... Args> void chain(const T& arg, const Args&... args);

private:
	bool open(Severity s);
	void push(const BasePrinter& p) noexcept;
	void commit();
};

template <typename T>
class Logger::Printer : public BasePrinter
{
public:
	explicit Printer(const T& v) noexcept: v{ v } {}
	void print(std::ostream& stream) const override
	{
		stream << v;
	}
private:
	const T& v;
};

template <Logger::Severity S, typename... Args>
void Logger::message(Args&&... args)
{
	if constexpr (S <= compiled_level)
		if (open(S))
			chain(args...);
}

template <typename T, typename... Args>
void Logger::chain(const T& arg, const Args&... args)
{
	const Printer<T> p{ arg };
	push(p);
	chain(args...);
}
}
