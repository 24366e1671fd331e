#pragma once
#include "string_view.hpp"
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <regex>
#include <string>
#include <unordered_map>

namespace twig
{
// A regular expression anchored at the cursor that only matches whole
// segments: "/(?:source)(?=/|$)".
class CompiledPattern
{
public:
	// throws PatternCompilationError
	explicit CompiledPattern(std::string source);

	auto source() const noexcept -> const std::string& { return src; }
	auto regex() const noexcept -> const std::regex& { return re; }
	auto group_count() const -> std::size_t { return re.mark_count(); }

private:
	const std::string src;
	const std::regex re;
};

using PatternPtr = std::shared_ptr<const CompiledPattern>;

auto compile(string_view source) -> PatternPtr;

// Each lookup and each store holds the lock on its own; get_or_compile may
// therefore compile the same key twice when racing, the last store wins.
class PatternCache
{
public:
	using Key = std::string;
	using CompileFn = std::function<PatternPtr()>;

	PatternCache() = default;
	PatternCache(const PatternCache& rhs);
	PatternCache& operator=(const PatternCache&) = delete;

	auto get(const Key& key) const -> PatternPtr;
	auto put(const Key& key, PatternPtr pattern) -> void;
	auto get_or_compile(const Key& key, const CompileFn& compile_fn) -> PatternPtr;
	auto get_or_compile(const Key& key) -> PatternPtr;

	auto size() const -> std::size_t;

private:
	mutable std::mutex m;
	std::unordered_map<Key, PatternPtr> patterns;
};
}
