#include "pattern_cache.hpp"
#include "error.hpp"

namespace twig
{
namespace
{
auto make_regex(const std::string& source) -> std::regex
{
	try {
		return std::regex{ "/(?:" + source + ")(?=/|$)",
			std::regex_constants::ECMAScript | std::regex_constants::optimize };
	} catch (std::regex_error& e) {
		throw PatternCompilationError{ source, e.what() };
	}
}
}

CompiledPattern::CompiledPattern(std::string source):
	src{ move(source) },
	re{ make_regex(src) }
{
}

auto compile(string_view source) -> PatternPtr
{
	return std::make_shared<const CompiledPattern>(std::string{ source });
}

PatternCache::PatternCache(const PatternCache& rhs)
{
	std::lock_guard lock{ rhs.m };
	patterns = rhs.patterns;
}

auto PatternCache::get(const Key& key) const -> PatternPtr
{
	std::lock_guard lock{ m };
	auto found = patterns.find(key);
	return found == patterns.end() ? nullptr : found->second;
}

auto PatternCache::put(const Key& key, PatternPtr pattern) -> void
{
	std::lock_guard lock{ m };
	patterns[key] = move(pattern);
}

auto PatternCache::get_or_compile(const Key& key, const CompileFn& compile_fn) -> PatternPtr
{
	if (auto pattern = get(key))
		return pattern;

	auto pattern = compile_fn();
	put(key, pattern);
	return pattern;
}

auto PatternCache::get_or_compile(const Key& key) -> PatternPtr
{
	return get_or_compile(key, [&key] { return compile(key); });
}

auto PatternCache::size() const -> std::size_t
{
	std::lock_guard lock{ m };
	return patterns.size();
}
}
