#pragma once
#include "string_view.hpp"
#include <boost/core/noncopyable.hpp>
#include <optional>
#include <string>
#include <vector>

namespace twig
{
class CompiledPattern;

// Unconsumed suffix of one request path. The remaining part always starts
// with '/' or is empty: only whole segments are ever removed from the front.
// No operation mutates the cursor when it reports no match.
class PathCursor: boost::noncopyable
{
public:
	using Snapshot = string_view;

	explicit PathCursor(std::string path);

	auto snapshot() const noexcept -> Snapshot { return rest; }
	auto restore(Snapshot s) noexcept -> void;

	// "/text" followed by '/' or end of path.
	auto consume_literal(string_view text) noexcept -> bool;
	// First non-empty segment, without its leading '/'.
	auto consume_segment() noexcept -> std::optional<string_view>;
	auto consume_pattern(const CompiledPattern& pattern) -> std::optional<std::vector<std::string>>;

	auto is_empty() const noexcept -> bool { return rest.empty(); }
	auto remaining() const noexcept -> string_view { return rest; }
	auto path() const noexcept -> string_view { return original; }
	auto consumed() const noexcept -> string_view;

private:
	auto advance(std::size_t n) noexcept -> void { rest.remove_prefix(n); }

	const std::string original;
	string_view rest;
};
}
