#include "path_cursor.hpp"
#include "pattern_cache.hpp"
#include <boost/assert.hpp>
#include <regex>

namespace twig
{
PathCursor::PathCursor(std::string path):
	original{ move(path) },
	rest{ original }
{
}

auto PathCursor::restore(Snapshot s) noexcept -> void
{
	BOOST_ASSERT(s.data() >= original.data()
		&& s.data() + s.size() == original.data() + original.size());
	rest = s;
}

auto PathCursor::consume_literal(string_view text) noexcept -> bool
{
	const auto length = text.size() + 1;
	if (rest.size() < length || rest.front() != '/')
		return false;
	if (rest.compare(1, text.size(), text) != 0)
		return false;
	if (rest.size() != length && rest[length] != '/')
		return false;

	advance(length);
	return true;
}

auto PathCursor::consume_segment() noexcept -> std::optional<string_view>
{
	if (rest.size() < 2 || rest.front() != '/')
		return std::nullopt;

	const auto last = rest.find('/', 1);
	if (last == 1)
		return std::nullopt;

	const auto end = last == string_view::npos ? rest.size() : last;
	const auto segment = rest.substr(1, end - 1);
	advance(end);
	return segment;
}

auto PathCursor::consume_pattern(const CompiledPattern& pattern)
	-> std::optional<std::vector<std::string>>
{
	std::match_results<string_view::const_iterator> m;
	if (!std::regex_search(rest.begin(), rest.end(), m, pattern.regex(),
			std::regex_constants::match_continuous))
		return std::nullopt;

	std::vector<std::string> groups;
	groups.reserve(m.size() - 1);
	for (std::size_t i = 1; i < m.size(); ++i)
		groups.push_back(m[i].matched ? m[i].str() : std::string{});

	advance(static_cast<std::size_t>(m.length(0)));
	return groups;
}

auto PathCursor::consumed() const noexcept -> string_view
{
	return string_view{ original }.substr(0, original.size() - rest.size());
}
}
