#pragma once
#include "route_tree.hpp"
#include "string_view.hpp"
#include <boost/filesystem/path.hpp>
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace twig
{
namespace script
{
class SyntaxError : public std::runtime_error
{
public:
	using Position = std::size_t;

	SyntaxError(Position where, const std::string& what):
		runtime_error{ what },
		pos{ where }
	{}

	auto where() const noexcept -> Position { return pos; }

private:
	const Position pos;
};

struct Setting
{
	std::string key;
	std::string value;
};

struct Script
{
	std::vector<Setting> settings;
	std::shared_ptr<const RouteTree> routes;
};

class TextView
{
public:
	explicit TextView(string_view data, const std::string& filename = {});

	struct Priv;
	const std::shared_ptr<Priv> p;
};

namespace detail
{
struct TextStorage
{
	const std::string data;
};
}

// Owns the text it views.
class Text: private detail::TextStorage, public TextView
{
public:
	explicit Text(std::string data, const std::string& filename = {});
};

class File : public Text
{
public:
	explicit File(const boost::filesystem::path& path);
};

// throws SyntaxError
auto parse(std::shared_ptr<TextView> text) -> Script;
}
}
