#include "response.hpp"
#include <boost/config.hpp>
#include <cstdlib>
#include <iterator>

namespace twig
{
namespace
{
struct StringList
{
	const string_view* array;
	int size;

	template <int N>
	constexpr StringList(const string_view (&a)[N]):
		array{ a },
		size{ N }
	{}
};

constexpr string_view unsupported = "0 Unknown Status"sv;

constexpr string_view m1[] = {
	"100 Continue"sv,
	"101 Switching Protocols"sv,
};

constexpr string_view m2[] = {
	"200 OK"sv,
	"201 Created"sv,
	"202 Accepted"sv,
	"203 Non-Authoritative Information"sv,
	"204 No Content"sv,
	"205 Reset Content"sv,
	"206 Partial Content"sv,
};

constexpr string_view m3[] = {
	"300 Multiple Choices"sv,
	"301 Moved Permanently"sv,
	"302 Found"sv,
	"303 See Other"sv,
	"304 Not Modified"sv,
	"305 Use Proxy"sv,
	"306 Switch Proxy"sv,
	"307 Temporary Redirect"sv,
	"308 Permanent Redirect"sv,
};

constexpr string_view m4[] = {
	"400 Bad Request"sv,
	"401 Unauthorized"sv,
	"402 Payment Required"sv,
	"403 Forbidden"sv,
	"404 Not Found"sv,
	"405 Method Not Allowed"sv,
};

constexpr string_view m5[] = {
	"500 Internal Server Error"sv,
	"501 Not Implemented"sv,
	"502 Bad Gateway"sv,
	"503 Service Unavailable"sv,
	"504 Gateway Timeout"sv,
	"505 HTTP Version Not Supported"sv,
};

const StringList strings[] = {
	m1, m2, m3, m4, m5
};
}

auto status_string(int status) noexcept -> string_view
{
	const auto dv = std::div(status, 100);

	const int group = dv.quot - 1;
	if (BOOST_UNLIKELY(group < 0 || group >= static_cast<int>(std::size(strings))))
		return unsupported;

	const auto& sublist = strings[group];
	const int subcode = dv.rem;
	if (BOOST_UNLIKELY(subcode < 0 || subcode >= sublist.size))
		return unsupported;

	return sublist.array[subcode];
}

const Response::Headers Response::default_headers = {
	{ "Content-Type", "text/html" },
};

auto Response::Finished::body_text() const -> std::string
{
	std::string text;
	for (auto& chunk : body)
		text += chunk;
	return text;
}

auto Response::operator[](const std::string& name) const -> std::optional<std::string>
{
	auto found = hdrs.find(name);
	if (found == hdrs.end())
		return std::nullopt;
	return found->second;
}

auto Response::set(std::string name, std::string value) -> void
{
	hdrs[move(name)] = move(value);
}

auto Response::write(string_view chunk) -> void
{
	length += chunk.size();
	chunks.emplace_back(chunk);
}

auto Response::redirect(std::string path, int status) -> void
{
	hdrs["Location"] = move(path);
	this->status = status;
}

void Response::set_default_headers()
{
	for (auto& [name, value] : default_headers)
		hdrs.emplace(name, value);
}

auto Response::finish() -> Finished
{
	set_default_headers();

	int s;
	if (chunks.empty()) {
		s = status.value_or(404);
		if (s == 304 || s == 204 || (s >= 100 && s <= 199)) {
			hdrs.erase("Content-Type");
		} else if (s == 205) {
			hdrs.erase("Content-Type");
			hdrs["Content-Length"] = "0";
		} else {
			hdrs.emplace("Content-Length", "0");
		}
	} else {
		s = status.value_or(default_status());
		hdrs.emplace("Content-Length", std::to_string(length));
	}

	return { s, hdrs, chunks };
}

auto Response::finish_with_body(Body body) -> Finished
{
	set_default_headers();
	return { status.value_or(default_status()), hdrs, move(body) };
}

auto operator<<(std::ostream& stream, const Response::Finished& r) -> std::ostream&
{
	const auto text = status_string(r.status);
	if (text == unsupported)
		return stream << r.status;
	return stream << text;
}
}
