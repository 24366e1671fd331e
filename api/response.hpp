#pragma once
#include "string_view.hpp"
#include <cstddef>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace twig
{
// "404 Not Found"; "0 Unknown Status" for codes not in the table.
auto status_string(int status) noexcept -> string_view;

class Response
{
public:
	using Headers = std::map<std::string, std::string>;
	using Body = std::vector<std::string>;

	struct Finished
	{
		int status;
		Headers headers;
		Body body;

		auto body_text() const -> std::string;
	};

	static const Headers default_headers;

	// Header value, if set.
	auto operator[](const std::string& name) const -> std::optional<std::string>;
	auto set(std::string name, std::string value) -> void;
	auto headers() const noexcept -> const Headers& { return hdrs; }
	auto body() const noexcept -> const Body& { return chunks; }

	// An empty chunk still marks the response as written.
	auto write(string_view chunk) -> void;
	auto empty() const noexcept -> bool { return chunks.empty(); }

	auto redirect(std::string path, int status = 302) -> void;

	// Status defaults to 200 with a body and to 404 without one.
	auto finish() -> Finished;
	// Keeps the given body, no Content-Length.
	auto finish_with_body(Body body) -> Finished;

	std::optional<int> status;

private:
	void set_default_headers();
	auto default_status() const noexcept -> int { return 200; }

	Headers hdrs;
	Body chunks;
	std::size_t length = 0;
};

auto operator<<(std::ostream& stream, const Response::Finished& r) -> std::ostream&;
}
