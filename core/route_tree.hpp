#pragma once
#include "capture.hpp"
#include "matcher.hpp"
#include "string_view.hpp"
#include <boost/core/noncopyable.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace twig
{
class Request;

// Routing tree read from a route script, built once and interpreted for
// every request through the Request verbs.
class RouteTree: boost::noncopyable
{
public:
	enum class Verb
	{
		on,
		is,
		get,
		post,
		root,
	};

	struct Condition;
	using ConditionList = std::vector<Condition>;

	// Bound to the request method when the request is routed.
	struct MethodCondition
	{
		std::vector<std::string> names;
	};

	struct AnyCondition
	{
		ConditionList elements;
	};

	struct AllCondition
	{
		struct Entry;

		std::vector<Entry> entries;
	};

	struct Condition
	{
		std::variant<Matcher, MethodCondition, AnyCondition, AllCondition> v;
	};

	// Text may refer to captures as $1..$9.
	struct BodyReply
	{
		std::string text;
	};

	struct RedirectReply
	{
		std::string path;
		int status = 302;
	};

	struct StatusReply
	{
		int status;
		std::string text;
	};

	using Reply = std::variant<BodyReply, RedirectReply, StatusReply>;

	struct Node
	{
		Verb verb;
		ConditionList conditions;
		std::vector<Node> children;
		std::optional<Reply> reply;
	};

	explicit RouteTree(std::vector<Node> nodes);

	void operator()(Request& r) const;

	auto nodes() const noexcept -> const std::vector<Node>& { return roots; }

private:
	const std::vector<Node> roots;
};

struct RouteTree::AllCondition::Entry
{
	std::string key;
	Condition condition;
};

// "$2" is replaced by the second capture, missing captures by nothing.
auto expand(string_view text, const CaptureList& captures) -> std::string;
}
