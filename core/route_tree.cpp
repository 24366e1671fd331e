#include "route_tree.hpp"
#include "request.hpp"
#include "visitor.hpp"
#include <boost/range/algorithm/copy.hpp>
#include <iterator>
#include <sstream>

namespace twig
{
namespace
{
auto bind_condition(const RouteTree::Condition& c, const Request& r) -> Matcher;

auto bind_conditions(const RouteTree::ConditionList& list, const Request& r) -> MatcherList
{
	MatcherList matchers;
	matchers.reserve(list.size());
	for (auto& c : list)
		matchers.push_back(bind_condition(c, r));
	return matchers;
}

auto bind_condition(const RouteTree::Condition& c, const Request& r) -> Matcher
{
	return std::visit(Visitor{
		[](const Matcher& m) { return m; },
		[&r](const RouteTree::MethodCondition& m) { return r.method_is(m.names); },
		[&r](const RouteTree::AnyCondition& m) { return one_of(bind_conditions(m.elements, r)); },
		[&r](const RouteTree::AllCondition& m) {
			std::vector<Conjunction::Entry> entries;
			for (auto& e : m.entries)
				entries.push_back({ e.key, bind_condition(e.condition, r) });
			return all_of(move(entries));
		},
	}, c.v);
}

auto to_string(const Capture& c) -> std::string
{
	return std::visit(Visitor{
		[](const std::string& s) { return s; },
		[](Integer i) { return std::to_string(i); },
		[](Real d) {
			std::ostringstream s;
			s << d;
			return s.str();
		},
	}, c);
}

class Interpreter
{
public:
	explicit Interpreter(Request& r): r{ r } {}

	void visit(const RouteTree::Node& node, const CaptureList& inherited)
	{
		auto block = [this, &node, &inherited](const CaptureList& own) {
			CaptureList captures = inherited;
			boost::range::copy(own, std::back_inserter(captures));
			return respond(node, captures);
		};

		const auto matchers = bind_conditions(node.conditions, r);
		switch (node.verb) {
		case RouteTree::Verb::on:
			if (matchers.empty())
				r.on(block);
			else
				r.on(matchers, block);
			break;
		case RouteTree::Verb::is:
			if (matchers.empty())
				r.is(block);
			else
				r.is(matchers, block);
			break;
		case RouteTree::Verb::get:
			if (matchers.empty())
				r.get(block);
			else
				r.get(matchers, block);
			break;
		case RouteTree::Verb::post:
			if (matchers.empty())
				r.post(block);
			else
				r.post(matchers, block);
			break;
		case RouteTree::Verb::root:
			r.root(block);
			break;
		}
	}

private:
	auto respond(const RouteTree::Node& node, const CaptureList& captures) -> std::optional<std::string>
	{
		if (!node.reply) {
			for (auto& child : node.children)
				visit(child, captures);
			return std::nullopt;
		}

		return std::visit(Visitor{
			[&captures](const RouteTree::BodyReply& reply) -> std::optional<std::string> {
				return expand(reply.text, captures);
			},
			[this, &captures](const RouteTree::RedirectReply& reply) -> std::optional<std::string> {
				r.redirect(expand(reply.path, captures), reply.status);
			},
			[this, &captures](const RouteTree::StatusReply& reply) -> std::optional<std::string> {
				r.response().status = reply.status;
				if (reply.text.empty())
					return std::nullopt;
				return expand(reply.text, captures);
			},
		}, *node.reply);
	}

	Request& r;
};
}

RouteTree::RouteTree(std::vector<Node> nodes):
	roots{ move(nodes) }
{
}

void RouteTree::operator()(Request& r) const
{
	Interpreter interpreter{ r };
	for (auto& node : roots)
		interpreter.visit(node, {});
}

auto expand(string_view text, const CaptureList& captures) -> std::string
{
	std::string result;
	result.reserve(text.size());
	for (std::size_t i = 0; i < text.size(); ++i) {
		const char c = text[i];
		if (c == '$' && i + 1 < text.size() && text[i + 1] >= '1' && text[i + 1] <= '9') {
			const auto n = static_cast<std::size_t>(text[++i] - '1');
			if (n < captures.size())
				result += to_string(captures[n]);
			continue;
		}
		result += c;
	}
	return result;
}
}
