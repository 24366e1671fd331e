#define BOOST_SPIRIT_X3_NO_FILESYSTEM
#include "route_script.hpp"
#include "error.hpp"
#include "pattern_cache.hpp"
#include <boost/spirit/home/x3.hpp>
#include <boost/spirit/home/x3/support/ast/position_tagged.hpp>
#include <boost/spirit/home/x3/support/ast/variant.hpp>
#include <boost/spirit/home/x3/support/utility/annotate_on_success.hpp>
#include <boost/spirit/home/x3/support/utility/error_reporting.hpp>
#include <boost/fusion/adapted/struct/adapt_struct.hpp>
#include <boost/filesystem/fstream.hpp>
#include <functional>
#include <sstream>
#include <utility>
#include <vector>

/*
	script    ::= statement*
	statement ::= setting | route
	setting   ::= key = value
	route     ::= verb matcher* ( { route* } | => reply )
	matcher   ::= string | segment | int | end | true | false | ~string
	            | [ matcher+ ] | ( (name: matcher)+ ) | method = NAME ('|' NAME)*
	reply     ::= string | redirect string [int] | status int [string]
 */

namespace
{
namespace ast
{
namespace x3 = boost::spirit::x3;

struct Setting : x3::position_tagged
{
	std::string key;
	std::string value;
};

enum class Keyword
{
	segment,
	integer,
	end,
	yes,
	no,
};

struct Literal : x3::position_tagged
{
	std::string text;
};

struct Regex : x3::position_tagged
{
	std::string source;
};

struct Method : x3::position_tagged
{
	std::vector<std::string> names;
};

struct Alternation;
struct Conjunction;

struct Matcher : x3::variant<
		Keyword,
		Literal,
		Regex,
		Method,
		x3::forward_ast<Alternation>,
		x3::forward_ast<Conjunction>
	>,
	x3::position_tagged
{
	using base_type::base_type;
	using base_type::operator=;
};

struct Alternation
{
	std::vector<Matcher> elements;
};

struct Entry
{
	std::string key;
	Matcher matcher;
};

struct Conjunction
{
	std::vector<Entry> entries;
};

struct BodyReply
{
	std::string text;
};

struct RedirectReply
{
	std::string path;
	int status;
};

struct StatusReply
{
	int status;
	std::string text;
};

struct Reply : x3::variant<BodyReply, RedirectReply, StatusReply>, x3::position_tagged
{
	using base_type::base_type;
	using base_type::operator=;
};

struct Route;

struct Block
{
	std::vector<Route> routes;
};

struct Body : x3::variant<x3::forward_ast<Block>, Reply>
{
	using base_type::base_type;
	using base_type::operator=;
};

struct Route : x3::position_tagged
{
	twig::RouteTree::Verb verb;
	std::vector<Matcher> matchers;
	Body body;
};

struct Statement : x3::variant<Setting, Route>
{
	using base_type::base_type;
	using base_type::operator=;
};

struct Script
{
	std::vector<Statement> statements;
};
}
}

BOOST_FUSION_ADAPT_STRUCT(ast::Setting, key, value);
BOOST_FUSION_ADAPT_STRUCT(ast::Entry, key, matcher);
BOOST_FUSION_ADAPT_STRUCT(ast::RedirectReply, path, status);
BOOST_FUSION_ADAPT_STRUCT(ast::StatusReply, status, text);
BOOST_FUSION_ADAPT_STRUCT(ast::Route, verb, matchers, body);
BOOST_FUSION_ADAPT_STRUCT(ast::Script, statements);

namespace
{
namespace grammar
{
using namespace boost::spirit::x3;
using Verb = twig::RouteTree::Verb;

struct VerbTable : symbols<Verb>
{
	VerbTable()
	{
		add
			("on", Verb::on)
			("is", Verb::is)
			("get", Verb::get)
			("post", Verb::post)
			("root", Verb::root)
			;
	}
} const verb_table;

struct KeywordTable : symbols<ast::Keyword>
{
	KeywordTable()
	{
		add
			("segment", ast::Keyword::segment)
			("int", ast::Keyword::integer)
			("end", ast::Keyword::end)
			("true", ast::Keyword::yes)
			("false", ast::Keyword::no)
			;
	}
} const keyword_table;

struct QuotedId;
struct KeyId;
struct ValueId;
struct NameId;
struct SettingId : annotate_on_success {};
struct LiteralId : annotate_on_success {};
struct RegexId : annotate_on_success {};
struct MethodId : annotate_on_success {};
struct MatcherId : annotate_on_success {};
struct ReplyId : annotate_on_success {};
struct RouteId : annotate_on_success {};
struct KeywordId;
struct AlternationId;
struct EntryId;
struct ConjunctionId;
struct BodyReplyId;
struct RedirectReplyId;
struct StatusReplyId;
struct BlockId;
struct BodyId;
struct VerbId;
struct StatementId;
struct ScriptId;

const rule<QuotedId, std::string> quoted = "string";
const rule<KeyId, std::string> key = "key";
const rule<ValueId, std::string> value = "value";
const rule<NameId, std::string> name = "name";
const rule<SettingId, ast::Setting> setting = "setting";
const rule<KeywordId, ast::Keyword> keyword = "keyword";
const rule<LiteralId, ast::Literal> literal = "string";
const rule<RegexId, ast::Regex> regex = "pattern";
const rule<MethodId, ast::Method> method = "method list";
const rule<AlternationId, ast::Alternation> alternation = "alternation";
const rule<EntryId, ast::Entry> entry = "named matcher";
const rule<ConjunctionId, ast::Conjunction> conjunction = "conjunction";
const rule<MatcherId, ast::Matcher> matcher = "matcher";
const rule<BodyReplyId, ast::BodyReply> body_reply = "body";
const rule<RedirectReplyId, ast::RedirectReply> redirect_reply = "redirect";
const rule<StatusReplyId, ast::StatusReply> status_reply = "status";
const rule<ReplyId, ast::Reply> reply = "reply";
const rule<BlockId, ast::Block> block = "block";
const rule<BodyId, ast::Body> body = "route body";
const rule<VerbId, Verb> verb = "verb";
const rule<RouteId, ast::Route> route = "route";
const rule<StatementId, ast::Statement> statement = "statement";
const rule<ScriptId, ast::Script> script = "script";

const auto comment = lexeme['#' >> *(char_ - eol)];
const auto skipper = space | comment;

const auto word_end = !(alnum | '_');
const auto kw = [](const char* s) { return lexeme[lit(s) >> word_end]; };

// Rules holding a single-member node are filled by assigning the parsed
// attribute to that member.
template <typename T, typename M>
auto assign_to(M T::*member)
{
	return [member](auto& ctx) { _val(ctx).*member = std::move(_attr(ctx)); };
}

const auto quoted_def = lexeme['"' > *(('\\' > char_("\\\"")) | ~char_("\"\\")) > '"'];
const auto name_def = lexeme[(alpha | char_('_')) >> *(alnum | char_('_'))];
const auto key_def = lexeme[alpha >> *(alnum | char_('_') | char_('.'))];
const auto bare_value = lexeme[+(graph - '#')];
const auto value_def = quoted | bare_value;
// '=' but not the start of "=>"
const auto assign = lexeme[lit('=') >> !lit('>')];

const auto setting_def = key >> omit[assign] > value;

const auto keyword_def = lexeme[keyword_table >> word_end];
const auto literal_def = quoted[assign_to(&ast::Literal::text)];
const auto regex_def = ('~' > quoted)[assign_to(&ast::Regex::source)];
const auto method_def = (kw("method") > '=' > (name % '|'))[assign_to(&ast::Method::names)];
const auto alternation_def = ('[' > +matcher > ']')[assign_to(&ast::Alternation::elements)];
const auto entry_def = name >> ':' > matcher;
const auto conjunction_def = ('(' > +entry > ')')[assign_to(&ast::Conjunction::entries)];
const auto matcher_def =
	  method
	| keyword
	| literal
	| regex
	| alternation
	| conjunction
	;

const auto body_reply_def = quoted[assign_to(&ast::BodyReply::text)];
const auto redirect_reply_def = kw("redirect") > quoted > (int_ | attr(302));
const auto status_reply_def = kw("status") > int_ > (quoted | attr(std::string{}));
const auto reply_def = redirect_reply | status_reply | body_reply;

const auto block_def = ('{' > *route > '}')[assign_to(&ast::Block::routes)];
const auto body_def = block | (lit("=>") > reply);
const auto verb_def = lexeme[verb_table >> word_end];
const auto route_def = verb > *matcher > body;

const auto statement_def = setting | route;
const auto script_def = *statement;

BOOST_SPIRIT_DEFINE(quoted, key, value, name, setting, keyword, literal, regex, method, alternation, entry,
	conjunction, matcher, body_reply, redirect_reply, status_reply, reply,
	block, body, verb, route, statement, script);
}

using Iterator = string_view::const_iterator;

auto read(const boost::filesystem::path& path)
{
	boost::filesystem::ifstream f{ path, std::ios::in | std::ios::binary };
	if (!f.is_open())
		throw std::runtime_error{ "can't load route script: " + path.string() };

	std::ostringstream data;
	data << f.rdbuf();
	if (f.bad())
		throw std::runtime_error{ "can't read route script: " + path.string() };

	return data.str();
}
}

namespace twig
{
namespace script
{
struct TextView::Priv
{
	Priv(string_view data, const std::string& filename):
		data{ data },
		error_handler{ data.begin(), data.end(), error_stream, filename }
	{
	}

	auto make_error(const boost::spirit::x3::position_tagged& where, const std::string& msg) const
	{
		const auto range = error_handler.position_of(where);
		error_handler(where, msg);
		return SyntaxError{ static_cast<SyntaxError::Position>(range.begin() - data.begin()),
			error_stream.str() };
	}

	auto make_error(Iterator where, const std::string& msg) const
	{
		error_handler(where, msg);
		return SyntaxError{ static_cast<SyntaxError::Position>(where - data.begin()),
			error_stream.str() };
	}

	const string_view data;
	std::stringstream error_stream{ std::ios::out };
	grammar::error_handler<Iterator> error_handler;
	ast::Script ast;
};

TextView::TextView(string_view data, const std::string& filename):
	p{ std::make_shared<Priv>(data, filename) }
{
}

Text::Text(std::string data, const std::string& filename):
	TextStorage{ move(data) },
	TextView{ TextStorage::data, filename }
{
}

File::File(const boost::filesystem::path& path):
	Text{ read(path), path.string() }
{
}

namespace
{
class Builder
{
public:
	explicit Builder(const TextView::Priv& text): text{ text } {}

	auto condition(const ast::Matcher& m) -> RouteTree::Condition
	{
		return boost::apply_visitor(ConditionVisitor{ *this }, m);
	}

	auto conditions(const std::vector<ast::Matcher>& list) -> RouteTree::ConditionList
	{
		RouteTree::ConditionList result;
		result.reserve(list.size());
		for (auto& m : list)
			result.push_back(condition(m));
		return result;
	}

	auto node(const ast::Route& r) -> RouteTree::Node
	{
		if (r.verb == RouteTree::Verb::root && !r.matchers.empty())
			throw text.make_error(r, "root takes no matchers:");

		RouteTree::Node n{ r.verb, conditions(r.matchers), {}, std::nullopt };
		boost::apply_visitor(BodyVisitor{ *this, n }, r.body);
		return n;
	}

	auto reply(const ast::Reply& r) -> RouteTree::Reply
	{
		return boost::apply_visitor(ReplyVisitor{ *this, r }, r);
	}

private:
	struct ConditionVisitor : boost::static_visitor<RouteTree::Condition>
	{
		explicit ConditionVisitor(Builder& b): b{ b } {}

		auto operator()(ast::Keyword k) const -> RouteTree::Condition
		{
			switch (k) {
			case ast::Keyword::segment: return { twig::segment };
			case ast::Keyword::integer: return { twig::integer };
			case ast::Keyword::end: return { term };
			case ast::Keyword::yes: return { BooleanLiteral{ true } };
			case ast::Keyword::no: return { BooleanLiteral{ false } };
			}
			throw UnsupportedMatcher{ "keyword " + std::to_string(static_cast<int>(k)) };
		}
		auto operator()(const ast::Literal& m) const -> RouteTree::Condition
		{
			return { Matcher{ m.text } };
		}
		auto operator()(const ast::Regex& m) const -> RouteTree::Condition
		{
			try {
				compile(m.source);
			} catch (PatternCompilationError& e) {
				throw b.text.make_error(m, e.what());
			}
			return { pattern(m.source) };
		}
		auto operator()(const ast::Method& m) const -> RouteTree::Condition
		{
			return { RouteTree::MethodCondition{ m.names } };
		}
		auto operator()(const boost::spirit::x3::forward_ast<ast::Alternation>& m) const
			-> RouteTree::Condition
		{
			return { RouteTree::AnyCondition{ b.conditions(m.get().elements) } };
		}
		auto operator()(const boost::spirit::x3::forward_ast<ast::Conjunction>& m) const
			-> RouteTree::Condition
		{
			RouteTree::AllCondition all;
			for (auto& e : m.get().entries)
				all.entries.push_back({ e.key, b.condition(e.matcher) });
			return { std::move(all) };
		}

		Builder& b;
	};

	struct BodyVisitor : boost::static_visitor<void>
	{
		BodyVisitor(Builder& b, RouteTree::Node& n): b{ b }, n{ n } {}

		void operator()(const boost::spirit::x3::forward_ast<ast::Block>& block) const
		{
			for (auto& r : block.get().routes)
				n.children.push_back(b.node(r));
		}
		void operator()(const ast::Reply& r) const
		{
			n.reply = b.reply(r);
		}

		Builder& b;
		RouteTree::Node& n;
	};

	struct ReplyVisitor : boost::static_visitor<RouteTree::Reply>
	{
		ReplyVisitor(Builder& b, const ast::Reply& where): b{ b }, where{ where } {}

		auto operator()(const ast::BodyReply& r) const -> RouteTree::Reply
		{
			return RouteTree::BodyReply{ r.text };
		}
		auto operator()(const ast::RedirectReply& r) const -> RouteTree::Reply
		{
			if (r.status < 300 || r.status > 399)
				throw b.text.make_error(where, "redirect status should be 3xx:");
			return RouteTree::RedirectReply{ r.path, r.status };
		}
		auto operator()(const ast::StatusReply& r) const -> RouteTree::Reply
		{
			if (r.status < 100 || r.status > 599)
				throw b.text.make_error(where, "bad status code:");
			return RouteTree::StatusReply{ r.status, r.text };
		}

		Builder& b;
		const ast::Reply& where;
	};

	const TextView::Priv& text;
};

struct StatementVisitor : boost::static_visitor<void>
{
	StatementVisitor(Builder& b, Script& s, std::vector<RouteTree::Node>& nodes):
		b{ b }, s{ s }, nodes{ nodes }
	{}

	void operator()(const ast::Setting& setting) const
	{
		s.settings.push_back({ setting.key, setting.value });
	}
	void operator()(const ast::Route& r) const
	{
		nodes.push_back(b.node(r));
	}

	Builder& b;
	Script& s;
	std::vector<RouteTree::Node>& nodes;
};
}

auto parse(std::shared_ptr<TextView> text) -> Script
{
	auto& txt = *text->p;
	auto begin = txt.data.begin();
	auto end = txt.data.end();

	auto parser = grammar::with<grammar::error_handler_tag>(std::ref(txt.error_handler))
	[
		grammar::script
	];

	try {
		auto parsed = phrase_parse(begin, end, parser, grammar::skipper, txt.ast);
		BOOST_ASSERT(parsed);
	} catch (grammar::expectation_failure<Iterator>& e) {
		throw txt.make_error(e.where(), "Error! Expecting " + e.which() + " here:");
	}

	auto consumed = begin == end;
	if (!consumed)
		throw txt.make_error(begin, "can't parse:");

	Script result;
	std::vector<RouteTree::Node> nodes;
	Builder builder{ txt };
	StatementVisitor visitor{ builder, result, nodes };
	for (auto& statement : txt.ast.statements)
		boost::apply_visitor(visitor, statement);

	result.routes = std::make_shared<const RouteTree>(move(nodes));
	return result;
}
}
}
