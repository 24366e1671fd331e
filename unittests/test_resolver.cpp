#include "resolver.hpp"
#include "error.hpp"
#include <boost/test/unit_test.hpp>
#include <stdexcept>
#include <string>

using namespace twig;
using State = Application::RouteResult::State;

namespace
{
void routes(Request& r)
{
	r.is({ "ok" }, [] { return "fine"; });
	r.on({ "bad", "predicate" }, [&r] {
		r.on({ predicate({}) }, [] { return "never"; });
	});
	r.on({ "bad", "arity", segment }, [](Integer, Integer) { return "never"; });
	r.is({ "crash" }, []() -> const char* { throw std::logic_error{ "crash" }; });
}

auto get(const Resolver& resolver, std::string path) -> Application::RouteResult
{
	return resolver.resolve({ "GET", "", std::move(path) });
}
}

BOOST_AUTO_TEST_SUITE(resolver_tests)

BOOST_AUTO_TEST_CASE(test_passes_results)
{
	const Application app{ "resolved", routes };
	const Resolver resolver{ app };

	const auto ok = get(resolver, "/ok");
	BOOST_TEST(ok.state == State::matched);
	BOOST_TEST(ok.response.body_text() == "fine");

	const auto missing = get(resolver, "/missing");
	BOOST_TEST(missing.state == State::exhausted);
	BOOST_TEST(missing.response.status == 404);
}

BOOST_AUTO_TEST_CASE(test_routing_errors)
{
	const Application app{ "resolved", routes };
	const Resolver resolver{ app };

	for (auto path : { "/bad/predicate", "/bad/arity/x" }) {
		const auto failed = get(resolver, path);
		BOOST_TEST(failed.state == State::failed);
		BOOST_TEST(failed.response.status == 500);
		BOOST_TEST(failed.response.body_text() == "500 Internal Server Error");
	}
}

BOOST_AUTO_TEST_CASE(test_pattern_error)
{
	const Application app{ "resolved", [](Request& r) {
		r.on({ pattern("[unclosed") }, [] { return "never"; });
	} };
	const Resolver resolver{ app };

	const auto failed = get(resolver, "/x");
	BOOST_TEST(failed.state == State::failed);
	BOOST_TEST(failed.response.status == 500);

	BOOST_TEST(app.patterns().size() == 0u);
}

BOOST_AUTO_TEST_CASE(test_other_errors_propagate)
{
	const Application app{ "resolved", routes };
	const Resolver resolver{ app };

	BOOST_CHECK_THROW(get(resolver, "/crash"), std::logic_error);
}

BOOST_AUTO_TEST_SUITE_END()
