#define BOOST_TEST_MODULE CORS_Test
#include <boost/test/included/unit_test.hpp>

#include "cors.hpp"
#include "env.hpp"
#include "http_request.hpp"
#include "http_response.hpp"

#include <cstdlib>
#include <cstring>
#include <fstream>
#include <filesystem>
#include <string>
#include <vector>

using namespace std::literals;

namespace {

cors::policy_config make_config(std::vector<std::string> origins = {"http://localhost:5173"}, bool credentials = true)
{
	return cors::policy_config(std::move(origins),
		{"GET", "POST", "PUT", "DELETE", "OPTIONS"},
		{"Content-Type", "Authorization", "X-Requested-With"},
		credentials);
}

http::request make_request(std::string_view raw)
{
	http::request_parser parser;
	auto buffer = parser.get_buffer();
	std::memcpy(buffer.data(), raw.data(), raw.size());
	parser.update_pos(static_cast<ssize_t>(raw.size()));
	BOOST_REQUIRE(parser.eof());
	BOOST_REQUIRE(parser.finalize().has_value());
	return http::request(std::move(parser), "127.0.0.1");
}

std::vector<std::string> header_names(const http::response& res)
{
	std::vector<std::string> names;
	for (const auto& [name, value] : res.headers())
		names.push_back(name);
	return names;
}

// Sets an environment variable for the lifetime of the object.
class scoped_env
{
  public:
	scoped_env(const char* name, const char* value)
		: m_name(name)
	{
		::setenv(name, value, 1);
		env::clear_cache();
	}

	~scoped_env()
	{
		::unsetenv(m_name);
		env::clear_cache();
	}

	scoped_env(const scoped_env&) = delete;
	scoped_env& operator=(const scoped_env&) = delete;

  private:
	const char* m_name;
};

} // namespace

// -----------------------------------------------------------------------
// Origin evaluation

BOOST_AUTO_TEST_CASE(evaluate_allowed_origin)
{
	auto config = make_config({"http://localhost:5173", "https://app.example.com"});

	for (const auto& origin : config.origins())
	{
		auto decision = cors::evaluate(origin, config);
		BOOST_REQUIRE(decision.allow_origin.has_value());
		BOOST_TEST(*decision.allow_origin == origin);
	}
}

BOOST_AUTO_TEST_CASE(evaluate_disallowed_origin)
{
	auto config = make_config();

	for (auto origin : {"http://evil.example"sv, "http://localhost:5174"sv, "https://localhost:5173"sv,
						 "http://LOCALHOST:5173"sv, "http://localhost:5173/"sv, "null"sv, ""sv})
	{
		auto decision = cors::evaluate(origin, config);
		BOOST_TEST(not decision.allow_origin.has_value(), "origin " << origin);
		BOOST_TEST((decision.allowed_methods == config.methods()));
		BOOST_TEST(decision.allow_credentials);
	}
}

BOOST_AUTO_TEST_CASE(evaluate_absent_origin)
{
	auto config = make_config();
	auto decision = cors::evaluate(std::nullopt, config);

	BOOST_TEST(not decision.allow_origin.has_value());
	BOOST_TEST((decision.allowed_methods == config.methods()));
	BOOST_TEST((decision.allowed_headers == config.headers()));
	BOOST_TEST(decision.allow_credentials == config.allow_credentials());
}

BOOST_AUTO_TEST_CASE(evaluate_is_idempotent)
{
	auto config = make_config();

	BOOST_TEST((cors::evaluate("http://localhost:5173"sv, config) == cors::evaluate("http://localhost:5173"sv, config)));
	BOOST_TEST((cors::evaluate("http://evil.example"sv, config) == cors::evaluate("http://evil.example"sv, config)));
	BOOST_TEST((cors::evaluate(std::nullopt, config) == cors::evaluate(std::nullopt, config)));
}

// -----------------------------------------------------------------------
// Header injection

BOOST_AUTO_TEST_CASE(inject_order)
{
	auto config = make_config();
	http::response res;
	cors::inject_headers(cors::evaluate("http://localhost:5173"sv, config), res);

	const std::vector<std::string> expected{
		"Access-Control-Allow-Origin",
		"Access-Control-Allow-Methods",
		"Access-Control-Allow-Headers",
		"Access-Control-Allow-Credentials"};
	BOOST_TEST(header_names(res) == expected, boost::test_tools::per_element());

	BOOST_TEST(*res.header("access-control-allow-origin") == "http://localhost:5173");
	BOOST_TEST(*res.header("Access-Control-Allow-Methods") == "GET, POST, PUT, DELETE, OPTIONS");
	BOOST_TEST(*res.header("Access-Control-Allow-Headers") == "Content-Type, Authorization, X-Requested-With");
	BOOST_TEST(*res.header("Access-Control-Allow-Credentials") == "true");
}

BOOST_AUTO_TEST_CASE(inject_without_origin)
{
	auto config = make_config();
	http::response res;
	cors::inject_headers(cors::evaluate("http://evil.example"sv, config), res);

	BOOST_TEST(not res.header("Access-Control-Allow-Origin").has_value());
	BOOST_TEST(res.header("Access-Control-Allow-Methods").has_value());
	BOOST_TEST(res.header("Access-Control-Allow-Credentials").has_value());
}

BOOST_AUTO_TEST_CASE(inject_without_credentials)
{
	auto config = make_config({"http://localhost:5173"}, false);
	http::response res;
	cors::inject_headers(cors::evaluate("http://localhost:5173"sv, config), res);

	BOOST_TEST(res.header("Access-Control-Allow-Origin").has_value());
	BOOST_TEST(not res.header("Access-Control-Allow-Credentials").has_value());
}

BOOST_AUTO_TEST_CASE(inject_empty_header_list)
{
	cors::policy_config config({"http://localhost:5173"}, {"GET"}, {}, true);
	http::response res;
	cors::inject_headers(cors::evaluate("http://localhost:5173"sv, config), res);

	BOOST_TEST(not res.header("Access-Control-Allow-Headers").has_value());
	BOOST_TEST(*res.header("Access-Control-Allow-Methods") == "GET");
}

BOOST_AUTO_TEST_CASE(inject_lands_on_the_wire)
{
	auto config = make_config();
	http::response res;
	cors::inject_headers(cors::evaluate("http://localhost:5173"sv, config), res);
	res.set_body(http::status::ok, R"({"status":"OK"})");

	std::string_view wire(res.buffer().data(), res.buffer().size());
	BOOST_TEST(wire.starts_with("HTTP/1.1 200 OK\r\n"));
	BOOST_TEST(wire.contains("\r\nAccess-Control-Allow-Origin: http://localhost:5173\r\n"));
	BOOST_TEST(wire.find("Access-Control-Allow-Origin") < wire.find("Access-Control-Allow-Credentials"));
	BOOST_TEST(wire.ends_with("\r\n\r\n{\"status\":\"OK\"}"));
}

// -----------------------------------------------------------------------
// Preflight dispatcher

BOOST_AUTO_TEST_CASE(dispatch_options_terminates)
{
	cors::preflight_dispatcher dispatcher(http::status::no_content);
	BOOST_TEST((dispatcher.state() == cors::preflight_state::pending));

	http::response res;
	BOOST_TEST((dispatcher.dispatch(http::method::options, res) == cors::preflight_state::terminated));
	BOOST_TEST(cors::to_string(dispatcher.state()) == "terminated");
	BOOST_TEST(res.is_finalized());
	BOOST_TEST((*res.status_code() == http::status::no_content));
	BOOST_TEST(res.body().empty());
}

BOOST_AUTO_TEST_CASE(dispatch_other_methods_forward)
{
	using enum http::method;
	for (auto m : {get, head, post, put, patch, del})
	{
		cors::preflight_dispatcher dispatcher(http::status::no_content);
		http::response res;
		BOOST_TEST((dispatcher.dispatch(m, res) == cors::preflight_state::forwarded));
		BOOST_TEST(not res.is_finalized());
	}
}

BOOST_AUTO_TEST_CASE(dispatch_is_final)
{
	cors::preflight_dispatcher dispatcher(http::status::ok);
	http::response res;

	BOOST_TEST((dispatcher.dispatch(http::method::get, res) == cors::preflight_state::forwarded));
	BOOST_TEST((dispatcher.dispatch(http::method::options, res) == cors::preflight_state::forwarded));
	BOOST_TEST(not res.is_finalized());

	cors::preflight_dispatcher terminated(http::status::ok);
	BOOST_TEST((terminated.dispatch(http::method::options, res) == cors::preflight_state::terminated));
	BOOST_TEST((terminated.dispatch(http::method::get, res) == cors::preflight_state::terminated));
	BOOST_TEST((*res.status_code() == http::status::ok));
}

// -----------------------------------------------------------------------
// Interceptor

BOOST_AUTO_TEST_CASE(intercept_preflight_from_any_origin)
{
	cors::interceptor interceptor(make_config());

	for (auto raw : {"OPTIONS /greet HTTP/1.1\r\nHost: api\r\nOrigin: http://localhost:5173\r\n\r\n"sv,
					 "OPTIONS /greet HTTP/1.1\r\nHost: api\r\nOrigin: http://evil.example\r\n\r\n"sv,
					 "OPTIONS /unknown HTTP/1.1\r\nHost: api\r\n\r\n"sv})
	{
		auto req = make_request(raw);
		http::response res;
		auto result = interceptor.intercept(req, res);

		BOOST_TEST((result.state == cors::preflight_state::terminated));
		BOOST_TEST((*res.status_code() == http::status::no_content));
		BOOST_TEST(res.body().empty());
		BOOST_TEST(res.header("Access-Control-Allow-Methods").has_value());
	}
}

BOOST_AUTO_TEST_CASE(intercept_counts_rejections)
{
	cors::interceptor interceptor(make_config());

	auto rejected = make_request("GET /greet HTTP/1.1\r\nHost: api\r\nOrigin: http://evil.example\r\n\r\n");
	http::response res1;
	auto r1 = interceptor.intercept(rejected, res1);
	BOOST_TEST(r1.origin_rejected);
	BOOST_TEST((r1.state == cors::preflight_state::forwarded));
	BOOST_TEST(not res1.is_finalized());

	auto absent = make_request("GET /greet HTTP/1.1\r\nHost: api\r\n\r\n");
	http::response res2;
	BOOST_TEST(not interceptor.intercept(absent, res2).origin_rejected);
}

BOOST_AUTO_TEST_CASE(annotate_error_response)
{
	cors::interceptor interceptor(make_config());
	http::response res;
	interceptor.annotate("http://localhost:5173"sv, res);
	res.set_body(http::status::bad_request, R"({"error":"Bad Request"})");

	BOOST_TEST(*res.header("Access-Control-Allow-Origin") == "http://localhost:5173");
}

// -----------------------------------------------------------------------
// Configuration

BOOST_AUTO_TEST_CASE(config_trims_and_dedups)
{
	auto config = make_config({" http://localhost:5173 ", "http://localhost:5173", "https://app.example.com"});

	const std::vector<std::string> expected{"http://localhost:5173", "https://app.example.com"};
	BOOST_TEST(config.origins() == expected, boost::test_tools::per_element());
	BOOST_TEST(config.is_allowed("http://localhost:5173"));
	BOOST_TEST(not config.is_allowed(" http://localhost:5173 "));
}

BOOST_AUTO_TEST_CASE(config_rejects_empty_list)
{
	BOOST_CHECK_THROW(make_config({}), cors::config_error);
}

BOOST_AUTO_TEST_CASE(config_rejects_bad_origins)
{
	for (auto origin : {"", "   ", "*", "https://*.example.com", "localhost:5173", "ftp://example.com",
						"http://example.com/", "http://example.com/path", "http://example.com?x=1",
						"http://user@example.com", "http://example.com:0", "http://example.com:70000",
						"http://example.com:abc", "http://", "http://.example.com", "http://exa mple.com"})
	{
		BOOST_CHECK_THROW(make_config({origin}), cors::config_error);
	}
}

BOOST_AUTO_TEST_CASE(config_accepts_origin_forms)
{
	BOOST_CHECK_NO_THROW(make_config({"http://localhost", "https://www.example.com:8443", "http://127.0.0.1:8080", "http://[::1]:3000"}));

	BOOST_TEST(not cors::validate_origin("http://[::1]:3000").has_value());
	BOOST_TEST(cors::validate_origin("*").has_value());
}

BOOST_AUTO_TEST_CASE(config_rejects_bad_tokens)
{
	BOOST_CHECK_THROW(cors::policy_config({"http://localhost"}, {"GET", ""}, {}, true), cors::config_error);
	BOOST_CHECK_THROW(cors::policy_config({"http://localhost"}, {"GET POST"}, {}, true), cors::config_error);
	BOOST_CHECK_THROW(cors::policy_config({"http://localhost"}, {"GET"}, {"Content Type"}, true), cors::config_error);
}

BOOST_AUTO_TEST_CASE(config_preflight_status)
{
	BOOST_TEST((cors::to_preflight_status(204) == http::status::no_content));
	BOOST_TEST((cors::to_preflight_status(200) == http::status::ok));
	BOOST_CHECK_THROW(cors::to_preflight_status(201), cors::config_error);
	BOOST_CHECK_THROW(cors::policy_config({"http://localhost"}, {"GET"}, {}, true, http::status::not_found), cors::config_error);
}

BOOST_AUTO_TEST_CASE(config_from_json)
{
	auto config = cors::policy_config::from_json(R"({
		"allowedOrigins": ["http://localhost:5173", "https://app.example.com"],
		"allowedMethods": ["GET", "OPTIONS"],
		"allowCredentials": false,
		"preflightStatus": 200
	})");

	BOOST_TEST(config.origins().size() == 2);
	BOOST_TEST(config.methods() == (std::vector<std::string>{"GET", "OPTIONS"}), boost::test_tools::per_element());
	BOOST_TEST(config.headers() == (std::vector<std::string>{"Content-Type", "Authorization", "X-Requested-With"}), boost::test_tools::per_element());
	BOOST_TEST(not config.allow_credentials());
	BOOST_TEST((config.preflight_status() == http::status::ok));
}

BOOST_AUTO_TEST_CASE(config_from_bad_json)
{
	BOOST_CHECK_THROW(cors::policy_config::from_json("not json"), cors::config_error);
	BOOST_CHECK_THROW(cors::policy_config::from_json("[]"), cors::config_error);
	BOOST_CHECK_THROW(cors::policy_config::from_json(R"({"allowedMethods":["GET"]})"), cors::config_error);
	BOOST_CHECK_THROW(cors::policy_config::from_json(R"({"allowedOrigins":"http://localhost"})"), cors::config_error);
	BOOST_CHECK_THROW(cors::policy_config::from_json(R"({"allowedOrigins":[]})"), cors::config_error);
	BOOST_CHECK_THROW(cors::policy_config::from_json(R"({"allowedOrigins":["http://localhost"],"allowCredentials":"yes"})"), cors::config_error);
}

BOOST_AUTO_TEST_CASE(config_from_file)
{
	const auto path = std::filesystem::temp_directory_path() / "origingate-cors-test.json";
	{
		std::ofstream out(path);
		out << R"({"allowedOrigins":["https://app.example.com"]})";
	}

	auto config = cors::policy_config::from_file(path.string());
	BOOST_TEST(config.is_allowed("https://app.example.com"));
	BOOST_TEST((config.preflight_status() == http::status::no_content));

	std::filesystem::remove(path);
	BOOST_CHECK_THROW(cors::policy_config::from_file(path.string()), cors::config_error);
}

BOOST_AUTO_TEST_CASE(config_from_env_defaults)
{
	auto config = cors::policy_config::from_env();

	BOOST_TEST(config.origins() == (std::vector<std::string>{"http://localhost:5173"}), boost::test_tools::per_element());
	BOOST_TEST(config.methods() == (std::vector<std::string>{"GET", "POST", "PUT", "DELETE", "OPTIONS"}), boost::test_tools::per_element());
	BOOST_TEST(config.allow_credentials());
	BOOST_TEST((config.preflight_status() == http::status::no_content));
}

BOOST_AUTO_TEST_CASE(config_from_env_production)
{
	scoped_env app_env("APP_ENV", "production");
	scoped_env origins("CORS_ORIGINS_PRODUCTION", "https://www.example.com, https://admin.example.com");
	scoped_env credentials("CORS_CREDENTIALS", "0");

	auto config = cors::policy_config::from_env();
	BOOST_TEST(config.origins() == (std::vector<std::string>{"https://www.example.com", "https://admin.example.com"}), boost::test_tools::per_element());
	BOOST_TEST(not config.allow_credentials());
}

BOOST_AUTO_TEST_CASE(config_from_env_override)
{
	scoped_env origins("CORS_ORIGINS", "http://localhost:3000");
	scoped_env status("CORS_PREFLIGHT_STATUS", "200");

	auto config = cors::policy_config::from_env();
	BOOST_TEST(config.origins() == (std::vector<std::string>{"http://localhost:3000"}), boost::test_tools::per_element());
	BOOST_TEST((config.preflight_status() == http::status::ok));
}

BOOST_AUTO_TEST_CASE(config_from_env_errors)
{
	{
		scoped_env app_env("APP_ENV", "staging");
		BOOST_CHECK_THROW(cors::policy_config::from_env(), cors::config_error);
	}
	{
		scoped_env origins("CORS_ORIGINS", " , ");
		BOOST_CHECK_THROW(cors::policy_config::from_env(), cors::config_error);
	}
	{
		scoped_env status("CORS_PREFLIGHT_STATUS", "abc");
		BOOST_CHECK_THROW(cors::policy_config::from_env(), cors::config_error);
	}
}
