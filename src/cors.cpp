#include "cors.hpp"
#include "env.hpp"
#include "json_parser.hpp"
#include "logger.hpp"
#include <algorithm>
#include <charconv>
#include <format>
#include <fstream>
#include <iterator>
#include <sstream>

using namespace std::literals::string_view_literals;

namespace {

constexpr std::string_view token_chars =
    "!#$%&'*+-.^_`|~"
    "0123456789"
    "abcdefghijklmnopqrstuvwxyz"
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ";

bool is_token(std::string_view value) {
    return !value.empty() && value.find_first_not_of(token_chars) == std::string_view::npos;
}

bool is_host_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-' || c == '.';
}

// host = reg-name | "[" IPv6 "]"
bool is_valid_host(std::string_view host) {
    if (host.empty()) {
        return false;
    }
    if (host.front() == '[') {
        return host.size() > 2 && host.back() == ']' &&
               host.substr(1, host.size() - 2).find_first_not_of("0123456789abcdefABCDEF:."sv) == std::string_view::npos;
    }
    return std::ranges::all_of(host, is_host_char) && host.front() != '.' && host.back() != '.';
}

bool is_valid_port(std::string_view port) {
    unsigned int value = 0;
    auto [ptr, ec] = std::from_chars(port.data(), port.data() + port.size(), value);
    return ec == std::errc() && ptr == port.data() + port.size() && value >= 1 && value <= 65535;
}

void validate_tokens(const std::vector<std::string>& items, std::string_view what) {
    for (const auto& item : items) {
        if (item.empty()) {
            throw cors::config_error(std::format("empty entry in allowed {} list", what));
        }
        if (!is_token(item)) {
            throw cors::config_error(std::format("invalid {} entry '{}'", what.substr(0, what.size() - 1), item));
        }
    }
}

std::vector<std::string> trim_all(std::vector<std::string> items) {
    for (auto& item : items) {
        item = std::string(util::trim(item));
    }
    return items;
}

} // namespace

namespace cors {

// ===================================================================
//         Policy configuration
// ===================================================================

std::optional<std::string> validate_origin(std::string_view origin) {
    if (origin.empty()) {
        return "empty origin entry";
    }
    if (origin.contains('*')) {
        return std::format("wildcard origin '{}' is not allowed", origin);
    }

    const auto scheme_end = origin.find("://"sv);
    if (scheme_end == std::string_view::npos) {
        return std::format("origin '{}' has no scheme", origin);
    }
    if (const auto scheme = origin.substr(0, scheme_end); scheme != "http"sv && scheme != "https"sv) {
        return std::format("origin '{}' must use the http or https scheme", origin);
    }

    const auto authority = origin.substr(scheme_end + 3);
    if (authority.find_first_of("/?#@ \t"sv) != std::string_view::npos) {
        return std::format("origin '{}' must be scheme://host[:port] without path, query or credentials", origin);
    }

    auto host = authority;
    // The port separator is the last ':' outside an IPv6 literal.
    if (const auto colon = authority.rfind(':'); colon != std::string_view::npos && authority.find(']', colon) == std::string_view::npos) {
        host = authority.substr(0, colon);
        if (!is_valid_port(authority.substr(colon + 1))) {
            return std::format("origin '{}' has an invalid port", origin);
        }
    }
    if (!is_valid_host(host)) {
        return std::format("origin '{}' has an invalid host", origin);
    }
    return std::nullopt;
}

http::status to_preflight_status(int code) {
    switch (code) {
        case 200: return http::status::ok;
        case 204: return http::status::no_content;
        default:
            throw config_error(std::format("preflight status must be 200 or 204, got {}", code));
    }
}

policy_config::policy_config(std::vector<std::string> origins,
                             std::vector<std::string> methods,
                             std::vector<std::string> headers,
                             bool allow_credentials,
                             http::status preflight_status)
    : m_methods(trim_all(std::move(methods))),
      m_headers(trim_all(std::move(headers))),
      m_allow_credentials(allow_credentials),
      m_preflight_status(preflight_status)
{
    if (origins.empty()) {
        throw config_error("the allowed origin list is empty");
    }

    for (auto& raw : origins) {
        std::string origin(util::trim(raw));
        if (auto err = validate_origin(origin)) {
            throw config_error(*err);
        }
        if (m_origins.insert(origin).second) {
            m_origin_list.push_back(std::move(origin));
        }
    }

    validate_tokens(m_methods, "methods");
    validate_tokens(m_headers, "headers");

    if (m_preflight_status != http::status::ok && m_preflight_status != http::status::no_content) {
        throw config_error(std::format("preflight status must be 200 or 204, got {}", std::to_underlying(m_preflight_status)));
    }
}

policy_config policy_config::from_env() {
    try {
        if (const auto config_file = env::find<std::string>("CORS_CONFIG_FILE")) {
            return from_file(*config_file);
        }

        const auto app_env = env::get<std::string>("APP_ENV", "development");
        if (app_env != "development" && app_env != "production") {
            throw config_error(std::format("APP_ENV must be 'development' or 'production', got '{}'", app_env));
        }
        const bool production = app_env == "production";

        auto origins = env::find<std::string>("CORS_ORIGINS");
        if (!origins) {
            origins = production
                ? env::get<std::string>("CORS_ORIGINS_PRODUCTION", std::string(default_production_origins))
                : env::get<std::string>("CORS_ORIGINS_DEVELOPMENT", std::string(default_development_origins));
        }

        return policy_config(
            util::split_list(*origins),
            util::split_list(env::get<std::string>("CORS_METHODS", std::string(default_methods))),
            util::split_list(env::get<std::string>("CORS_HEADERS", std::string(default_headers))),
            env::get<bool>("CORS_CREDENTIALS", true),
            to_preflight_status(env::get<int>("CORS_PREFLIGHT_STATUS", 204))
        );
    } catch (const env::error& e) {
        throw config_error(e.what());
    }
}

policy_config policy_config::from_json(std::string_view json_text) {
    try {
        const json::json_parser doc(json_text);
        if (!doc.is_object()) {
            throw config_error("policy document must be a JSON object");
        }

        auto origins = doc.get_string_list("allowedOrigins");
        if (!origins) {
            throw config_error("policy document has no 'allowedOrigins'");
        }

        return policy_config(
            std::move(*origins),
            doc.get_string_list("allowedMethods").value_or(util::split_list(default_methods)),
            doc.get_string_list("allowedHeaders").value_or(util::split_list(default_headers)),
            doc.get_bool("allowCredentials").value_or(true),
            to_preflight_status(doc.get_int("preflightStatus").value_or(204))
        );
    } catch (const json::parsing_error& e) {
        throw config_error(e.what());
    }
}

policy_config policy_config::from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw config_error(std::format("cannot open policy file '{}'", path));
    }
    std::ostringstream content;
    content << file.rdbuf();
    if (file.bad()) {
        throw config_error(std::format("cannot read policy file '{}'", path));
    }
    return from_json(content.str());
}

bool policy_config::is_allowed(std::string_view origin) const noexcept {
    return m_origins.contains(origin);
}

std::string policy_config::describe() const {
    return std::format("origins [{}], methods [{}], headers [{}], credentials {}, preflight status {}",
        util::join(m_origin_list), util::join(m_methods), util::join(m_headers),
        m_allow_credentials, std::to_underlying(m_preflight_status));
}

// ===================================================================
//         Evaluation and header injection
// ===================================================================

policy_decision evaluate(std::optional<std::string_view> origin, const policy_config& config) {
    policy_decision decision{
        .allow_origin = std::nullopt,
        .allowed_methods = config.methods(),
        .allowed_headers = config.headers(),
        .allow_credentials = config.allow_credentials()
    };
    if (origin && !origin->empty() && config.is_allowed(*origin)) {
        decision.allow_origin = std::string(*origin);
    }
    return decision;
}

void inject_headers(const policy_decision& decision, http::response& res) {
    if (decision.allow_origin && !decision.allow_origin->empty()) {
        res.add_header(allow_origin_header, *decision.allow_origin);
    }
    if (!decision.allowed_methods.empty()) {
        res.add_header(allow_methods_header, util::join(decision.allowed_methods));
    }
    if (!decision.allowed_headers.empty()) {
        res.add_header(allow_headers_header, util::join(decision.allowed_headers));
    }
    if (decision.allow_credentials) {
        res.add_header(allow_credentials_header, "true");
    }
}

// ===================================================================
//         Preflight dispatcher and interceptor
// ===================================================================

preflight_state preflight_dispatcher::dispatch(http::method m, http::response& res) {
    if (m_state != preflight_state::pending) {
        return m_state;
    }
    if (m == http::method::options) {
        res.set_empty(m_status);
        m_state = preflight_state::terminated;
    } else {
        m_state = preflight_state::forwarded;
    }
    return m_state;
}

interception interceptor::intercept(const http::request& req, http::response& res) const {
    const auto origin = req.get_origin();

    interception result;
    result.decision = evaluate(origin, m_config);
    result.origin_rejected = origin.has_value() && !result.decision.allow_origin;
    if (result.origin_rejected) {
        util::log::debug("Origin '{}' is not allowed for {} {}", *origin, req.get_method_str(), req.get_path());
    }

    inject_headers(result.decision, res);

    preflight_dispatcher dispatcher(m_config.preflight_status());
    result.state = dispatcher.dispatch(req.get_method(), res);
    util::log::debug("{} {} {} by the CORS interceptor", req.get_method_str(), req.get_path(), to_string(result.state));
    return result;
}

void interceptor::annotate(std::optional<std::string_view> origin, http::response& res) const {
    inject_headers(evaluate(origin, m_config), res);
}

} // namespace cors
