#include "request_pipeline.hpp"
#include "json_parser.hpp"
#include "logger.hpp"
#include <format>
#include <utility>

request_pipeline::request_pipeline(const cors::interceptor& cors, const api_router& router, std::shared_ptr<metrics> metrics_ptr)
    : m_cors(cors),
      m_router(router),
      m_metrics(std::move(metrics_ptr)) {}

const api_endpoint* request_pipeline::route(const http::request& req, http::response& res) const {
    using enum http::status;

    if (req.get_method() == http::method::head) {
        res.omit_body();
    }

    const auto result = m_cors.intercept(req, res);
    if (result.origin_rejected) {
        m_metrics->increment_rejected_origins();
    }
    if (result.state == cors::preflight_state::terminated) {
        m_metrics->increment_preflights();
        return nullptr;
    }

    if (handle_internal_api(req, res)) {
        return nullptr;
    }

    if (const auto* endpoint = m_router.find_handler(req.get_path(), req.get_method())) {
        return endpoint;
    }

    if (m_router.has_path(req.get_path())) {
        res.set_body(method_not_allowed, R"({"error":"Method Not Allowed"})");
    } else {
        res.set_body(not_found, R"({"error":"Not Found"})");
    }
    return nullptr;
}

void request_pipeline::execute(const http::request& req, http::response& res, const api_endpoint& endpoint) const {
    using enum http::status;
    try {
        endpoint.handler(req, res);
        if (!res.is_finalized()) {
            util::log::error("Handler for {} {} returned without a response", req.get_method_str(), req.get_path());
            res.set_body(internal_server_error, R"({"error":"Internal Server Error"})");
        }
    } catch (const json::parsing_error& e) {
        util::log::error("JSON parsing error in handler for path '{}': {}", req.get_path(), e.what());
        res.set_body(bad_request, R"({"error":"Invalid JSON format in request"})");
    } catch (const json::output_error& e) {
        util::log::error("JSON output error in handler for path '{}': {}", req.get_path(), e.what());
        res.set_body(internal_server_error, R"({"error":"Failed to generate JSON response"})");
    } catch (/* NOSONAR */ const std::exception& e) {
        util::log::error("Unhandled exception in handler for path '{}': {}", req.get_path(), e.what());
        res.set_body(internal_server_error, R"({"error":"Internal Server Error"})");
    }
}

void request_pipeline::handle(const http::request& req, http::response& res) const {
    if (const auto* endpoint = route(req, res)) {
        execute(req, res, *endpoint);
    }
}

void request_pipeline::reject(std::optional<std::string_view> origin, http::response& res, http::status s, std::string_view body) const {
    m_cors.annotate(origin, res);
    res.set_body(s, body);
}

bool request_pipeline::handle_internal_api(const http::request& req, http::response& res) const {
    using enum http::status;
    if (req.get_method() != http::method::get && req.get_method() != http::method::head) {
        return false;
    }
    if (req.get_path() == "/metrics") {
        res.set_body(ok, m_metrics->to_json());
        return true;
    }
    if (req.get_path() == "/ping") {
        res.set_body(ok, R"({"status":"OK"})");
        return true;
    }
    if (req.get_path() == "/version") {
        res.set_body(ok, json::json_parser::build({
            {"pod_name", m_metrics->get_pod_name()},
            {"version", g_version}
        }));
        return true;
    }
    return false;
}
