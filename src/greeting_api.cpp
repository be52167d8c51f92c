#include "greeting_api.hpp"
#include "json_parser.hpp"
#include "logger.hpp"
#include <format>
#include <string>

namespace greeting {

using enum http::status;

void greet(const http::request&, http::response& res) {
    res.set_body(ok, json::json_parser::build({{"message", "Hello from the API!"}}));
}

void greetme(const http::request& req, http::response& res) {
    const auto name = req.get_value<std::string>("name");
    if (!name.has_value()) {
        util::log::warn("Invalid value '{}' for parameter '{}'", name.error().original_value, name.error().param_name);
        res.set_body(bad_request, json::json_parser::build({{"message", "Name is required in the request body."}}));
        return;
    }
    if (!name->has_value() || (*name)->empty()) {
        res.set_body(bad_request, json::json_parser::build({{"message", "Name is required in the request body."}}));
        return;
    }
    util::log::debug("Greeting '{}'", **name);
    res.set_body(ok, json::json_parser::build({{"message", std::format("Hello, {}!", **name)}}));
}

} // namespace greeting
