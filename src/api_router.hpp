#ifndef API_ROUTER_HPP
#define API_ROUTER_HPP

#include "http_request.hpp"
#include "http_response.hpp"
#include "webapi_path.hpp"
#include <string_view>
#include <unordered_map>
#include <functional>
#include <stdexcept>
#include <vector>
#include <algorithm>
#include <memory>
#include <string>

// A type alias for our API handler functions
using api_handler_func = std::function<void(const http::request&, http::response&)>;

/**
 * @struct api_endpoint
 * @brief Holds all the information for a registered API endpoint.
 */
struct api_endpoint {
    http::method method;
    api_handler_func handler;
};

/**
 * @class api_router
 * @brief The central catalog for registering and looking up API endpoints.
 *
 * A path may be registered once per method. OPTIONS cannot be registered:
 * preflight requests are answered by the CORS interceptor and never routed.
 */
class api_router {
public:
    /**
     * @brief Registers a new API endpoint.
     * @param path The compile-time validated URI path.
     * @param method The required HTTP method for this endpoint.
     * @param handler The function to execute for this endpoint.
     * @throws std::logic_error for OPTIONS or a duplicate path and method.
     */
    void register_api(webapi_path path, http::method method, api_handler_func handler) {
        if (method == http::method::options || method == http::method::unknown) {
            throw std::logic_error(std::string("Cannot register a handler for ") + std::string(http::to_string(method)) + " " + std::string(path.get()));
        }
        auto& endpoints = m_routes[path.get()];
        if (std::ranges::any_of(endpoints, [method](const api_endpoint& e) { return e.method == method; })) {
            throw std::logic_error(std::string("Duplicate route: ") + std::string(http::to_string(method)) + " " + std::string(path.get()));
        }
        endpoints.push_back({method, std::move(handler)});
    }

    /**
     * @brief Finds the handler for a request path and method.
     *
     * HEAD uses the GET handler of the path unless a HEAD handler is registered.
     * @return A pointer to the api_endpoint if found, otherwise nullptr.
     */
    [[nodiscard]] const api_endpoint* find_handler(std::string_view path, http::method method) const {
        auto it = m_routes.find(path);
        if (it == m_routes.end()) {
            return nullptr;
        }
        auto match = [&endpoints = it->second](http::method m) -> const api_endpoint* {
            auto ep = std::ranges::find_if(endpoints, [m](const api_endpoint& e) { return e.method == m; });
            return ep != endpoints.end() ? std::to_address(ep) : nullptr;
        };
        if (const auto* ep = match(method)) {
            return ep;
        }
        return method == http::method::head ? match(http::method::get) : nullptr;
    }

    /// @brief True if any method is registered for the path.
    [[nodiscard]] bool has_path(std::string_view path) const {
        return m_routes.contains(path);
    }

private:
    // Keys point into the string literals behind each webapi_path.
    std::unordered_map<std::string_view, std::vector<api_endpoint>> m_routes;
};

#endif // API_ROUTER_HPP
