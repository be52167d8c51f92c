#ifndef REQUEST_PIPELINE_HPP
#define REQUEST_PIPELINE_HPP

#include "api_router.hpp"
#include "cors.hpp"
#include "http_request.hpp"
#include "http_response.hpp"
#include "metrics.hpp"
#include <memory>
#include <optional>
#include <string_view>

inline constexpr auto g_version = "1.0.0";

/**
 * @class request_pipeline
 * @brief The ordered chain every parsed request goes through.
 *
 * 1. CORS interceptor: attaches the policy headers and terminates preflights.
 * 2. Internal endpoints: /ping, /version, /metrics.
 * 3. Router: 404 for unknown paths, 405 for a known path with another method.
 *
 * A HEAD request is served like GET and its response carries no body.
 *
 * Stages 1-3 run on the I/O thread in route(). The application handler runs
 * later, usually on a worker thread, through execute().
 */
class request_pipeline {
public:
    request_pipeline(const cors::interceptor& cors, const api_router& router, std::shared_ptr<metrics> metrics_ptr);

    /**
     * @brief Runs the synchronous stages for a request.
     * @return The endpoint to execute, or nullptr if the response is already final.
     */
    [[nodiscard]] const api_endpoint* route(const http::request& req, http::response& res) const;

    /// @brief Runs an application handler and maps its exceptions to error responses.
    void execute(const http::request& req, http::response& res, const api_endpoint& endpoint) const;

    /// @brief route() followed by execute() on the calling thread.
    void handle(const http::request& req, http::response& res) const;

    /**
     * @brief Finalizes a server-generated error response with the CORS headers for an origin.
     *
     * Used for requests that never became an http::request, e.g. unparsable or oversized ones.
     */
    void reject(std::optional<std::string_view> origin, http::response& res, http::status s, std::string_view body) const;

private:
    [[nodiscard]] bool handle_internal_api(const http::request& req, http::response& res) const;

    const cors::interceptor& m_cors;
    const api_router& m_router;
    std::shared_ptr<metrics> m_metrics;
};

#endif // REQUEST_PIPELINE_HPP
