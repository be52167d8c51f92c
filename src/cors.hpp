#ifndef CORS_HPP
#define CORS_HPP

#include "http_request.hpp"
#include "http_response.hpp"
#include "util.hpp"
#include <string>
#include <string_view>
#include <optional>
#include <unordered_set>
#include <vector>
#include <stdexcept>
#include <functional> // For std::equal_to

namespace cors {

inline constexpr std::string_view allow_origin_header = "Access-Control-Allow-Origin";
inline constexpr std::string_view allow_methods_header = "Access-Control-Allow-Methods";
inline constexpr std::string_view allow_headers_header = "Access-Control-Allow-Headers";
inline constexpr std::string_view allow_credentials_header = "Access-Control-Allow-Credentials";

inline constexpr std::string_view default_development_origins = "http://localhost:5173";
inline constexpr std::string_view default_production_origins = "https://www.your-production-frontend.com";
inline constexpr std::string_view default_methods = "GET, POST, PUT, DELETE, OPTIONS";
inline constexpr std::string_view default_headers = "Content-Type, Authorization, X-Requested-With";

/**
 * @brief Thrown while loading the policy when it is empty or malformed.
 *
 * Raised only at startup; a request never produces this error.
 */
class config_error : public std::runtime_error {
public:
    explicit config_error(const std::string& message)
        : std::runtime_error("cors policy: " + message) {}
};

using origin_set = std::unordered_set<std::string, util::string_hash, util::string_equal>;

/**
 * @class policy_config
 * @brief The immutable cross-origin policy of the process.
 *
 * Every constructor validates its input and throws config_error, so an
 * instance that exists is always usable.
 */
class policy_config {
public:
    /**
     * @param origins Allowed origins, exact "scheme://host[:port]" values.
     * @param methods Methods advertised in Access-Control-Allow-Methods.
     * @param headers Request headers advertised in Access-Control-Allow-Headers.
     * @param allow_credentials Whether Access-Control-Allow-Credentials: true is sent.
     * @param preflight_status Status of terminated preflight responses, 200 or 204.
     * @throws config_error on an empty origin list or any malformed entry.
     */
    policy_config(std::vector<std::string> origins,
                  std::vector<std::string> methods,
                  std::vector<std::string> headers,
                  bool allow_credentials,
                  http::status preflight_status = http::status::no_content);

    /**
     * @brief Loads the policy from CORS_CONFIG_FILE, or from the CORS_* and APP_ENV variables.
     * @throws config_error on any misconfiguration, including unreadable variables.
     */
    [[nodiscard]] static policy_config from_env();

    /// @throws config_error if the text is not a valid policy document.
    [[nodiscard]] static policy_config from_json(std::string_view json_text);

    /// @throws config_error if the file cannot be read or is not a valid policy document.
    [[nodiscard]] static policy_config from_file(const std::string& path);

    [[nodiscard]] bool is_allowed(std::string_view origin) const noexcept;

    [[nodiscard]] const std::vector<std::string>& origins() const noexcept { return m_origin_list; }
    [[nodiscard]] const std::vector<std::string>& methods() const noexcept { return m_methods; }
    [[nodiscard]] const std::vector<std::string>& headers() const noexcept { return m_headers; }
    [[nodiscard]] bool allow_credentials() const noexcept { return m_allow_credentials; }
    [[nodiscard]] http::status preflight_status() const noexcept { return m_preflight_status; }

    /// @brief One-line summary for the startup log.
    [[nodiscard]] std::string describe() const;

private:
    std::vector<std::string> m_origin_list;
    origin_set m_origins;
    std::vector<std::string> m_methods;
    std::vector<std::string> m_headers;
    bool m_allow_credentials;
    http::status m_preflight_status;
};

/**
 * @brief Maps a configured preflight status code to a status.
 * @throws config_error for anything other than 200 or 204.
 */
[[nodiscard]] http::status to_preflight_status(int code);

/**
 * @brief Checks a single allow-list entry.
 * @return An error description, or std::nullopt if the origin is well formed.
 */
[[nodiscard]] std::optional<std::string> validate_origin(std::string_view origin);


/**
 * @struct policy_decision
 * @brief The per-request outcome of the policy: which CORS headers to emit.
 */
struct policy_decision {
    std::optional<std::string> allow_origin;
    std::vector<std::string> allowed_methods;
    std::vector<std::string> allowed_headers;
    bool allow_credentials{false};

    bool operator==(const policy_decision&) const = default;
};

/**
 * @brief Decides the CORS outcome for a request origin.
 *
 * The origin is echoed only when it is an exact member of the allow-list. An
 * absent or disallowed origin yields no allow_origin; the methods, headers and
 * credentials flag always come from the configuration.
 *
 * @param origin The Origin request header, if any.
 * @param config The process policy.
 * @return The decision. Never throws on any origin value.
 */
[[nodiscard]] policy_decision evaluate(std::optional<std::string_view> origin, const policy_config& config);

/**
 * @brief Adds the decision's CORS headers to a response that is not yet finalized.
 *
 * Order: Allow-Origin (if set), Allow-Methods, Allow-Headers (if non-empty),
 * Allow-Credentials (only as "true").
 */
void inject_headers(const policy_decision& decision, http::response& res);


enum class preflight_state {
    pending,
    terminated,
    forwarded
};

[[nodiscard]] constexpr std::string_view to_string(preflight_state state) noexcept {
    switch (state) {
        case preflight_state::pending: return "pending";
        case preflight_state::terminated: return "terminated";
        case preflight_state::forwarded: return "forwarded";
    }
    return "unknown";
}

/**
 * @class preflight_dispatcher
 * @brief Ends OPTIONS requests before they reach application handlers.
 *
 * One instance per request. The first dispatch() moves it out of pending;
 * later calls return the state already reached without touching the response.
 */
class preflight_dispatcher {
public:
    explicit preflight_dispatcher(http::status preflight_status) noexcept
        : m_status(preflight_status) {}

    preflight_state dispatch(http::method m, http::response& res);

    [[nodiscard]] preflight_state state() const noexcept { return m_state; }

private:
    http::status m_status;
    preflight_state m_state{preflight_state::pending};
};


/// @brief Result of running a request through the interceptor.
struct interception {
    policy_decision decision;
    preflight_state state{preflight_state::pending};
    bool origin_rejected{false};
};

/**
 * @class interceptor
 * @brief Runs evaluate, inject_headers and the preflight dispatcher, in that order.
 */
class interceptor {
public:
    explicit interceptor(policy_config config) : m_config(std::move(config)) {}

    /**
     * @brief Applies the policy to a request.
     *
     * The response carries the CORS headers afterwards. If the returned state
     * is preflight_state::terminated, the response is also finalized and must
     * be sent as is.
     */
    [[nodiscard]] interception intercept(const http::request& req, http::response& res) const;

    /**
     * @brief Adds the CORS headers for an origin to a response the server
     * produces itself, e.g. for a request that could not be parsed.
     */
    void annotate(std::optional<std::string_view> origin, http::response& res) const;

    [[nodiscard]] const policy_config& config() const noexcept { return m_config; }

private:
    policy_config m_config;
};

} // namespace cors

#endif // CORS_HPP
