#ifndef HTTP_REQUEST_HPP
#define HTTP_REQUEST_HPP

#include "socket_buffer.hpp"
#include "json_parser.hpp"
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>
#include <charconv>
#include <optional>
#include <string>
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <ranges>
#include <expected>
#include <span>
#include <memory>
#include <utility>

namespace http {

// --- Type Definitions (must come before classes that use them) ---

struct sv_ci_hash {
    using is_transparent = void;
    [[nodiscard]] auto operator()(std::string_view sv) const noexcept -> size_t {
        size_t hash = 5381;
        for (const auto c : sv) {
            hash = ((hash << 5) + hash) + static_cast<size_t>(std::tolower(static_cast<unsigned char>(c)));
        }
        return hash;
    }
};

struct sv_ci_equal {
    using is_transparent = void;
    [[nodiscard]] auto operator()(std::string_view lhs, std::string_view rhs) const noexcept -> bool {
        return lhs.size() == rhs.size() &&
               std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
                   return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
               });
    }
};

using header_map = std::unordered_map<std::string, std::string_view, sv_ci_hash, sv_ci_equal>;

using request_body = std::variant<std::monostate, std::string_view>;

class request_parse_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct param_error {
    std::string param_name;
    std::string original_value;
};

enum class method {
    get,
    head,
    post,
    put,
    patch,
    del,
    options,
    unknown
};

[[nodiscard]] constexpr std::string_view to_string(method m) noexcept {
    using enum method;
    switch (m) {
        case get:     return "GET";
        case head:    return "HEAD";
        case post:    return "POST";
        case put:     return "PUT";
        case patch:   return "PATCH";
        case del:     return "DELETE";
        case options: return "OPTIONS";
        case unknown: return "UNKNOWN";
    }
    return "UNKNOWN";
}

/// @brief Maps a request-line method token to a method; matching is case-sensitive per RFC 9110.
[[nodiscard]] constexpr method method_from_string(std::string_view token) noexcept {
    using enum method;
    for (const auto m : {get, head, post, put, patch, del, options}) {
        if (to_string(m) == token) {
            return m;
        }
    }
    return unknown;
}

/// @brief True for the methods whose body is read using Content-Length.
[[nodiscard]] constexpr bool has_request_body(method m) noexcept {
    return m == method::post || m == method::put || m == method::patch;
}

// Forward declaration
class request_parser;

class request {
public:
    explicit request(request_parser&& parser, std::string_view remote_ip);
    ~request();
    request(const request&) = delete;
    request& operator=(const request&) = delete;
    request(request&&) noexcept;
    request& operator=(request&&) noexcept;

    [[nodiscard]] auto get_method() const noexcept -> method;
    [[nodiscard]] auto get_method_str() const noexcept -> std::string_view;
    [[nodiscard]] auto get_remote_ip() const noexcept -> std::string_view;
    [[nodiscard]] auto get_headers() const noexcept -> const header_map&;
    [[nodiscard]] auto get_body() const noexcept -> const request_body&;
    [[nodiscard]] auto get_path() const noexcept -> std::string_view;
    [[nodiscard]] auto get_header_value(std::string_view key) const noexcept -> std::optional<std::string_view>;

    /// @brief The value of the Origin header, if the caller sent one.
    [[nodiscard]] auto get_origin() const noexcept -> std::optional<std::string_view>;

    template <typename t>
    [[nodiscard]] auto get_value(std::string_view param_name) const noexcept -> std::expected<std::optional<t>, param_error>;

private:
    std::unique_ptr<socket_buffer> m_buffer;
    std::unique_ptr<json::json_parser> m_jsonPayload;
    method m_method{method::unknown};
    header_map m_headers;
    request_body m_body;
    std::string_view m_path;
    std::string m_remote_ip;
};


class request_parser {
public:
    friend class request;
    explicit request_parser(size_t max_request_size = socket_buffer::k_default_max_size);
    ~request_parser() noexcept;
    request_parser(request_parser&&) noexcept;
    request_parser& operator=(request_parser&&) noexcept;
    request_parser(const request_parser&) = delete;
    request_parser& operator=(const request_parser&) = delete;

    [[nodiscard]] auto get_buffer() noexcept -> std::span<char>;

    /**
     * @brief Commits bytes written into get_buffer().
     * @throws socket_buffer_error when the buffer is full and the request is still
     *         incomplete, or when the declared Content-Length cannot fit in the limit.
     */
    void update_pos(ssize_t bytes_read);
    [[nodiscard]] auto eof() -> bool;
    [[nodiscard]] auto finalize() -> std::expected<void, request_parse_error>;

    /// @brief Header value from the raw buffer, usable before finalize().
    [[nodiscard]] auto peek_header(std::string_view key) const -> std::optional<std::string_view>;

private:
    auto find_and_store_header_end() -> bool;
    auto parse_and_store_method() -> bool;
    auto parse_and_store_content_length() -> bool;
    auto parse_headers(std::string_view headers_sv) -> std::optional<request_parse_error>;
    auto parse_request_line(std::string_view request_line) -> std::optional<request_parse_error>;
    auto parse_uri(std::string_view uri) -> std::optional<request_parse_error>;
    auto parse_body() -> std::optional<request_parse_error>;

    std::unique_ptr<socket_buffer> m_buffer;

    std::unique_ptr<json::json_parser> m_jsonPayload;
    method m_parsedMethod{method::unknown};
    std::optional<method> m_identifiedMethod;
    std::optional<size_t> m_identifiedContentLength;
    std::optional<size_t> m_identifiedHeaderSize;
    bool m_contentLengthMissing{false};
    bool m_contentLengthTooLarge{false};
    header_map m_headers;
    request_body m_body;
    std::string_view m_path;
    size_t m_contentLength{0};
    size_t m_headerSize{0};
    bool m_isFinalized{false};
};

} // namespace http

#endif // HTTP_REQUEST_HPP
