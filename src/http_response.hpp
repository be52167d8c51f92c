#ifndef HTTP_RESPONSE_HPP
#define HTTP_RESPONSE_HPP

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <span>
#include <format>
#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <utility>
#include <algorithm>
#include <cctype>
#include <iterator>

namespace http {

enum class status {
    ok = 200,
    no_content = 204,
    bad_request = 400,
    not_found = 404,
    method_not_allowed = 405,
    entity_too_large = 413,
    internal_server_error = 500,
    service_unavailable = 503
};

[[nodiscard]] constexpr std::string_view to_reason_phrase(status s) {
    using enum status;
    switch (s) {
        case ok: return "OK";
        case no_content: return "No Content";
        case bad_request: return "Bad Request";
        case not_found: return "Not Found";
        case method_not_allowed: return "Method Not Allowed";
        case entity_too_large: return "Request Entity Too Large";
        case internal_server_error: return "Internal Server Error";
        case service_unavailable: return "Service Unavailable";
    }
    return "Unknown Status";
}

using header_field = std::pair<std::string, std::string>;

/**
 * @class response
 * @brief An HTTP/1.1 response serialized into a single write buffer.
 *
 * Extra header fields are collected with add_header() and written, in the
 * order they were added, when the response is finalized by set_body() or
 * set_empty(). After that the response is immutable and only the write
 * position advances.
 */
class response {
public:
    response();

    /// @throws std::invalid_argument if the value contains CR or LF.
    void add_header(std::string_view name, std::string_view value);
    void set_body(status s, std::string_view body, std::string_view content_type = "application/json; charset=utf-8");
    void set_empty(status s);

    /// @brief Answers a HEAD request: set_body() keeps Content-Length but writes no body.
    void omit_body() noexcept;

    [[nodiscard]] const std::vector<header_field>& headers() const noexcept;
    [[nodiscard]] std::optional<std::string_view> header(std::string_view name) const noexcept;
    [[nodiscard]] std::string_view body() const noexcept;
    [[nodiscard]] bool is_finalized() const noexcept;

    [[nodiscard]] std::span<const char> buffer() const noexcept;
    [[nodiscard]] size_t available_size() const noexcept;
    void update_pos(size_t bytes_sent) noexcept;
    [[nodiscard]] std::optional<status> status_code() const noexcept;
private:
    void write_head(status s, std::optional<std::string_view> content_type, size_t content_length);

    std::vector<char> m_buffer;
    std::vector<header_field> m_headers;
    size_t m_readPos{0};
    size_t m_bodyPos{0};
    bool m_finalized{false};
    bool m_omitBody{false};
    std::optional<status> m_status;
};

inline response::response()
{
    m_buffer.reserve(4096);
}

inline void response::add_header(std::string_view name, std::string_view value) {
    if (m_finalized) return;
    if (value.find_first_of("\r\n") != std::string_view::npos || name.find_first_of("\r\n:") != std::string_view::npos) {
        throw std::invalid_argument(std::format("invalid response header field: {}", name));
    }
    m_headers.emplace_back(name, value);
}

inline void response::write_head(status s, std::optional<std::string_view> content_type, size_t content_length) {
    m_status = s;
    constexpr std::string_view format_template =
        "HTTP/1.1 {} {}\r\n"
        "Date: {:%a, %d %b %Y %H:%M:%S GMT}\r\n"
        "Strict-Transport-Security: max-age=31536000; includeSubDomains\r\n"
        "X-Frame-Options: SAMEORIGIN\r\n"
        "X-Content-Type-Options: nosniff\r\n"
        "Referrer-Policy: no-referrer\r\n"
        "Cache-Control: no-store\r\n"
        "Connection: close\r\n";
    auto out = std::format_to(
        std::back_inserter(m_buffer),
        format_template,
        std::to_underlying(s),
        to_reason_phrase(s),
        std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now())
    );
    if (content_type) {
        out = std::format_to(out, "Content-Type: {}\r\n", *content_type);
    }
    out = std::format_to(out, "Content-Length: {}\r\n", content_length);
    for (const auto& [name, value] : m_headers) {
        out = std::format_to(out, "{}: {}\r\n", name, value);
    }
    std::format_to(out, "\r\n");
    m_bodyPos = m_buffer.size();
}

inline void response::set_body(status s, std::string_view body, std::string_view content_type) {
    if (m_finalized) return;
    write_head(s, content_type, body.size());
    if (!m_omitBody) {
        m_buffer.insert(m_buffer.end(), body.begin(), body.end());
    }
    m_finalized = true;
}

inline void response::set_empty(status s) {
    if (m_finalized) return;
    write_head(s, std::nullopt, 0);
    m_finalized = true;
}

inline void response::omit_body() noexcept {
    m_omitBody = true;
}

inline const std::vector<header_field>& response::headers() const noexcept {
    return m_headers;
}

inline std::optional<std::string_view> response::header(std::string_view name) const noexcept {
    const auto it = std::ranges::find_if(m_headers, [name](const header_field& field) {
        return std::ranges::equal(field.first, name, [](char a, char b) {
            return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
        });
    });
    if (it == m_headers.end()) {
        return std::nullopt;
    }
    return it->second;
}

inline std::string_view response::body() const noexcept {
    if (!m_finalized) {
        return {};
    }
    return {m_buffer.data() + m_bodyPos, m_buffer.size() - m_bodyPos};
}

inline bool response::is_finalized() const noexcept {
    return m_finalized;
}

inline std::span<const char> response::buffer() const noexcept {
    if (m_readPos >= m_buffer.size()) {
        return {};
    }
    return {m_buffer.data() + m_readPos, available_size()};
}

inline size_t response::available_size() const noexcept {
    return m_buffer.size() > m_readPos ? m_buffer.size() - m_readPos : 0;
}

inline void response::update_pos(size_t bytes_sent) noexcept {
    m_readPos += bytes_sent;
}

inline std::optional<status> response::status_code() const noexcept {
    return m_status;
}

} // namespace http

#endif // HTTP_RESPONSE_HPP
