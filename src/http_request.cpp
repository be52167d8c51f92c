#include "http_request.hpp"
#include "util.hpp"
#include <utility>
#include <format>
#include <memory>
#include <algorithm>

using namespace std::literals::string_view_literals;

namespace {

// Per RFC 7230 (and 9112), a 'token' is 1*tchar
// tchar = "!" / "#" / "$" / "%" / "&" / "'" / "*"
//       / "+" / "-" / "." / "^" / "_" / "`" / "|" / "~"
//       / DIGIT / ALPHA
inline bool is_valid_header_key(std::string_view key) {
    if (key.empty()) {
        return false;
    }
    constexpr std::string_view valid_tchars =
        "!#$%&'*+-.^_`|~"
        "0123456789"
        "abcdefghijklmnopqrstuvwxyz"
        "ABCDEFGHIJKLMNOPQRSTUVWXYZ";

    return key.find_first_not_of(valid_tchars) == std::string_view::npos;
}

// Bare CR and LF are prohibited to prevent response splitting.
inline bool is_valid_header_value(std::string_view value) {
    return value.find_first_of("\r\n"sv) == std::string_view::npos;
}

constexpr size_t MAX_PATH_LENGTH = 2048;

// URL-encoded characters ('%') are rejected outright to block a class of
// obfuscation attacks.
inline bool is_valid_path(std::string_view path) {
    if (path.empty() || path[0] != '/') {
        return false;
    }

    if (constexpr std::string_view invalid_chars = "%\0\r\n\\"sv; path.find_first_of(invalid_chars) != std::string_view::npos) {
        return false;
    }

    return !path.contains(".."sv);
}

inline bool is_supported_version(std::string_view version) {
    return version == "HTTP/1.1"sv || version == "HTTP/1.0"sv;
}

} // namespace

namespace http {

// ===================================================================
//         request_parser: Implementation
// ===================================================================
request_parser::request_parser(size_t max_request_size)
    : m_buffer(std::make_unique<socket_buffer>(max_request_size)) {}

request_parser::~request_parser() noexcept = default;

request_parser::request_parser(request_parser&&) noexcept = default;
request_parser& request_parser::operator=(request_parser&&) noexcept = default;

auto request_parser::get_buffer() noexcept -> std::span<char> {
    return m_buffer->buffer();
}

void request_parser::update_pos(ssize_t bytes_read) {
    if (m_isFinalized) {
        return;
    }
    m_buffer->update_pos(bytes_read);

    const bool complete = eof();
    if (m_contentLengthTooLarge) {
        throw socket_buffer_error(std::format("Content-Length exceeds the maximum request size of {} bytes.", m_buffer->max_size()));
    }
    if (!complete && m_buffer->full()) {
        throw socket_buffer_error(std::format("Maximum request size reached: {} bytes.", m_buffer->max_size()));
    }
}

auto request_parser::eof() -> bool {
    if (!find_and_store_header_end()) {
        return false;
    }
    if (!parse_and_store_method()) {
        return false;
    }

    // Unknown methods are complete as soon as the header block is; finalize() rejects them.
    if (!has_request_body(*m_identifiedMethod)) {
        return true;
    }

    if (!parse_and_store_content_length()) {
        return false;
    }
    if (m_contentLengthMissing || m_contentLengthTooLarge) {
        return true;
    }
    return m_buffer->size() >= (*m_identifiedHeaderSize + *m_identifiedContentLength);
}

auto request_parser::finalize() -> std::expected<void, request_parse_error> {
    using enum http::method;

    if (m_isFinalized) {
        return {};
    }

    if (!eof()) {
        return std::unexpected(request_parse_error("Attempted to finalize before request reached eof()."));
    }

    if (m_identifiedMethod == unknown) {
        return std::unexpected(request_parse_error("Unsupported HTTP method."));
    }

    const auto request_sv = m_buffer->view();

    const auto first_line_end_pos = request_sv.find("\r\n"sv);
    if (first_line_end_pos == std::string_view::npos) {
        return std::unexpected(request_parse_error("Malformed request: request line not found."));
    }
    if (auto err = parse_request_line(request_sv.substr(0, first_line_end_pos))) {
        return std::unexpected(*err);
    }

    m_parsedMethod = *m_identifiedMethod;

    const auto headers_end_pos_marker = *m_identifiedHeaderSize - 4;
    if (headers_end_pos_marker > first_line_end_pos) {
        const auto headers_sv = request_sv.substr(first_line_end_pos + 2, headers_end_pos_marker - (first_line_end_pos + 2));
        if (auto err = parse_headers(headers_sv)) {
            return std::unexpected(*err);
        }
    }

    m_headerSize = *m_identifiedHeaderSize;

    if (has_request_body(m_parsedMethod)) {
        if (m_contentLengthTooLarge) {
            return std::unexpected(request_parse_error(
                std::format("Content-Length exceeds the maximum request size of {} bytes.", m_buffer->max_size())
            ));
        }
        if (m_contentLengthMissing) {
            return std::unexpected(request_parse_error(
                std::format("{} request without a valid Content-Length header.", to_string(m_parsedMethod))
            ));
        }
        m_contentLength = *m_identifiedContentLength;

        if (auto err = parse_body()) {
            return std::unexpected(*err);
        }
    }

    m_isFinalized = true;
    return {};
}

auto request_parser::peek_header(std::string_view key) const -> std::optional<std::string_view> {
    const auto current_buffer_view = m_buffer->view();
    const auto headers_end = current_buffer_view.find("\r\n\r\n"sv);
    const auto request_line_end = current_buffer_view.find("\r\n"sv);
    if (headers_end == std::string_view::npos || request_line_end >= headers_end) {
        return std::nullopt;
    }

    const auto headers_part = current_buffer_view.substr(request_line_end + 2, headers_end - (request_line_end + 2));
    for (const auto line_range : headers_part | std::views::split("\r\n"sv)) {
        const std::string_view header_line(line_range.begin(), line_range.end());
        if (auto colon_pos = header_line.find(':'); colon_pos != std::string_view::npos && sv_ci_equal{}(header_line.substr(0, colon_pos), key)) {
            return util::trim(header_line.substr(colon_pos + 1));
        }
    }
    return std::nullopt;
}

auto request_parser::find_and_store_header_end() -> bool {
    if (m_identifiedHeaderSize.has_value()) {
        return true;
    }
    const auto current_buffer_view = m_buffer->view();

    if (const auto headers_end_pos = current_buffer_view.find("\r\n\r\n"sv); headers_end_pos != std::string_view::npos) {
        m_identifiedHeaderSize = headers_end_pos + 4;
        return true;
    }

    return false;
}

auto request_parser::parse_and_store_method() -> bool {
    if (m_identifiedMethod.has_value()) {
        return true;
    }
    if (!m_identifiedHeaderSize.has_value()) {
        return false;
    }

    const auto current_buffer_view = m_buffer->view();
    const auto request_line_end = current_buffer_view.find("\r\n"sv);
    if (request_line_end == std::string_view::npos || request_line_end == 0) {
        m_identifiedMethod = method::unknown;
        return true;
    }

    const std::string_view request_line_sv = current_buffer_view.substr(0, request_line_end);
    if (const auto method_space_pos = request_line_sv.find(' '); method_space_pos == std::string_view::npos) {
        m_identifiedMethod = method::unknown;
    } else {
        m_identifiedMethod = method_from_string(request_line_sv.substr(0, method_space_pos));
    }
    return true;
}

auto request_parser::parse_and_store_content_length() -> bool {
    if (m_identifiedContentLength.has_value() || m_contentLengthMissing || m_contentLengthTooLarge) {
        return true;
    }
    if (!m_identifiedHeaderSize.has_value()) {
        return false;
    }

    const auto cl_value = peek_header("Content-Length"sv);
    if (!cl_value) {
        m_contentLengthMissing = true;
        return true;
    }

    size_t temp_cl = 0;
    auto [ptr, ec] = std::from_chars(cl_value->data(), cl_value->data() + cl_value->size(), temp_cl);
    if (ec == std::errc() && ptr == cl_value->data() + cl_value->size()) {
        // The header block already sits in the buffer, so the subtraction cannot wrap.
        if (temp_cl > m_buffer->max_size() - *m_identifiedHeaderSize) {
            m_contentLengthTooLarge = true;
        } else {
            m_identifiedContentLength = temp_cl;
        }
    } else {
        m_contentLengthMissing = true;
    }
    return true;
}

auto request_parser::parse_request_line(std::string_view request_line) -> std::optional<request_parse_error> {
    std::vector<std::string_view> parts;
    for (const auto part : request_line | std::views::split(' ')) {
        parts.emplace_back(part.begin(), part.end());
    }

    if (parts.size() != 3) {
        return request_parse_error(std::format("Malformed request line: '{}'", request_line));
    }
    if (!is_supported_version(parts[2])) {
        return request_parse_error(std::format("Unsupported HTTP version: '{}'", parts[2]));
    }

    return parse_uri(parts[1]);
}

auto request_parser::parse_uri(std::string_view uri) -> std::optional<request_parse_error> {
    if (uri.contains('?')) {
        return request_parse_error(std::format("URI query parameters are not allowed. URI: '{}'", uri));
    }

    if (uri.length() > MAX_PATH_LENGTH) {
        return request_parse_error(std::format("URI exceeds maximum length of {}. URI: '{}'", MAX_PATH_LENGTH, uri));
    }

    m_path = uri;

    if (!is_valid_path(m_path)) {
        return request_parse_error(std::format("Invalid URI path: contains forbidden characters or traversal sequences. URI: '{}'", uri));
    }

    return std::nullopt;
}

auto request_parser::parse_headers(std::string_view headers_sv) -> std::optional<request_parse_error> {
    for (const auto line_range : headers_sv | std::views::split("\r\n"sv)) {
        std::string_view header_line(line_range.begin(), line_range.end());
        if (header_line.empty()) {
            continue;
        }

        const auto pos = header_line.find(':');
        if (pos == std::string_view::npos) {
            return request_parse_error(std::format("Malformed header line: {}", header_line));
        }

        const auto key = header_line.substr(0, pos);
        if (!is_valid_header_key(key)) {
            return request_parse_error(std::format("Invalid header key: {}", key));
        }

        const auto value = util::trim(header_line.substr(pos + 1));
        if (!is_valid_header_value(value)) {
            return request_parse_error(std::format("Invalid characters in header value for key: {}", key));
        }

        // Request smuggling protection.
        if (sv_ci_equal{}(key, "Transfer-Encoding")) {
            return request_parse_error("Transfer-Encoding is not supported.");
        }
        if (sv_ci_equal{}(key, "Host") && m_headers.contains("Host")) {
            return request_parse_error("Duplicate Host header detected.");
        }

        m_headers.try_emplace(std::string(key), value);
    }
    return std::nullopt;
}

auto request_parser::parse_body() -> std::optional<request_parse_error> {
    const auto body_view = m_buffer->view().substr(m_headerSize, m_contentLength);
    m_body = body_view;

    if (body_view.empty()) {
        return std::nullopt;
    }

    if (auto it = m_headers.find("content-type"); it != m_headers.end() && it->second.starts_with("application/json"sv)) {
        try {
            m_jsonPayload = std::make_unique<json::json_parser>(body_view);
        } catch (const json::parsing_error& e) {
            return request_parse_error(std::string("JSON parse error: ") + e.what());
        }
    }
    return std::nullopt;
}


// ===================================================================
//         request: Implementation
// ===================================================================

request::request(request_parser&& parser, std::string_view remote_ip)
    : m_buffer(std::move(parser.m_buffer)),
      m_jsonPayload(std::move(parser.m_jsonPayload)),
      m_method(parser.m_parsedMethod),
      m_headers(std::move(parser.m_headers)),
      m_body(std::move(parser.m_body)),
      m_path(parser.m_path),
      m_remote_ip(remote_ip)
{}

request::~request() noexcept = default;
request::request(request&&) noexcept = default;
request& request::operator=(request&&) noexcept = default;

auto request::get_method() const noexcept -> method { return m_method; }

auto request::get_method_str() const noexcept -> std::string_view {
    return to_string(m_method);
}

auto request::get_remote_ip() const noexcept -> std::string_view {
    return m_remote_ip;
}

auto request::get_header_value(std::string_view key) const noexcept -> std::optional<std::string_view> {
    if (auto it = m_headers.find(key); it != m_headers.end()) {
        return it->second;
    }
    return std::nullopt;
}

auto request::get_origin() const noexcept -> std::optional<std::string_view> {
    return get_header_value("Origin"sv);
}

auto request::get_headers() const noexcept -> const header_map& { return m_headers; }
auto request::get_body() const noexcept -> const request_body& { return m_body; }
auto request::get_path() const noexcept -> std::string_view { return m_path; }

template <typename t>
auto request::get_value(std::string_view param_name) const noexcept -> std::expected<std::optional<t>, param_error> {
    if (!m_jsonPayload || !m_jsonPayload->has_key(param_name)) {
        return std::optional<t>{};
    }

    const auto value_sv = m_jsonPayload->get_string(param_name);
    auto make_error = [&]() { return std::unexpected{param_error{std::string(param_name), std::string(value_sv)}}; };

    if constexpr (std::is_same_v<t, std::string>) {
        // Only a JSON string converts; false, 0 or null are type errors.
        if (!m_jsonPayload->is_string(param_name)) {
            return make_error();
        }
        return std::optional{std::string(value_sv)};
    } else {
        t value{};
        auto result = std::from_chars(value_sv.data(), value_sv.data() + value_sv.size(), value);
        if (result.ec == std::errc() && result.ptr == value_sv.data() + value_sv.size()) {
            return std::optional{value};
        }
        return make_error();
    }
}

// --- Explicit template instantiations ---
template auto request::get_value<std::string>(std::string_view) const noexcept -> std::expected<std::optional<std::string>, param_error>;
template auto request::get_value<int>(std::string_view) const noexcept -> std::expected<std::optional<int>, param_error>;

} // namespace http
