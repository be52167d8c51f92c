#ifndef WEBAPI_PATH_HPP
#define WEBAPI_PATH_HPP

#include <string_view>
#include <stdexcept>

// Thrown from a consteval constructor; any throw there is a compile error.
class consteval_error : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

/**
 * @class webapi_path
 * @brief A URI path for an API endpoint, checked at compile time.
 *
 * Accepts lowercase letters, digits, '_', '-' and single '/' separators. The
 * accepted set is a subset of what the request parser lets through, so every
 * registered path is reachable.
 */
struct webapi_path {
public:
    consteval explicit webapi_path(std::string_view path) : m_path{path} {
        if (path.empty() || !path.starts_with('/')) {
            throw consteval_error("Invalid WebAPI path: must start with '/'");
        }
        if (path.length() > 1 && path.ends_with('/')) {
            throw consteval_error("Invalid WebAPI path: cannot end with '/'");
        }
        if (path.find("//") != std::string_view::npos) {
            throw consteval_error("Invalid WebAPI path: empty segment");
        }

        constexpr std::string_view valid_chars{"abcdefghijklmnopqrstuvwxyz_-0123456789/"};
        for (const char c : path) {
            if (valid_chars.find(c) == std::string_view::npos) {
                throw consteval_error("Invalid WebAPI path: contains an invalid character");
            }
        }
    }

    [[nodiscard]] constexpr std::string_view get() const noexcept {
        return m_path;
    }

private:
    std::string_view m_path;
};

#endif // WEBAPI_PATH_HPP
