#ifndef ENV_HPP
#define ENV_HPP

#include "util.hpp"
#include "pkeyutil.hpp"
#include <string>
#include <stdexcept>
#include <concepts>
#include <optional>
#include <string_view>
#include <unordered_map>
#include <charconv>
#include <cstdlib>
#include <functional> // Required for std::equal_to

namespace env {

    /**
     * @brief Exception thrown when an environment variable cannot be resolved.
     */
    class error : public std::runtime_error {
    public:
        explicit error(const std::string& message)
            : std::runtime_error("env::get: " + message) {}
    };

    /**
     * @brief Concept for types supported by env::get.
     */
    template <typename T>
    concept Supported = std::same_as<T, std::string> ||
                        std::same_as<T, int> ||
                        std::same_as<T, long> ||
                        std::same_as<T, size_t> ||
                        std::same_as<T, bool>;

    namespace detail {

        inline std::unordered_map<std::string, std::string, util::string_hash, util::string_equal>& get_cache() noexcept {
            static thread_local std::unordered_map<std::string, std::string, util::string_hash, util::string_equal> g_cache;
            return g_cache;
        }

        template <typename T>
        T convert_number(std::string_view value, const std::string& key, std::string_view type_name) {
            T result{};
            // std::from_chars is strict and does not skip whitespace.
            auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
            if (ec != std::errc() || ptr != value.data() + value.size()) {
                throw error("invalid " + std::string(type_name) + " for key '" + key + "': " + std::string(value));
            }
            return result;
        }

        template <Supported T>
        T convert(std::string_view value, const std::string& key);

        template <>
        inline std::string convert<std::string>(std::string_view value, const std::string&) {
            return std::string(value);
        }

        template <>
        inline int convert<int>(std::string_view value, const std::string& key) {
            return convert_number<int>(value, key, "int");
        }

        template <>
        inline long convert<long>(std::string_view value, const std::string& key) {
            return convert_number<long>(value, key, "long");
        }

        template <>
        inline size_t convert<size_t>(std::string_view value, const std::string& key) {
            return convert_number<size_t>(value, key, "size_t");
        }

        template <>
        inline bool convert<bool>(std::string_view value, const std::string& key) {
            if (value == "1" || value == "true") return true;
            if (value == "0" || value == "false") return false;
            throw error("invalid bool for key '" + key + "' (expected '0', '1', 'true' or 'false'): " + std::string(value));
        }

        // Returns std::nullopt when the variable is not set. Values naming an
        // ".enc" file are replaced by the decrypted file content.
        inline std::optional<std::string> fetch_string(std::string_view key) {
            auto& cache = get_cache();
            if (auto it = cache.find(key); it != cache.end()) {
                return it->second;
            }

            const std::string key_str(key);
            const char* raw = std::getenv(key_str.c_str());
            if (!raw) return std::nullopt;

            std::string value = raw;
            if (value.ends_with(".enc")) {
                auto result = pkey::decrypt_file(value);
                if (!result) {
                    throw error("decryption failed for file '" + value + "' (from key '" + key_str + "'): " + result.error());
                }
                value = std::move(*result);
            }

            cache[key_str] = value;
            return value;
        }
    } // namespace detail

    /// @brief Drops the values cached by the calling thread, e.g. after setenv().
    inline void clear_cache() noexcept {
        detail::get_cache().clear();
    }


    /**
     * @brief Gets an environment variable with type conversion.
     * @throws env::error if the variable is missing or cannot be converted.
     */
    template <Supported T>
    [[nodiscard]] inline T get(const std::string& key) {
        const auto value = detail::fetch_string(key);
        if (!value) throw error("missing environment variable: " + key);
        return detail::convert<T>(*value, key);
    }

    /**
     * @brief Gets an environment variable, or std::nullopt if it is not set.
     * @throws env::error if the variable is set but cannot be converted.
     */
    template <Supported T>
    [[nodiscard]] inline std::optional<T> find(const std::string& key) {
        const auto value = detail::fetch_string(key);
        if (!value) return std::nullopt;
        return detail::convert<T>(*value, key);
    }

    /**
     * @brief Gets an environment variable with fallback.
     *
     * The fallback covers a missing variable only; a malformed value still throws.
     */
    template <Supported T>
    [[nodiscard]] inline T get(const std::string& key, const T& fallback) {
        return find<T>(key).value_or(fallback);
    }
}

#endif // ENV_HPP
