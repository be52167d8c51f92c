#ifndef JSON_PARSER_HPP
#define JSON_PARSER_HPP

#include <json-c/json.h>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>
#include <functional> // For std::less
#include <memory>     // For std::unique_ptr
#include <new>        // For std::bad_alloc

namespace json {

class parsing_error : public std::runtime_error {
public:
    explicit parsing_error(const std::string& msg);
};

class output_error : public std::runtime_error {
public:
    explicit output_error(const std::string& msg);
};

class json_parser {
public:
    explicit json_parser(std::string_view json_str);
    ~json_parser() noexcept;

    json_parser(const json_parser&) = delete;
    json_parser& operator=(const json_parser&) = delete;
    json_parser(json_parser&& other) noexcept;
    json_parser& operator=(json_parser&& other) noexcept;

    /**
     * @brief Builds a JSON object string from any map-like container of strings.
     * @tparam MapType A type that can be iterated over yielding key-value pairs of strings.
     * @param data The map-like container.
     * @return A JSON object as a std::string.
     */
    template<typename MapType>
    [[nodiscard]] static std::string build(const MapType& data) {
        auto* obj = json_object_new_object();
        if (!obj) {
            throw std::bad_alloc{};
        }
        std::unique_ptr<json_object, decltype(&json_object_put)> obj_ptr(obj, &json_object_put);

        for (const auto& [key, value] : data) {
            auto* j_value = json_object_new_string_len(value.data(), static_cast<int>(value.size()));
            if (!j_value) {
                throw output_error("json build: failed to create json string for key: " + std::string(key));
            }
            if (json_object_object_add(obj_ptr.get(), std::string(key).c_str(), j_value) != 0) {
                json_object_put(j_value);
                throw output_error("json build: failed to add key to json object: " + std::string(key));
            }
        }

        return serialize(obj_ptr.get());
    }

    // Overload for braced lists, e.g. build({{"message", "Hello"}}).
    [[nodiscard]] static std::string build(const std::map<std::string, std::string, std::less<>>& data);

    [[nodiscard]] std::string_view get_string(std::string_view key) const;
    [[nodiscard]] bool has_key(std::string_view key) const noexcept;
    [[nodiscard]] bool is_object() const noexcept;
    /// @brief True if the key holds a JSON string, as opposed to a number, boolean or null.
    [[nodiscard]] bool is_string(std::string_view key) const noexcept;

    /**
     * @brief Reads an array of strings stored under a key.
     * @return std::nullopt if the key is absent.
     * @throws parsing_error if the value is not an array of strings.
     */
    [[nodiscard]] std::optional<std::vector<std::string>> get_string_list(std::string_view key) const;

    /**
     * @brief Reads a boolean stored under a key.
     * @return std::nullopt if the key is absent.
     * @throws parsing_error if the value is not a JSON boolean.
     */
    [[nodiscard]] std::optional<bool> get_bool(std::string_view key) const;

    /**
     * @brief Reads an integer stored under a key.
     * @return std::nullopt if the key is absent.
     * @throws parsing_error if the value is not a JSON integer.
     */
    [[nodiscard]] std::optional<int> get_int(std::string_view key) const;

private:
    [[nodiscard]] struct json_object* find_member(std::string_view key) const noexcept;
    [[nodiscard]] static std::string serialize(struct json_object* obj);
    struct json_object* m_obj;
};

} // namespace json

#endif // JSON_PARSER_HPP
