#include "json_parser.hpp"
#include <format>
#include <memory>
#include <utility>

namespace json {

parsing_error::parsing_error(const std::string& msg)
    : std::runtime_error(msg) {}

output_error::output_error(const std::string& msg)
    : std::runtime_error(msg) {}

json_parser::json_parser(std::string_view json_str) {
    auto* tok = json_tokener_new();
    if (!tok) {
        throw std::bad_alloc{};
    }

    // json-c expects a null-terminated buffer even when a length is given.
    const std::string temp_json_for_c_api(json_str);

    m_obj = json_tokener_parse_ex(
        tok,
        temp_json_for_c_api.c_str(),
        static_cast<int>(temp_json_for_c_api.size())
    );

    if (json_tokener_get_error(tok) != json_tokener_success || m_obj == nullptr) {
        std::string err = json_tokener_error_desc(json_tokener_get_error(tok));
        json_tokener_free(tok);
        if (m_obj) {
            json_object_put(m_obj);
        }
        throw parsing_error(std::format("JSON parsing error: {} payload: {}", err, json_str));
    }

    json_tokener_free(tok);
}

json_parser::~json_parser() noexcept {
    if (m_obj) {
        json_object_put(m_obj);
    }
}

json_parser::json_parser(json_parser&& other) noexcept
    : m_obj(other.m_obj) {
    other.m_obj = nullptr;
}

json_parser& json_parser::operator=(json_parser&& other) noexcept {
    if (this != &other) {
        json_object_put(m_obj);
        m_obj = other.m_obj;
        other.m_obj = nullptr;
    }
    return *this;
}

std::string json_parser::build(const std::map<std::string, std::string, std::less<>>& data) {
    return build<std::map<std::string, std::string, std::less<>>>(data);
}

std::string json_parser::serialize(struct json_object* obj) {
    const char* json_str = json_object_to_json_string_ext(obj, JSON_C_TO_STRING_PLAIN | JSON_C_TO_STRING_NOSLASHESCAPE);
    if (!json_str) {
        throw output_error("json build: failed to convert json object to string");
    }
    return std::string{json_str};
}

struct json_object* json_parser::find_member(std::string_view key) const noexcept {
    struct json_object* member = nullptr;
    if (!m_obj || !json_object_is_type(m_obj, json_type_object)) {
        return nullptr;
    }
    if (!json_object_object_get_ex(m_obj, std::string(key).c_str(), &member)) {
        return nullptr;
    }
    return member;
}

std::string_view json_parser::get_string(std::string_view key) const {
    auto* tmp = find_member(key);
    return tmp ? std::string_view(json_object_get_string(tmp)) : std::string_view{};
}

bool json_parser::has_key(std::string_view key) const noexcept {
    if (!m_obj || !json_object_is_type(m_obj, json_type_object)) {
        return false;
    }
    return json_object_object_get_ex(m_obj, std::string(key).c_str(), nullptr);
}

bool json_parser::is_object() const noexcept {
    return m_obj && json_object_is_type(m_obj, json_type_object);
}

bool json_parser::is_string(std::string_view key) const noexcept {
    auto* member = find_member(key);
    return member && json_object_is_type(member, json_type_string);
}

std::optional<std::vector<std::string>> json_parser::get_string_list(std::string_view key) const {
    auto* member = find_member(key);
    if (!member) {
        return std::nullopt;
    }
    if (!json_object_is_type(member, json_type_array)) {
        throw parsing_error(std::format("json key '{}' is not an array", key));
    }

    std::vector<std::string> items;
    const size_t count = json_object_array_length(member);
    items.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        auto* item = json_object_array_get_idx(member, i);
        if (!item || !json_object_is_type(item, json_type_string)) {
            throw parsing_error(std::format("json key '{}' item {} is not a string", key, i));
        }
        items.emplace_back(json_object_get_string(item), json_object_get_string_len(item));
    }
    return items;
}

std::optional<bool> json_parser::get_bool(std::string_view key) const {
    auto* member = find_member(key);
    if (!member) {
        return std::nullopt;
    }
    if (!json_object_is_type(member, json_type_boolean)) {
        throw parsing_error(std::format("json key '{}' is not a boolean", key));
    }
    return json_object_get_boolean(member) != 0;
}

std::optional<int> json_parser::get_int(std::string_view key) const {
    auto* member = find_member(key);
    if (!member) {
        return std::nullopt;
    }
    if (!json_object_is_type(member, json_type_int)) {
        throw parsing_error(std::format("json key '{}' is not an integer", key));
    }
    return json_object_get_int(member);
}

} // namespace json
