#ifndef UTIL_HPP
#define UTIL_HPP

#include <string>
#include <string_view>
#include <system_error>
#include <vector>
#include <array>
#include <algorithm>
#include <ranges>
#include <fstream>
#include <charconv>
#include <cerrno>

#include <unistd.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <climits>
#include <uuid/uuid.h>

namespace util {

// Transparent hashing so string-keyed containers can be searched with a string_view.
struct string_hash {
    using is_transparent = void;
    [[nodiscard]] size_t operator()(std::string_view txt) const noexcept {
        return std::hash<std::string_view>{}(txt);
    }
};

struct string_equal {
    using is_transparent = void;
    [[nodiscard]] constexpr bool operator()(std::string_view lhs, std::string_view rhs) const noexcept {
        return lhs == rhs;
    }
};

/**
 * @brief Removes leading and trailing spaces and tabs.
 */
[[nodiscard]] constexpr std::string_view trim(std::string_view sv) noexcept {
    constexpr std::string_view blanks{" \t"};
    sv.remove_prefix(std::min(sv.find_first_not_of(blanks), sv.size()));
    if (const auto last = sv.find_last_not_of(blanks); last != std::string_view::npos) {
        sv = sv.substr(0, last + 1);
    }
    return sv;
}

/**
 * @brief Splits a delimited list into trimmed items.
 *
 * Empty items are kept so the caller can reject them; an input made only of
 * blanks yields an empty vector.
 *
 * @param list The delimited text, e.g. "GET, POST".
 * @param delimiter The separator character.
 * @return The trimmed items in input order.
 */
[[nodiscard]] inline std::vector<std::string> split_list(std::string_view list, char delimiter = ',') {
    std::vector<std::string> items;
    if (trim(list).empty()) {
        return items;
    }
    for (const auto part : list | std::views::split(delimiter)) {
        items.emplace_back(trim(std::string_view(part.begin(), part.end())));
    }
    return items;
}

[[nodiscard]] inline std::string join(const std::vector<std::string>& items, std::string_view separator = ", ") {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            out.append(separator);
        }
        out.append(items[i]);
    }
    return out;
}

/// @brief Message text for an errno value.
[[nodiscard]] inline std::string str_error_cpp(int err_num) {
    return std::error_code(err_num, std::system_category()).message();
}

/// @brief The pending SO_ERROR of a socket, as text.
[[nodiscard]] inline std::string get_socket_error(int fd) {
    int error = 0;
    socklen_t errlen = sizeof(error);
    if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &error, &errlen) != 0) {
        return str_error_cpp(errno);
    }
    return error != 0 ? str_error_cpp(error) : "no pending socket error";
}

/// @brief Hostname of the machine; in Kubernetes this is the pod name.
[[nodiscard]] inline std::string get_pod_name() {
    std::array<char, HOST_NAME_MAX + 1> name{};
    if (gethostname(name.data(), name.size() - 1) != 0) {
        return "unknown-host";
    }
    return name.data();
}

/// @brief Dotted IPv4 address of the peer, or an empty string.
[[nodiscard]] inline std::string get_peer_ip_ipv4(int sockfd) {
    sockaddr_in addr{};
    socklen_t addr_len = sizeof(addr);
    std::array<char, INET_ADDRSTRLEN> text{};
    if (getpeername(sockfd, reinterpret_cast<sockaddr*>(&addr), &addr_len) != 0 ||
        inet_ntop(AF_INET, &addr.sin_addr, text.data(), text.size()) == nullptr) {
        return {};
    }
    return text.data();
}

/// @brief A random (version 4) UUID in canonical lowercase form.
[[nodiscard]] inline std::string get_uuid() {
    uuid_t id;
    uuid_generate_random(id);
    std::array<char, 37> text{};
    uuid_unparse_lower(id, text.data());
    return text.data();
}

namespace detail {
    // Value of a "Key:   1234 kB" line of a procfs file, 0 if absent.
    inline size_t read_proc_kb(const char* path, std::string_view key) {
        std::ifstream file(path);
        std::string line;
        while (std::getline(file, line)) {
            if (!line.starts_with(key)) {
                continue;
            }
            const auto digits = trim(std::string_view(line).substr(key.size()));
            size_t value = 0;
            std::from_chars(digits.data(), digits.data() + digits.size(), value);
            return value;
        }
        return 0;
    }
} // namespace detail

/// @brief Total RAM in kB.
[[nodiscard]] inline size_t get_total_memory() {
    return detail::read_proc_kb("/proc/meminfo", "MemTotal:");
}

/// @brief Resident set size of this process in kB.
[[nodiscard]] inline size_t get_memory_usage() {
    return detail::read_proc_kb("/proc/self/status", "VmRSS:");
}

} // namespace util

#endif // UTIL_HPP
