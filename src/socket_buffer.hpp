#ifndef SOCKET_BUFFER_HPP
#define SOCKET_BUFFER_HPP

#include <stdexcept>
#include <string>
#include <vector>
#include <string_view>
#include <sys/types.h> // For ssize_t
#include <algorithm>   // For std::min
#include <span>        // For std::span

/// @brief Thrown when a request outgrows the configured request size limit.
class socket_buffer_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class socket_buffer {
public:
    // Matches the 25 MB JSON body limit of the API this server fronts.
    static constexpr size_t k_default_max_size{25 * 1024 * 1024};

    explicit socket_buffer(size_t max_size = k_default_max_size)
        : m_max_size(std::max(max_size, k_chunk_size)) {}

    /**
     * @brief Commits bytes written into buffer() and grows the storage when 3/4 full.
     *
     * Growth stops at the maximum size. Whether a full buffer is an error
     * depends on the request it holds, so the caller checks full().
     */
    void update_pos(ssize_t n) {
        if (n <= 0) return;

        m_pos = std::min(m_pos + static_cast<size_t>(n), m_buffer.size());

        if (m_pos * 4 > m_buffer.size() * 3 && m_buffer.size() < m_max_size) {
            m_buffer.resize(std::min(m_buffer.size() + k_chunk_size, m_max_size));
        }
    }

    /// @brief True when the buffer holds m_max_size bytes and cannot take more.
    [[nodiscard]] bool full() const noexcept {
        return m_pos >= m_max_size;
    }

    [[nodiscard]] std::span<char> buffer() noexcept {
        return {m_buffer.data() + m_pos, available_size()};
    }

    [[nodiscard]] size_t available_size() const noexcept {
        return m_buffer.size() - m_pos;
    }

    [[nodiscard]] bool empty() const noexcept {
        return m_pos == 0;
    }

    [[nodiscard]] size_t max_size() const noexcept {
        return m_max_size;
    }

    [[nodiscard]] size_t size() const noexcept {
        return m_pos;
    }

    [[nodiscard]] std::string_view view() const noexcept {
        return {m_buffer.data(), m_pos};
    }

private:
    constexpr static size_t k_chunk_size{4096};

    size_t m_max_size;
    std::vector<char> m_buffer = std::vector<char>(k_chunk_size, 0);
    size_t m_pos{0};
};

#endif // SOCKET_BUFFER_HPP
