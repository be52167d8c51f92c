#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <iostream>
#include <string_view>
#include <format>
#include <syncstream>
#include <thread>
#include <string>

#ifdef USE_STACKTRACE
#include <stacktrace>
#endif

namespace util::log {

// --- Thread-Local Request ID for Traceability ---

// Each thread keeps its own copy. The string it points to is owned by the
// request_id_scope that set it.
inline thread_local std::string_view g_request_id;

/**
 * @class request_id_scope
 * @brief A RAII helper that binds a request ID to the current thread.
 *
 * The scope owns the ID string, so callers may pass a temporary. Any
 * previously bound ID is restored on destruction, which lets the I/O thread
 * and a worker thread each hold their own scope for the same request.
 */
class request_id_scope {
public:
    explicit request_id_scope(std::string id) noexcept
        : m_id(std::move(id)), m_previous(g_request_id) {
        g_request_id = m_id;
    }
    ~request_id_scope() {
        g_request_id = m_previous;
    }
    request_id_scope(const request_id_scope&) = delete;
    request_id_scope& operator=(const request_id_scope&) = delete;
    request_id_scope(request_id_scope&&) = delete;
    request_id_scope& operator=(request_id_scope&&) = delete;

    [[nodiscard]] std::string_view id() const noexcept { return m_id; }

private:
    std::string m_id;
    std::string_view m_previous;
};


// --- Compile-time configuration for debug and perf logging ---
#ifdef ENABLE_DEBUG_LOGS
constexpr bool debug_logging_enabled = true;
#else
constexpr bool debug_logging_enabled = false;
#endif

#ifdef ENABLE_PERF_LOGS
constexpr bool perf_logging_enabled = true;
#else
constexpr bool perf_logging_enabled = false;
#endif


// Defines the severity level of a log message.
enum class Level {
    Debug,
    Perf,
    Info,
    Warning,
    Error,
    Critical
};

[[nodiscard]] constexpr std::string_view to_string(Level level) noexcept {
    switch (level) {
        case Level::Debug: return "DEBUG";
        case Level::Perf: return "PERF";
        case Level::Info: return "INFO";
        case Level::Warning: return "WARN";
        case Level::Error: return "ERROR";
        case Level::Critical: return "CRITICAL";
    }
    return "UNKNOWN";
}

namespace detail {
    inline void vprint(
        const Level level,
        const std::string_view fmt,
        std::format_args args)
    {
        const auto log_prefix = std::format(
            "[{:^8}] [Thread: {}] [{}] ",
            to_string(level),
            std::this_thread::get_id(),
            g_request_id.empty() ? "--------" : g_request_id
        );
        std::osyncstream synced_out((level == Level::Error || level == Level::Critical) ? std::cerr : std::cout);
        synced_out << log_prefix;
        synced_out << std::vformat(fmt, args);
        synced_out << '\n';
        #ifdef USE_STACKTRACE
        if (level == Level::Critical) {
            synced_out << "--- Stack Trace ---\n" << std::stacktrace::current() << "-------------------\n";
        }
        #endif
    }
} // namespace detail

// --- Public-facing convenience functions ---

template<typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args) {
    if constexpr (debug_logging_enabled) {
        detail::vprint(Level::Debug, fmt.get(), std::make_format_args(args...));
    }
}

template<typename... Args>
void perf(std::format_string<Args...> fmt, Args&&... args) {
    if constexpr (perf_logging_enabled) {
        detail::vprint(Level::Perf, fmt.get(), std::make_format_args(args...));
    }
}

template<typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args) {
    detail::vprint(Level::Info, fmt.get(), std::make_format_args(args...));
}

template<typename... Args>
void warn(std::format_string<Args...> fmt, Args&&... args) {
    detail::vprint(Level::Warning, fmt.get(), std::make_format_args(args...));
}

template<typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args) {
    detail::vprint(Level::Error, fmt.get(), std::make_format_args(args...));
}

template<typename... Args>
void critical(std::format_string<Args...> fmt, Args&&... args) {
    detail::vprint(Level::Critical, fmt.get(), std::make_format_args(args...));
}
} // namespace util::log
#endif // LOGGER_HPP
