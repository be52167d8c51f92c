#ifndef SERVER_HPP
#define SERVER_HPP

#include "http_request.hpp"
#include "http_response.hpp"
#include "logger.hpp"
#include "env.hpp"
#include "signal_handler.hpp"
#include "metrics.hpp"
#include "api_router.hpp"
#include "cors.hpp"
#include "request_pipeline.hpp"
#include "thread_pool.hpp"
#include "shared_queue.hpp"
#include "util.hpp"
#include <sys/epoll.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <unistd.h>
#include <fcntl.h>
#include <stdexcept>
#include <unordered_map>
#include <memory>
#include <optional>
#include <vector>
#include <functional>
#include <atomic>
#include <thread>
#include <cstdint>
#include <chrono>

class server_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct connection_state {
    connection_state(std::string ip, uint64_t connection_id, size_t max_request_size)
        : parser(max_request_size),
          remote_ip(std::move(ip)),
          id(connection_id),
          last_activity(std::chrono::steady_clock::now()) {}

    http::request_parser parser;
    std::optional<http::response> response;
    std::string remote_ip;
    uint64_t id;
    // Set once the request is complete; later input on the socket is ignored.
    bool in_flight{false};
    std::chrono::steady_clock::time_point last_activity;

    void update_activity() {
        last_activity = std::chrono::steady_clock::now();
    }
};

// A response produced on a worker thread. The connection id guards against
// the fd having been closed and reused while the handler ran.
struct response_item {
    int client_fd;
    uint64_t connection_id;
    http::response res;
};

/**
 * @class server
 * @brief Multi-reactor HTTP server with the CORS interceptor in front of every route.
 *
 * Each I/O worker owns a listening socket (SO_REUSEPORT), an epoll loop and a
 * thread pool for application handlers. The CORS policy is loaded in the
 * constructor, so a misconfigured policy fails before any socket is opened.
 */
class server {
public:
    /// @throws cors::config_error, env::error or util::signal_error on bad configuration.
    server();
    ~server() noexcept;

    server(const server&) = delete;
    server& operator=(const server&) = delete;
    server(server&&) = delete;
    server& operator=(server&&) = delete;

    void register_api(webapi_path path, http::method method, api_handler_func handler) {
        m_router.register_api(path, method, std::move(handler));
    }

    void start();

private:
    class io_worker {
    public:
        io_worker(uint16_t port,
                  std::shared_ptr<metrics> metrics_ptr,
                  const request_pipeline& pipeline,
                  int worker_thread_count,
                  size_t queue_capacity,
                  size_t max_request_size,
                  std::atomic<bool>& running_flag);

        ~io_worker() noexcept;
        void run();

        [[nodiscard]] const thread_pool* get_thread_pool() const {
            return m_thread_pool.get();
        }

    private:
        void setup_listening_socket();
        void add_to_epoll(int fd, uint32_t events);
        void remove_from_epoll(int fd);
        void modify_epoll(int fd, uint32_t events);

        void on_connect();
        void on_read(int fd);
        void on_write(int fd);
        void close_connection(int fd, uint32_t events = 0);
        void check_timeouts();

        bool handle_socket_read(connection_state& conn, int fd);
        void process_request(int fd);
        void dispatch_to_worker(connection_state& conn, int fd, http::request req, http::response res, const api_endpoint* endpoint, std::string request_id);
        void respond(connection_state& conn, int fd, http::response res);
        void process_response_queue();

        int m_listening_fd{-1};
        uint16_t m_port;
        int m_epoll_fd{-1};
        uint64_t m_next_connection_id{0};
        size_t m_max_request_size;

        std::shared_ptr<metrics> m_metrics;
        const request_pipeline& m_pipeline;
        std::atomic<bool>& m_running;

        std::unique_ptr<thread_pool> m_thread_pool;
        std::unique_ptr<shared_queue<response_item>> m_response_queue;
        std::unordered_map<int, connection_state> m_connections;
        std::chrono::steady_clock::time_point m_last_timeout_check{std::chrono::steady_clock::now()};
    };

    static inline constexpr int MAX_EVENTS = 8192;
    static inline constexpr int LISTEN_BACKLOG = 65536;
    static inline constexpr int EPOLL_WAIT_MS = 5;
    // Idle connections are closed after this long (Slowloris protection).
    static inline constexpr std::chrono::seconds READ_TIMEOUT{60};
    static inline constexpr std::chrono::seconds TIMEOUT_CHECK_INTERVAL{1};

    uint16_t m_port;
    int m_io_threads;
    int m_worker_threads;
    size_t m_queue_capacity;
    size_t m_max_request_size;

    std::unique_ptr<util::signal_handler> m_signals;
    std::shared_ptr<metrics> m_metrics;
    cors::interceptor m_cors;
    api_router m_router;
    request_pipeline m_pipeline;

    std::vector<std::unique_ptr<io_worker>> m_workers;
    std::atomic<bool> m_running{true};
};

#endif // SERVER_HPP
