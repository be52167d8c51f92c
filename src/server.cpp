#include "server.hpp"
#include "shared_queue.hpp"
#include "util.hpp"
#include "cors.hpp"
#include <system_error>
#include <format>
#include <cstring>
#include <functional>
#include <chrono>
#include <memory>
#include <algorithm>

using namespace std::chrono_literals;

namespace {

constexpr size_t MAX_REQUEST_ID_LENGTH = 128;

uint16_t read_port() {
    const int port = env::get<int>("PORT", 8080);
    if (port < 1 || port > 65535) {
        throw server_error(std::format("PORT must be between 1 and 65535, got {}", port));
    }
    return static_cast<uint16_t>(port);
}

int read_positive(const std::string& key, int fallback) {
    const int value = env::get<int>(key, fallback);
    if (value < 1) {
        throw server_error(std::format("{} must be at least 1, got {}", key, value));
    }
    return value;
}

// Reuses the caller's X-Request-Id when it is a sane token, otherwise mints one.
std::string make_request_id(const http::request_parser& parser) {
    if (const auto id = parser.peek_header("X-Request-Id"); id && !id->empty() && id->size() <= MAX_REQUEST_ID_LENGTH) {
        return std::string(*id);
    }
    return util::get_uuid();
}

} // namespace

// ===================================================================
//         server::io_worker Implementation
// ===================================================================
server::io_worker::io_worker(uint16_t port,
                             std::shared_ptr<metrics> metrics_ptr,
                             const request_pipeline& pipeline,
                             int worker_thread_count,
                             size_t queue_capacity,
                             size_t max_request_size,
                             std::atomic<bool>& running_flag)
    : m_port(port),
      m_max_request_size(max_request_size),
      m_metrics(std::move(metrics_ptr)),
      m_pipeline(pipeline),
      m_running(running_flag),
      m_thread_pool(std::make_unique<thread_pool>(static_cast<size_t>(worker_thread_count), queue_capacity)),
      m_response_queue(std::make_unique<shared_queue<response_item>>()) {}

server::io_worker::~io_worker() noexcept {
    try {
        if (m_thread_pool) {
            m_thread_pool->stop();
        }
    } catch (const std::exception& e) {
        util::log::error("Failed to stop thread pool of I/O worker: {}", e.what());
    }
    for (const auto& [fd, conn] : m_connections) {
        close(fd);
    }
    if (m_epoll_fd != -1) {
        close(m_epoll_fd);
    }
    if (m_listening_fd != -1) {
        close(m_listening_fd);
    }
}

void server::io_worker::run() {
    try {
        setup_listening_socket();
    } catch (const server_error& e) {
        util::log::critical("I/O worker failed to start: {}", e.what());
        return;
    }

    util::log::debug("I/O worker thread {} started and listening on port {}.", std::this_thread::get_id(), m_port);
    m_thread_pool->start();

    std::vector<epoll_event> events(MAX_EVENTS);

    while (m_running) {
        const int num_events = epoll_wait(m_epoll_fd, events.data(), static_cast<int>(events.size()), EPOLL_WAIT_MS);
        if (num_events == -1) {
            if (errno == EINTR) continue;
            util::log::error("epoll_wait failed in worker {}: {}", std::this_thread::get_id(), util::str_error_cpp(errno));
            return;
        }

        for (int i = 0; i < num_events; ++i) {
            const auto& event = events[i];
            const int fd = event.data.fd;

            if (fd == m_listening_fd) {
                on_connect();
            } else if (event.events & (EPOLLERR | EPOLLHUP)) {
                close_connection(fd, event.events);
            } else if (event.events & EPOLLOUT) {
                on_write(fd);
            } else if (event.events & EPOLLIN) {
                on_read(fd);
            } else if (event.events & EPOLLRDHUP) {
                close_connection(fd, event.events);
            }
        }
        process_response_queue();
        check_timeouts();
    }
    util::log::debug("I/O worker thread {} finished.", std::this_thread::get_id());
}

void server::io_worker::setup_listening_socket() {
    m_listening_fd = socket(AF_INET, SOCK_STREAM, 0);
    if (m_listening_fd == -1) throw server_error("Failed to create socket");

    int opt = 1;
    if (setsockopt(m_listening_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) == -1) throw server_error("Failed to set SO_REUSEADDR");
    if (setsockopt(m_listening_fd, SOL_SOCKET, SO_REUSEPORT, &opt, sizeof(opt)) == -1) throw server_error("Failed to set SO_REUSEPORT");

    if (fcntl(m_listening_fd, F_SETFL, O_NONBLOCK) == -1) throw server_error("Failed to set socket to non-blocking");

    sockaddr_in server_addr{};
    server_addr.sin_family = AF_INET;
    server_addr.sin_addr.s_addr = INADDR_ANY;
    server_addr.sin_port = htons(m_port);
    if (bind(m_listening_fd, (sockaddr*)&server_addr, sizeof(server_addr)) == -1) {
        throw server_error(std::format("Failed to bind to port {}: {}", m_port, util::str_error_cpp(errno)));
    }
    if (listen(m_listening_fd, LISTEN_BACKLOG) == -1) throw server_error("Failed to listen on socket");

    m_epoll_fd = epoll_create1(0);
    if (m_epoll_fd == -1) throw server_error("Failed to create epoll instance for worker");
    add_to_epoll(m_listening_fd, EPOLLIN);
}

void server::io_worker::add_to_epoll(int fd, uint32_t events) {
    epoll_event event{};
    event.events = events | EPOLLET | EPOLLRDHUP;
    event.data.fd = fd;
    if (epoll_ctl(m_epoll_fd, EPOLL_CTL_ADD, fd, &event) == -1 && errno != EEXIST) {
        throw server_error(std::format("Failed to add fd {} to epoll: {}", fd, util::str_error_cpp(errno)));
    }
}

void server::io_worker::remove_from_epoll(int fd) {
    if (epoll_ctl(m_epoll_fd, EPOLL_CTL_DEL, fd, nullptr) == -1) {
        util::log::error("Failed to remove fd {} from epoll: {}", fd, util::str_error_cpp(errno));
    }
}

void server::io_worker::modify_epoll(int fd, uint32_t events) {
    epoll_event event{};
    event.events = events | EPOLLET | EPOLLRDHUP;
    event.data.fd = fd;
    if (epoll_ctl(m_epoll_fd, EPOLL_CTL_MOD, fd, &event) == -1) {
        util::log::error("Failed to modify fd {} in epoll: {}", fd, util::str_error_cpp(errno));
    }
}

void server::io_worker::on_connect() {
    while (true) {
        const int client_fd = accept4(m_listening_fd, nullptr, nullptr, SOCK_NONBLOCK);
        if (client_fd == -1) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) break;
            if (errno == EINTR || errno == ECONNABORTED) continue;
            util::log::error("accept4 failed: {}", util::str_error_cpp(errno));
            break;
        }
        std::string client_ip = util::get_peer_ip_ipv4(client_fd);
        util::log::debug("Thread {} accepted new connection from {} on fd {}", std::this_thread::get_id(), client_ip, client_fd);

        try {
            add_to_epoll(client_fd, EPOLLIN);
        } catch (const server_error& e) {
            util::log::error("Dropping connection from {}: {}", client_ip, e.what());
            close(client_fd);
            continue;
        }
        m_connections.try_emplace(client_fd, std::move(client_ip), ++m_next_connection_id, m_max_request_size);
        m_metrics->increment_connections();
    }
}

void server::io_worker::on_read(int fd) {
    auto it = m_connections.find(fd);
    if (it == m_connections.end() || it->second.in_flight) return;

    if (!handle_socket_read(it->second, fd)) return;

    if (it->second.parser.eof()) {
        process_request(fd);
    }
}

void server::io_worker::on_write(int fd) {
    auto it = m_connections.find(fd);
    if (it == m_connections.end() || !it->second.response.has_value()) return;

    http::response& res = *it->second.response;

    while (res.available_size() > 0) {
        const auto chunk = res.buffer();
        const ssize_t bytes_sent = send(fd, chunk.data(), chunk.size(), MSG_NOSIGNAL);
        if (bytes_sent == -1) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) return;
            util::log::error("write error on fd {}: {}", fd, util::str_error_cpp(errno));
            close_connection(fd);
            return;
        }
        res.update_pos(static_cast<size_t>(bytes_sent));
        it->second.update_activity();
    }

    util::log::debug("Response fully sent on fd {}, closing connection.", fd);
    close_connection(fd);
}

void server::io_worker::close_connection(int fd, uint32_t events) {
    if (events & EPOLLERR) {
        util::log::warn("Closing connection on fd {} due to socket error: {}", fd, util::get_socket_error(fd));
    } else if (events & (EPOLLHUP | EPOLLRDHUP)) {
        util::log::debug("Closing connection on fd {} (peer hung up).", fd);
    } else {
        util::log::debug("Closing connection on fd {}.", fd);
    }

    remove_from_epoll(fd);
    if (m_connections.erase(fd) > 0) {
        m_metrics->decrement_connections();
    }
    close(fd);
}

void server::io_worker::check_timeouts() {
    const auto now = std::chrono::steady_clock::now();
    if (now - m_last_timeout_check < TIMEOUT_CHECK_INTERVAL) {
        return;
    }
    m_last_timeout_check = now;

    std::vector<int> expired;
    for (const auto& [fd, conn] : m_connections) {
        if (!conn.in_flight && now - conn.last_activity > READ_TIMEOUT) {
            expired.push_back(fd);
        }
    }
    for (const int fd : expired) {
        util::log::debug("Closing idle connection on fd {}.", fd);
        close_connection(fd);
    }
}

bool server::io_worker::handle_socket_read(connection_state& conn, int fd) {
    while (true) {
        const auto buffer = conn.parser.get_buffer();
        // A full buffer only survives update_pos() when it holds a complete request.
        if (buffer.empty()) break;
        const ssize_t bytes_read = read(fd, buffer.data(), buffer.size());
        if (bytes_read == -1) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) break;
            util::log::error("read error on fd {}: {}", fd, util::str_error_cpp(errno));
            close_connection(fd);
            return false;
        }
        if (bytes_read == 0) {
            close_connection(fd);
            return false;
        }
        conn.update_activity();

        try {
            conn.parser.update_pos(bytes_read);
        } catch (const socket_buffer_error& e) {
            const util::log::request_id_scope rid_scope(make_request_id(conn.parser));
            util::log::warn("Rejecting request from {} on fd {}: {}", conn.remote_ip, fd, e.what());
            http::response res;
            m_pipeline.reject(conn.parser.peek_header("Origin"), res, http::status::entity_too_large, R"({"error":"Request Entity Too Large"})");
            respond(conn, fd, std::move(res));
            return false;
        }
    }
    return true;
}

void server::io_worker::process_request(int fd) {
    auto it = m_connections.find(fd);
    if (it == m_connections.end()) return;

    connection_state& conn = it->second;
    std::string request_id = make_request_id(conn.parser);
    const util::log::request_id_scope rid_scope(request_id);

    if (auto parsed = conn.parser.finalize(); !parsed.has_value()) {
        util::log::warn("Failed to parse request from {} on fd {}: {}", conn.remote_ip, fd, parsed.error().what());
        http::response err_res;
        m_pipeline.reject(conn.parser.peek_header("Origin"), err_res, http::status::bad_request, R"({"error":"Bad Request"})");
        respond(conn, fd, std::move(err_res));
        return;
    }

    http::request req(std::move(conn.parser), conn.remote_ip);
    conn.in_flight = true;
    util::log::debug("{} {} from {}", req.get_method_str(), req.get_path(), req.get_remote_ip());

    http::response res;
    const auto* endpoint = m_pipeline.route(req, res);
    if (!endpoint) {
        respond(conn, fd, std::move(res));
        return;
    }
    dispatch_to_worker(conn, fd, std::move(req), std::move(res), endpoint, std::move(request_id));
}

void server::io_worker::dispatch_to_worker(connection_state& conn, int fd, http::request req, http::response res,
                                           const api_endpoint* endpoint, std::string request_id) {
    auto req_ptr = std::make_shared<http::request>(std::move(req));
    auto res_ptr = std::make_shared<http::response>(std::move(res));
    const uint64_t connection_id = conn.id;

    try {
        m_thread_pool->push_task([this, fd, connection_id, req_ptr, res_ptr, endpoint, request_id]() {
            const util::log::request_id_scope rid_scope(request_id);
            const auto start_time = std::chrono::steady_clock::now();
            m_metrics->increment_active_threads();

            m_pipeline.execute(*req_ptr, *res_ptr, *endpoint);

            const auto duration = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start_time);
            m_response_queue->push({fd, connection_id, std::move(*res_ptr)});
            m_metrics->record_request_time(duration);
            m_metrics->decrement_active_threads();

            util::log::perf("API handler for '{}' executed in {} microseconds.", req_ptr->get_path(), duration.count());
        });
    } catch (const queue_full_error& e) {
        m_metrics->increment_rejected_tasks();
        util::log::warn("Worker queue full, rejecting {} {}: {}", req_ptr->get_method_str(), req_ptr->get_path(), e.what());
        res_ptr->set_body(http::status::service_unavailable, R"({"error":"Server Busy"})");
        respond(conn, fd, std::move(*res_ptr));
    }
}

void server::io_worker::respond(connection_state& conn, int fd, http::response res) {
    conn.in_flight = true;
    conn.response = std::move(res);
    modify_epoll(fd, EPOLLOUT);
}

void server::io_worker::process_response_queue() {
    std::vector<response_item> response_batch;
    m_response_queue->drain_to(response_batch);

    for (auto& item : response_batch) {
        auto it = m_connections.find(item.client_fd);
        if (it == m_connections.end() || it->second.id != item.connection_id) {
            util::log::debug("Dropping response for closed connection on fd {}.", item.client_fd);
            continue;
        }
        respond(it->second, item.client_fd, std::move(item.res));
    }
}

// ===================================================================
//         server Implementation
// ===================================================================

server::server()
    : m_port(read_port()),
      m_io_threads(read_positive("IO_THREADS", static_cast<int>(std::max(1u, std::thread::hardware_concurrency())))),
      m_worker_threads(read_positive("POOL_SIZE", 16)),
      m_queue_capacity(env::get<size_t>("QUEUE_CAPACITY", 0)),
      m_max_request_size(env::get<size_t>("MAX_REQUEST_SIZE", socket_buffer::k_default_max_size)),
      m_signals(std::make_unique<util::signal_handler>()),
      m_metrics(std::make_shared<metrics>(m_worker_threads)),
      m_cors(cors::policy_config::from_env()),
      m_pipeline(m_cors, m_router, m_metrics)
{
    util::log::info("CORS policy loaded: {}", m_cors.config().describe());
}

server::~server() noexcept = default;

void server::start() {
    util::log::info("origingate version {} starting on port {} with {} I/O threads and {} total worker threads.",
        g_version, m_port, m_io_threads, m_worker_threads);

    const int worker_threads_per_io = std::max(1, m_worker_threads / m_io_threads);
    util::log::info("Assigning {} worker threads per I/O worker.", worker_threads_per_io);

    {
        std::vector<std::jthread> io_worker_threads;
        io_worker_threads.reserve(m_io_threads);

        // The vector of workers must be complete before any thread takes a reference into it.
        for (int i = 0; i < m_io_threads; ++i) {
            auto worker = std::make_unique<io_worker>(m_port, m_metrics, m_pipeline, worker_threads_per_io,
                                                      m_queue_capacity, m_max_request_size, m_running);
            m_metrics->register_thread_pool(worker->get_thread_pool());
            m_workers.push_back(std::move(worker));
        }

        for (int i = 0; i < m_io_threads; ++i) {
            io_worker_threads.emplace_back([this, i] { m_workers[i]->run(); });
        }

        signalfd_siginfo ssi{};
        if (const ssize_t bytes_read = read(m_signals->get_fd(), &ssi, sizeof(ssi)); bytes_read == sizeof(ssi)) {
            const char* signal_name = strsignal(static_cast<int>(ssi.ssi_signo));
            util::log::info("Received signal {} ({}), shutting down.", ssi.ssi_signo, signal_name ? signal_name : "Unknown");
        } else {
            util::log::error("Failed to read from signalfd: {}", util::str_error_cpp(errno));
        }

        m_running = false;
    }
    m_workers.clear();
}
