#ifndef SIGNAL_HANDLER_HPP
#define SIGNAL_HANDLER_HPP

#include <csignal>
#include <stdexcept>
#include <sys/signalfd.h>
#include <unistd.h>

namespace util {

class signal_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @class signal_handler
 * @brief Owns a blocking signalfd for SIGINT, SIGTERM and SIGQUIT.
 *
 * Must be constructed before any thread is started: the signal mask is
 * inherited, so only the thread reading get_fd() ever sees the shutdown
 * signals. SIGPIPE is ignored so that writing to a closed socket fails with
 * EPIPE instead of ending the process.
 */
class signal_handler {
public:
    signal_handler() {
        if (std::signal(SIGPIPE, SIG_IGN) == SIG_ERR) {
            throw signal_error("Failed to ignore SIGPIPE");
        }

        sigset_t mask;
        sigemptyset(&mask);
        for (const int sig : {SIGINT, SIGTERM, SIGQUIT}) {
            sigaddset(&mask, sig);
        }

        if (pthread_sigmask(SIG_BLOCK, &mask, nullptr) != 0) {
            throw signal_error("Failed to block shutdown signals");
        }

        m_fd = signalfd(-1, &mask, SFD_CLOEXEC);
        if (m_fd == -1) {
            throw signal_error("Failed to create signalfd");
        }
    }

    ~signal_handler() {
        if (m_fd != -1) {
            close(m_fd);
        }
    }

    signal_handler(const signal_handler&) = delete;
    signal_handler& operator=(const signal_handler&) = delete;
    signal_handler(signal_handler&&) = delete;
    signal_handler& operator=(signal_handler&&) = delete;

    [[nodiscard]] int get_fd() const noexcept {
        return m_fd;
    }

private:
    int m_fd{-1};
};

} // namespace util

#endif // SIGNAL_HANDLER_HPP
