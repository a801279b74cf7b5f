#pragma once

#include "connection.hpp"
#include "session.hpp"
#include "waker.hpp"
#include "minikv/config.hpp"
#include "minikv/keyspace.hpp"
#include "minikv/socket.hpp"
#include "minikv/worker_pool.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <poll.h>
#include <unordered_map>
#include <vector>

namespace minikv {

/*
 * Poll-based reactor plus a worker pool.
 *
 * The reactor thread owns every socket: it accepts, reads requests into
 * sessions and flushes outboxes. Workers only run sessions against the
 * keyspace. A worker that produced a reply marks the fd dirty and pokes
 * the waker so the reactor starts polling it for POLLOUT.
 */
class TcpServer {
public:
    TcpServer(Keyspace& store, ServerConfig config);
    ~TcpServer() = default;

    TcpServer(const TcpServer&) = delete;
    TcpServer& operator=(const TcpServer&) = delete;

    TcpServer(TcpServer&&) = delete;
    TcpServer& operator=(TcpServer&&) = delete;

    // Bind and start listening. Throws std::system_error on failure.
    void listen();

    // Run the reactor until stop(). Calls listen() first if needed.
    void run();

    // Thread- and signal-safe: only flips a flag and pokes the waker
    void stop() noexcept;

    // Route SIGINT/SIGTERM to stop() and ignore SIGPIPE
    void install_signal_handlers();

    // Bound port, useful when configured with port 0
    uint16_t port() const noexcept;

    bool is_running() const noexcept;

private:
    static constexpr size_t SWEEP_BATCH = 128;

    // Reading from a client pauses while this many requests wait, or while
    // its outbox is over Connection::MAX_OUTBOX_SIZE
    static constexpr size_t MAX_BACKLOG_REQUESTS = 1024;

    // Retry delay after accept() ran out of descriptors
    static constexpr std::chrono::seconds ACCEPT_BACKOFF{1};

    Keyspace& store_;
    ServerConfig config_;
    Socket listen_socket_;
    uint16_t bound_port_{0};
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};

    // Reactor event loop
    void run_reactor();
    int poll_timeout() const;
    void maybe_sweep();
    void handle_new_connection();
    bool handle_client_read(size_t& poll_fds_idx);
    bool handle_client_write(size_t& poll_fds_idx);
    void handle_client_dc(size_t& poll_fds_idx);
    void schedule(const std::shared_ptr<Session>& session);
    void close_all();
    bool backlog_full(Session& session);
    void pause_accepting();
    void resume_accepting();

    std::unique_ptr<WorkerPool> pool_;
    std::vector<pollfd> poll_fds_;
    std::map<int, std::shared_ptr<Session>> clients_; // fd -> session
    std::chrono::steady_clock::time_point next_sweep_{};
    std::optional<std::chrono::steady_clock::time_point> accept_resume_at_;

    Waker waker_;
    inline static TcpServer* s_this_server = nullptr; // target of the signal handler
    static void signal_handler(int) {
        if (s_this_server)
            s_this_server->stop();
    }

    // dirty list
    std::mutex dirty_mutex_;
    std::vector<int> dirty_fds_;
    std::unordered_map<int, size_t> fd_idx_map_;

    void mark_as_dirty(int fd);
    void apply_dirty_updates();
};

} // namespace minikv
