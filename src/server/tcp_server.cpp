#include "tcp_server.hpp"

#include <sys/socket.h>  // accept4()
#include <netinet/in.h>  // sockaddr_in
#include <arpa/inet.h>   // inet_ntop()

#include <cerrno>
#include <csignal>
#include <iostream>
#include <stdexcept>
#include <string>
#include <system_error>


namespace minikv {


TcpServer::TcpServer(Keyspace& store, ServerConfig config)
    : store_(store), config_(std::move(config)) {}

void TcpServer::listen() {
    if (listen_socket_.valid())
        throw std::logic_error("Server is already listening");

    listen_socket_ = Socket::listen_tcp(config_.bind, config_.port);
    bound_port_ = listen_socket_.local_port();
}

void TcpServer::install_signal_handlers() {
    std::signal(SIGPIPE, SIG_IGN); // ignore SIGPIPE
    s_this_server = this;
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
}

void TcpServer::run() {
    if (running_)
        throw std::logic_error("Server is already running");
    if (!listen_socket_.valid())
        listen();

    pool_ = std::make_unique<WorkerPool>(config_.workers);

    poll_fds_.clear();
    fd_idx_map_.clear();
    poll_fds_.push_back({listen_socket_.fd(), POLLIN, 0}); // The server listening socket
    poll_fds_.push_back({waker_.read_fd(), POLLIN, 0});    // The read-end of the self-pipe
    next_sweep_ = std::chrono::steady_clock::now() + config_.sweep_interval;
    accept_resume_at_.reset();
    running_ = true;

    std::cout << "[Server] Listening on " << config_.bind << ":" << bound_port_
              << " with " << pool_->size() << " workers\n";

    run_reactor();

    // Workers first: after this nothing touches a session or the dirty list
    pool_->stop();
    pool_.reset();
    close_all();
    listen_socket_ = Socket{}; // destroy old socket, closes FD
    running_ = false;
    if (s_this_server == this)
        s_this_server = nullptr;
    std::cout << "[Server] Stopped\n";
}

void TcpServer::run_reactor() {
    while (!stop_requested_) {
        apply_dirty_updates();
        int activity = ::poll(poll_fds_.data(), poll_fds_.size(), poll_timeout());
        if (activity < 0) {
            if (errno == EINTR) // interrupted syscall, eg: SIGWINCH or SIGCONT
                continue;
            std::cerr << "[Server] poll failed: " << std::generic_category().message(errno) << "\n";
            break;
        }

        maybe_sweep();
        if (accept_resume_at_ && std::chrono::steady_clock::now() >= *accept_resume_at_)
            resume_accepting();

        for (size_t i = 0; i < poll_fds_.size(); i++) {
            short revents = poll_fds_[i].revents;
            if (revents == 0)
                continue;
            int fd = poll_fds_[i].fd;

            // Waker poke
            if (fd == waker_.read_fd()) {
                waker_.clear();
                continue;
            }

            // New client
            if (fd == listen_socket_.fd()) {
                if (revents & POLLIN)
                    handle_new_connection();
                continue;
            }

            if ((revents & POLLIN) && !handle_client_read(i))
                continue;

            if ((revents & POLLOUT) && !handle_client_write(i))
                continue;

            // Errors, and hangups once nothing is left to read
            if ((revents & (POLLERR | POLLNVAL)) || ((revents & POLLHUP) && !(revents & POLLIN)))
                handle_client_dc(i);
        }
    }
}

int TcpServer::poll_timeout() const {
    std::optional<std::chrono::steady_clock::time_point> deadline = accept_resume_at_;
    if (config_.sweep_interval.count() != 0 && (!deadline || next_sweep_ < *deadline))
        deadline = next_sweep_;
    if (!deadline)
        return -1; // Block until a FD is ready

    auto remaining = std::chrono::ceil<std::chrono::milliseconds>(
        *deadline - std::chrono::steady_clock::now());
    return remaining.count() > 0 ? static_cast<int>(remaining.count()) : 0;
}

void TcpServer::maybe_sweep() {
    if (config_.sweep_interval.count() == 0)
        return;
    auto now = std::chrono::steady_clock::now();
    if (now < next_sweep_)
        return;
    store_.sweep_expired(SWEEP_BATCH);
    next_sweep_ = now + config_.sweep_interval;
}

void TcpServer::apply_dirty_updates() {
    std::vector<int> local_dirty;
    {
        // Swap to a local vector to keep the lock time minimal
        std::lock_guard lock(dirty_mutex_);
        local_dirty.swap(dirty_fds_);
    }

    for (auto fd : local_dirty) {
        auto it = fd_idx_map_.find(fd);
        if (it != fd_idx_map_.end()) {
            poll_fds_[it->second].events |= POLLOUT;
        }
    }
}

void TcpServer::mark_as_dirty(int fd) {
    {
        std::lock_guard lock(dirty_mutex_);
        dirty_fds_.push_back(fd);
    }
    waker_.notify();
}

void TcpServer::schedule(const std::shared_ptr<Session>& session) {
    pool_->submit([weak = std::weak_ptr<Session>(session)]() {
        if (auto client = weak.lock()) {
            client->drain();
        } else {
            // The reactor already dropped this connection
            std::cout << "[Worker] Skipping task: Client already disconnected." << std::endl;
        }
    });
}

bool TcpServer::handle_client_write(size_t& poll_fds_idx) {
    int fd = poll_fds_[poll_fds_idx].fd;
    auto session = clients_[fd];
    auto& connection = session->connection();

    try {
        if (!connection.write_from_outbox()) {   // if "everything has been written"
            poll_fds_[poll_fds_idx].events &= ~POLLOUT; // Outbox empty, turn off POLLOUT
        }
    } catch (const IOError&) {
        handle_client_dc(poll_fds_idx);
        return false;
    }

    if (connection.finished()) {
        handle_client_dc(poll_fds_idx);
        return false;
    }

    // Commands paused on a full outbox continue once it has room
    if (connection.outbox_size() < Connection::MAX_OUTBOX_SIZE && session->resume())
        schedule(session);

    // Reading was paused by backpressure, resume once the client caught up
    if (!(poll_fds_[poll_fds_idx].events & POLLIN) && !session->ending() && !backlog_full(*session))
        poll_fds_[poll_fds_idx].events |= POLLIN;
    return true;
}

bool TcpServer::backlog_full(Session& session) {
    return session.backlog() >= MAX_BACKLOG_REQUESTS ||
           session.connection().outbox_size() >= Connection::MAX_OUTBOX_SIZE;
}

void TcpServer::handle_client_dc(size_t& poll_fds_idx) {
    int moving_fd = poll_fds_.back().fd;
    int dead_fd = poll_fds_[poll_fds_idx].fd;

    // swap & pop to remove dead connection in O(1)
    if (poll_fds_idx < poll_fds_.size() - 1) {
        std::swap(poll_fds_[poll_fds_idx], poll_fds_.back());
        fd_idx_map_[moving_fd] = poll_fds_idx;
    }
    fd_idx_map_.erase(dead_fd);

    auto it = clients_.find(dead_fd);
    if (it != clients_.end()) {
        it->second->close(); // a worker mid-command finishes it, then stops
        clients_.erase(it);  // closes the socket once no worker holds the session
    }
    poll_fds_.pop_back();
    poll_fds_idx--;

    if (accept_resume_at_)
        resume_accepting();

    std::cout << "[Server] Client [" << dead_fd << "] disconnected\n";
}

void TcpServer::handle_new_connection() {
    sockaddr_in client_addr{};
    socklen_t client_len = sizeof(client_addr);

    // Create non-blocking client socket
    int client_fd = ::accept4(
        listen_socket_.fd(),
        reinterpret_cast<sockaddr*>(&client_addr),
        &client_len,
        SOCK_NONBLOCK | SOCK_CLOEXEC
    );

    if (client_fd < 0) {
        if (errno == EMFILE || errno == ENFILE) {
            // The pending client stays in the backlog; polling the listener now would spin
            std::cerr << "[Server] accept failed: " << std::generic_category().message(errno)
                      << ", pausing new connections\n";
            pause_accepting();
        } else if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR && errno != ECONNABORTED) {
            std::cerr << "[Server] accept failed: " << std::generic_category().message(errno) << "\n";
        }
        return;
    }

    char peer[INET_ADDRSTRLEN] = "?";
    ::inet_ntop(AF_INET, &client_addr.sin_addr, peer, sizeof(peer));
    std::cout << "[Server] Client [" << client_fd << "] connected from " << peer << ":"
              << ntohs(client_addr.sin_port) << "\n";

    poll_fds_.push_back({client_fd, POLLIN, 0});
    fd_idx_map_[client_fd] = poll_fds_.size() - 1;
    auto connection = std::make_shared<Connection>(Socket{client_fd});
    clients_[client_fd] = std::make_shared<Session>(
        std::move(connection), store_, [this, client_fd]() { mark_as_dirty(client_fd); });
}

bool TcpServer::handle_client_read(size_t& poll_fds_idx) {
    int fd = poll_fds_[poll_fds_idx].fd;
    auto session = clients_[fd];
    auto& connection = session->connection();

    try {
        // Pull data from the OS into our buffer
        if (!connection.read_to_inbox()) {
            handle_client_dc(poll_fds_idx);
            return false;
        }

        // Hand every complete request to the session, in arrival order
        while (true) {
            std::optional<Request> request;
            try {
                request = connection.try_get_request();
            } catch (const ProtocolError& e) {
                if (session->enqueue(Reply::error(std::string{"ERROR: "} + e.what())))
                    schedule(session);
                break;
            }
            if (!request)
                break;
            if (session->enqueue(std::move(*request)))
                schedule(session);
        }
    } catch (const BufferOverflowError& e) {
        // The rest of the oversized request is still on the wire: answer, then hang up
        if (session->enqueue_last(Reply::error(e.what())))
            schedule(session);
        poll_fds_[poll_fds_idx].events &= ~POLLIN;
        return true;
    } catch (const IOError&) {
        handle_client_dc(poll_fds_idx);
        return false;
    }

    if (backlog_full(*session))
        poll_fds_[poll_fds_idx].events &= ~POLLIN;
    return true;
}

void TcpServer::pause_accepting() {
    poll_fds_[0].events &= ~POLLIN; // listener is always at index 0
    accept_resume_at_ = std::chrono::steady_clock::now() + ACCEPT_BACKOFF;
}

void TcpServer::resume_accepting() {
    poll_fds_[0].events |= POLLIN;
    accept_resume_at_.reset();
}

void TcpServer::close_all() {
    for (auto& [fd, session] : clients_)
        session->close();
    clients_.clear();
    poll_fds_.clear();
    fd_idx_map_.clear();
}

void TcpServer::stop() noexcept {
    stop_requested_ = true;
    waker_.notify();
}

uint16_t TcpServer::port() const noexcept {
    return bound_port_;
}

bool TcpServer::is_running() const noexcept {
    return running_;
}


} // namespace minikv
