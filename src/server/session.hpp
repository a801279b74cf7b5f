#pragma once

#include "connection.hpp"
#include "minikv/keyspace.hpp"
#include "minikv/protocol.hpp"

#include <atomic>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <variant>

namespace minikv {

/*
 * Per-connection command processing.
 *
 * The reactor enqueues framed requests (or ready-made error replies for
 * framing failures). enqueue() returns true exactly when the session went
 * from idle to scheduled; the caller must then hand drain() to a worker.
 * Only one worker drains a session at a time, so replies leave in the
 * order the requests arrived.
 */
class Session {
public:
    using Notify = std::function<void()>;

    Session(std::shared_ptr<Connection> connection, Keyspace& store, Notify on_reply = {});

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    bool enqueue(Request request);
    bool enqueue(Reply reply);

    // Queues the reply after which the connection closes. Later
    // enqueues are refused.
    bool enqueue_last(Reply reply);

    // Items queued but not yet run
    size_t backlog();

    // True once enqueue_last() was called
    bool ending();

    // Runs queued items in order until the queue is empty, the session
    // closes or the connection outbox is full. In the last case on_reply
    // fires once more and the reactor calls resume() after flushing.
    void drain();

    // Returns true if the session had work left and is now scheduled again
    bool resume();

    // Stops further processing. An item already being executed completes.
    void close();
    bool closed() const noexcept;

    Connection& connection() noexcept { return *connection_; }

private:
    struct LastReply {
        Reply reply;
    };
    using Pending = std::variant<Request, Reply, LastReply>;

    bool push(Pending item);

    std::shared_ptr<Connection> connection_;
    Keyspace& store_;
    Notify on_reply_;

    std::mutex mutex_;
    std::deque<Pending> pending_;
    bool scheduled_{false};
    bool ending_{false};
    std::atomic<bool> closed_{false};
};

} // namespace minikv
