#include "session.hpp"

#include "minikv/command_dispatcher.hpp"

#include <type_traits>

namespace minikv {

Session::Session(std::shared_ptr<Connection> connection, Keyspace& store, Notify on_reply)
    : connection_(std::move(connection)), store_(store), on_reply_(std::move(on_reply)) {}

bool Session::enqueue(Request request) {
    return push(std::move(request));
}

bool Session::enqueue(Reply reply) {
    return push(std::move(reply));
}

bool Session::enqueue_last(Reply reply) {
    return push(LastReply{std::move(reply)});
}

size_t Session::backlog() {
    std::lock_guard lock(mutex_);
    return pending_.size();
}

bool Session::ending() {
    std::lock_guard lock(mutex_);
    return ending_;
}

bool Session::push(Pending item) {
    std::lock_guard lock(mutex_);
    if (closed_ || ending_)
        return false;
    if (std::holds_alternative<LastReply>(item))
        ending_ = true;
    pending_.push_back(std::move(item));
    if (scheduled_)
        return false;
    scheduled_ = true;
    return true;
}

void Session::drain() {
    while (true) {
        Pending item;
        {
            std::unique_lock lock(mutex_);
            if (pending_.empty() || closed_) {
                scheduled_ = false;
                return;
            }
            if (connection_->outbox_size() >= Connection::MAX_OUTBOX_SIZE) {
                scheduled_ = false;
                lock.unlock();
                if (on_reply_)
                    on_reply_();
                return;
            }
            item = std::move(pending_.front());
            pending_.pop_front();
        }

        const bool last = std::holds_alternative<LastReply>(item);
        Reply reply = std::visit([this](auto& pending) -> Reply {
            using T = std::decay_t<decltype(pending)>;
            if constexpr (std::is_same_v<T, Request>)
                return CommandDispatcher::execute(pending, store_);
            else if constexpr (std::is_same_v<T, LastReply>)
                return std::move(pending.reply);
            else
                return std::move(pending);
        }, item);

        connection_->append_response(Protocol::encode(reply), last);
        if (on_reply_)
            on_reply_();
    }
}

bool Session::resume() {
    std::lock_guard lock(mutex_);
    if (scheduled_ || closed_ || pending_.empty())
        return false;
    scheduled_ = true;
    return true;
}

void Session::close() {
    std::lock_guard lock(mutex_);
    closed_ = true;
    pending_.clear();
}

bool Session::closed() const noexcept {
    return closed_;
}

} // namespace minikv
