#include <gtest/gtest.h>
#include "session.hpp"
#include "minikv/worker_pool.hpp"

#include <atomic>
#include <chrono>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>

using namespace minikv;
using namespace std::chrono_literals;

class SessionTest : public ::testing::Test {
protected:
    int client_fd_{-1};
    Keyspace store;
    std::shared_ptr<Connection> connection;
    std::atomic<int> notifications{0};
    std::shared_ptr<Session> session;

    void SetUp() override {
        int fds[2];
        ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
        client_fd_ = fds[1];
        connection = std::make_shared<Connection>(Socket{fds[0]});
        session = std::make_shared<Session>(connection, store, [this]() { ++notifications; });
    }

    void TearDown() override {
        close(client_fd_);
    }

    static Request request(std::string name, std::vector<std::string> args = {}) {
        return Request{std::move(name), std::move(args)};
    }

    // Flushes the outbox and returns what the client receives
    std::string flush_to_client() {
        while (connection->write_from_outbox()) {}
        std::string data;
        char buffer[4096];
        ssize_t n;
        while ((n = recv(client_fd_, buffer, sizeof(buffer), MSG_DONTWAIT)) > 0)
            data.append(buffer, n);
        return data;
    }
};


TEST_F(SessionTest, FirstEnqueueSchedulesOnce) {
    EXPECT_TRUE(session->enqueue(request("PING")));
    EXPECT_FALSE(session->enqueue(request("PING")));
    session->drain();
    EXPECT_TRUE(session->enqueue(request("PING")));
}

TEST_F(SessionTest, DrainRepliesInRequestOrder) {
    session->enqueue(request("SET", {"k", "v"}));
    session->enqueue(request("GET", {"k"}));
    session->enqueue(request("DEL", {"k"}));
    session->enqueue(request("GET", {"k"}));
    session->drain();

    EXPECT_EQ(flush_to_client(), "+OK\r\n$1\r\nv\r\n:1\r\n$-1\r\n");
    EXPECT_EQ(notifications, 4);
}

TEST_F(SessionTest, ErrorsDoNotStopTheSession) {
    session->enqueue(request("NOPE"));
    session->enqueue(request("GET"));
    session->enqueue(Reply::error("ERROR: protocol error"));
    session->enqueue(request("SET", {"k", "v"}));
    session->drain();

    EXPECT_EQ(flush_to_client(),
              "-ERROR: unknown command\r\n"
              "-ERROR: wrong number of arguments\r\n"
              "-ERROR: protocol error\r\n"
              "+OK\r\n");
    EXPECT_EQ(store.get("k"), "v");
}

TEST_F(SessionTest, ClosedSessionStopsProcessing) {
    session->enqueue(request("SET", {"a", "1"}));
    session->close();
    EXPECT_TRUE(session->closed());
    EXPECT_FALSE(session->enqueue(request("SET", {"b", "2"})));
    session->drain();

    EXPECT_FALSE(store.exists("a"));
    EXPECT_FALSE(store.exists("b"));
    EXPECT_EQ(notifications, 0);
}

TEST_F(SessionTest, LastReplyEndsTheSession) {
    session->enqueue(request("SET", {"k", "v"}));
    EXPECT_FALSE(session->ending());
    session->enqueue_last(Reply::error("ERROR: request too large"));
    EXPECT_TRUE(session->ending());
    EXPECT_FALSE(session->enqueue(request("DEL", {"k"})));
    EXPECT_EQ(session->backlog(), 2u);

    session->drain();
    EXPECT_EQ(session->backlog(), 0u);
    EXPECT_EQ(flush_to_client(), "+OK\r\n-ERROR: request too large\r\n");
    EXPECT_TRUE(connection->finished());
    EXPECT_EQ(store.get("k"), "v");
}

TEST_F(SessionTest, FullOutboxPausesUntilResumed) {
    store.set("big", std::string(1024 * 1024, 'b'));
    for (int i = 0; i < 5; i++)
        session->enqueue(request("GET", {"big"}));

    // Nobody reads: the third reply would push the outbox past its limit
    session->drain();
    EXPECT_EQ(session->backlog(), 3u);
    EXPECT_GE(connection->outbox_size(), Connection::MAX_OUTBOX_SIZE);
    EXPECT_EQ(notifications, 3); // two replies plus the pause

    EXPECT_TRUE(session->resume());
    EXPECT_FALSE(session->resume());
    EXPECT_FALSE(session->enqueue(request("PING")));
}

// Same scheduling as the server: whoever gets `true` from enqueue submits drain()
TEST_F(SessionTest, FifoHoldsAcrossManyWorkers) {
    WorkerPool pool{8};
    const int total = 500;

    for (int i = 0; i < total; i++) {
        if (session->enqueue(request("SET", {"counter", std::to_string(i)})))
            pool.submit([s = session]() { s->drain(); });
        if (session->enqueue(request("GET", {"counter"})))
            pool.submit([s = session]() { s->drain(); });
    }

    auto deadline = std::chrono::steady_clock::now() + 10s;
    while (notifications < 2 * total && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(1ms);
    ASSERT_EQ(notifications, 2 * total);

    std::string expected;
    for (int i = 0; i < total; i++) {
        std::string value = std::to_string(i);
        expected += "+OK\r\n$" + std::to_string(value.size()) + "\r\n" + value + "\r\n";
    }

    std::string received;
    while (received.size() < expected.size()) {
        std::string chunk = flush_to_client();
        if (chunk.empty() && !connection->outbox_has_data())
            break;
        received += chunk;
    }
    EXPECT_EQ(received, expected);
}
