#include <gtest/gtest.h>
#include "minikv/command_dispatcher.hpp"
#include "minikv/snapshot_file.hpp"
#include "minikv/snapshot_manager.hpp"

#include <atomic>
#include <fstream>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace minikv;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

using CaptureResult = SnapshotManager::CaptureResult;

class SnapshotManagerTest : public ::testing::Test {
protected:
    fs::path dir_;
    fs::path path_;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::temp_directory_path() / (std::string{"minikv_snapshot_manager_"} + info->name());
        fs::remove_all(dir_);
        fs::create_directories(dir_);
        path_ = dir_ / "minikv.snapshot";
    }

    void TearDown() override {
        std::error_code ignored;
        fs::remove_all(dir_, ignored);
    }

    static Reply run(Keyspace& store, const std::string& name, std::vector<std::string> args) {
        return CommandDispatcher::execute(Request{name, std::move(args)}, store);
    }

    void put_file(const std::string& text) {
        std::ofstream out(path_, std::ios::binary);
        out << text;
    }
};


TEST_F(SnapshotManagerTest, RestoreWithoutFileStartsEmpty) {
    Keyspace store;
    SnapshotManager snapshots{store, path_};
    EXPECT_EQ(snapshots.state(), SnapshotManager::State::Idle);

    EXPECT_EQ(snapshots.restore(), 0u);
    EXPECT_EQ(snapshots.state(), SnapshotManager::State::Ready);
    EXPECT_EQ(store.size(), 0u);
}

TEST_F(SnapshotManagerTest, CaptureBeforeRestoreIsNotReady) {
    Keyspace store;
    SnapshotManager snapshots{store, path_};
    EXPECT_EQ(snapshots.capture(), CaptureResult::NotReady);
    EXPECT_FALSE(fs::exists(path_));
}

TEST_F(SnapshotManagerTest, RestoreRunsOnlyOnce) {
    Keyspace store;
    SnapshotManager snapshots{store, path_};
    snapshots.restore();
    EXPECT_THROW(snapshots.restore(), std::logic_error);
    EXPECT_EQ(snapshots.state(), SnapshotManager::State::Ready);
}

TEST_F(SnapshotManagerTest, CaptureThenRestoreReproducesReads) {
    {
        Keyspace store;
        SnapshotManager snapshots{store, path_};
        snapshots.restore();

        run(store, "SET", {"a", "1"});
        run(store, "SET", {"b", "two words"});
        run(store, "SET", {"gone", "x"});
        run(store, "DEL", {"gone"});
        run(store, "SET", {"ttl", "later", "EX", "3600"});
        run(store, "SET", {"a", "overwritten"});

        EXPECT_EQ(snapshots.capture(), CaptureResult::Written);
        EXPECT_EQ(snapshots.last_captured_sequence(), store.sequence());
    }

    Keyspace restored;
    SnapshotManager snapshots{restored, path_};
    EXPECT_EQ(snapshots.restore(), 3u);

    EXPECT_EQ(run(restored, "GET", {"a"}), Reply::bulk("overwritten"));
    EXPECT_EQ(run(restored, "GET", {"b"}), Reply::bulk("two words"));
    EXPECT_EQ(run(restored, "GET", {"ttl"}), Reply::bulk("later"));
    EXPECT_EQ(run(restored, "GET", {"gone"}), Reply::nil());
    EXPECT_EQ(run(restored, "EXISTS", {"gone"}), Reply::number(0));
}

TEST_F(SnapshotManagerTest, RestoreKeepsAbsoluteExpiry) {
    TimePoint now{std::chrono::seconds{1700000000}};
    {
        Keyspace store{[&now] { return now; }};
        SnapshotManager snapshots{store, path_};
        snapshots.restore();
        store.set("short", "v", 10s);
        store.set("long", "v", 100s);
        ASSERT_EQ(snapshots.capture(), CaptureResult::Written);
    }

    now += 20s; // "short" expired while the server was down
    Keyspace store{[&now] { return now; }};
    SnapshotManager snapshots{store, path_};
    EXPECT_EQ(snapshots.restore(), 1u);
    EXPECT_FALSE(store.exists("short"));
    EXPECT_TRUE(store.exists("long"));

    now += 80s;
    EXPECT_FALSE(store.exists("long"));
}

TEST_F(SnapshotManagerTest, RestoreCarriesSequenceOver) {
    uint64_t captured = 0;
    {
        Keyspace store;
        SnapshotManager snapshots{store, path_};
        snapshots.restore();
        for (int i = 0; i < 10; i++)
            store.set("k", std::to_string(i));
        store.set("other", "x");
        ASSERT_EQ(snapshots.capture(), CaptureResult::Written);
        captured = store.sequence();
    }

    Keyspace store;
    SnapshotManager snapshots{store, path_};
    EXPECT_EQ(snapshots.restore(), 2u);
    EXPECT_EQ(store.sequence(), captured);
    EXPECT_EQ(snapshots.last_captured_sequence(), captured);
    EXPECT_EQ(snapshots.capture(true), CaptureResult::Unchanged);

    store.set("k", "new");
    EXPECT_EQ(store.sequence(), captured + 1);
}

TEST_F(SnapshotManagerTest, CaptureOnlyIfChanged) {
    Keyspace store;
    SnapshotManager snapshots{store, path_};
    snapshots.restore();

    EXPECT_EQ(snapshots.capture(true), CaptureResult::Unchanged);
    store.set("k", "v");
    EXPECT_EQ(snapshots.capture(true), CaptureResult::Written);
    EXPECT_EQ(snapshots.capture(true), CaptureResult::Unchanged);
    store.get("k");
    EXPECT_EQ(snapshots.capture(true), CaptureResult::Unchanged);
    EXPECT_EQ(snapshots.capture(), CaptureResult::Written);
}

TEST_F(SnapshotManagerTest, CorruptSnapshotRefusesToStart) {
    put_file("MINIKV-SNAPSHOT 1\nENTRY -1 \"a\" \"1\"\n");

    Keyspace store;
    SnapshotManager snapshots{store, path_};
    EXPECT_THROW(snapshots.restore(), SnapshotError);
    EXPECT_EQ(snapshots.state(), SnapshotManager::State::Idle);
    EXPECT_EQ(store.size(), 0u);
    EXPECT_TRUE(fs::exists(path_));
}

TEST_F(SnapshotManagerTest, CorruptSnapshotCanBeMovedAside) {
    put_file("MINIKV-SNAPSHOT 1\nENTRY -1 \"a\" \"1\"\nEND 1 5\n");

    Keyspace store;
    SnapshotManager snapshots{store, path_};
    EXPECT_EQ(snapshots.restore(true), 0u);
    EXPECT_EQ(snapshots.state(), SnapshotManager::State::Ready);
    EXPECT_EQ(store.size(), 0u);

    auto aside = path_;
    aside += ".corrupt";
    EXPECT_TRUE(fs::exists(aside));
    EXPECT_FALSE(fs::exists(path_));
}

TEST_F(SnapshotManagerTest, FailedCaptureKeepsServing) {
    Keyspace store;
    SnapshotManager snapshots{store, dir_ / "no_such_dir" / "minikv.snapshot"};
    snapshots.restore();

    store.set("k", "v");
    EXPECT_EQ(snapshots.capture(), CaptureResult::Failed);
    EXPECT_EQ(snapshots.state(), SnapshotManager::State::Ready);
    EXPECT_EQ(snapshots.last_captured_sequence(), 0u);

    EXPECT_EQ(store.get("k"), "v");
    store.set("k", "w");
    EXPECT_EQ(store.get("k"), "w");
}

TEST_F(SnapshotManagerTest, FailedCaptureLeavesPreviousSnapshot) {
    Keyspace store;
    SnapshotManager snapshots{store, path_};
    snapshots.restore();
    store.set("k", "first");
    ASSERT_EQ(snapshots.capture(), CaptureResult::Written);

    // A directory in place of the temp file makes the next write fail
    fs::create_directory(SnapshotFile::temp_path(path_));
    store.set("k", "second");
    EXPECT_EQ(snapshots.capture(), CaptureResult::Failed);

    auto on_disk = SnapshotFile::read(path_);
    ASSERT_TRUE(on_disk.has_value());
    ASSERT_EQ(on_disk->entries.size(), 1u);
    EXPECT_EQ(on_disk->entries[0].second.value, "first");
}

TEST_F(SnapshotManagerTest, UnexpectedCaptureErrorReleasesState) {
    std::atomic<bool> clock_fails{false};
    Keyspace store{[&clock_fails] {
        if (clock_fails)
            throw std::runtime_error("clock unavailable");
        return WallClock::now();
    }};
    SnapshotManager snapshots{store, path_};
    snapshots.restore();

    clock_fails = true;
    EXPECT_THROW(snapshots.capture(), std::runtime_error);
    EXPECT_EQ(snapshots.state(), SnapshotManager::State::Ready);

    clock_fails = false;
    EXPECT_EQ(snapshots.capture(), CaptureResult::Written);
}

TEST_F(SnapshotManagerTest, ConcurrentCapturesCoalesce) {
    Keyspace store;
    for (int i = 0; i < 20000; i++)
        store.set("key" + std::to_string(i), std::string(64, 'x'));
    SnapshotManager snapshots{store, path_};
    snapshots.restore();

    const int num_threads = 8;
    std::vector<CaptureResult> results(num_threads);
    std::vector<std::thread> threads;
    for (int i = 0; i < num_threads; i++)
        threads.emplace_back([&, i] { results[i] = snapshots.capture(); });
    for (auto& t : threads)
        t.join();

    int written = 0;
    for (auto result : results) {
        EXPECT_TRUE(result == CaptureResult::Written || result == CaptureResult::Coalesced)
            << to_string(result);
        written += result == CaptureResult::Written;
    }
    EXPECT_GE(written, 1);
    EXPECT_EQ(snapshots.state(), SnapshotManager::State::Ready);
    EXPECT_EQ(SnapshotFile::read(path_)->entries.size(), 20000u);
}

TEST_F(SnapshotManagerTest, CaptureDuringWritesIsNeverTorn) {
    Keyspace store;
    SnapshotManager snapshots{store, path_};
    snapshots.restore();

    const std::string even(1024, 'e');
    const std::string odd(1024, 'o');
    std::atomic<bool> done{false};
    std::thread writer([&] {
        for (int i = 0; i < 5000; i++) {
            store.set("a", i % 2 ? odd : even);
            store.set("b", i % 2 ? odd : even);
        }
        done = true;
    });

    while (!done) {
        if (snapshots.capture() != CaptureResult::Written)
            continue;
        auto on_disk = SnapshotFile::read(path_);
        ASSERT_TRUE(on_disk.has_value());
        for (const auto& [key, entry] : on_disk->entries)
            EXPECT_TRUE(entry.value == even || entry.value == odd);
    }
    writer.join();
}

TEST_F(SnapshotManagerTest, TimerCapturesChanges) {
    Keyspace store;
    SnapshotManager snapshots{store, path_};
    snapshots.restore();
    store.set("k", "v");

    snapshots.start(1s);
    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (!fs::exists(path_) && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(10ms);
    snapshots.stop();

    ASSERT_TRUE(fs::exists(path_));
    EXPECT_EQ(snapshots.last_captured_sequence(), store.sequence());
}

TEST_F(SnapshotManagerTest, StopIsPromptAndRepeatable) {
    Keyspace store;
    SnapshotManager snapshots{store, path_};
    snapshots.restore();

    snapshots.start(3600s);
    auto begin = std::chrono::steady_clock::now();
    snapshots.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - begin, 2s);
    snapshots.stop();
    EXPECT_FALSE(fs::exists(path_));
}
