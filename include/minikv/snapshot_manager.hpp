#pragma once

#include "minikv/keyspace.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <stop_token>
#include <thread>

namespace minikv {

/*
 * Owns the snapshot file of one Keyspace.
 *
 * Lifecycle: Idle -> Restoring -> Ready once at startup, then
 * Ready -> Capturing -> Ready for every capture, successful or not.
 * Only one capture runs at a time; a request that finds one in flight
 * returns Coalesced without doing any work.
 *
 * The keyspace lock is held only while snapshot_view() copies the live
 * entries. Encoding and disk I/O run on the copy.
 */
class SnapshotManager {
public:
    enum class State { Idle, Restoring, Ready, Capturing };

    enum class CaptureResult {
        Written,    // new file is in place
        Unchanged,  // only_if_changed and nothing was written since the last capture
        Coalesced,  // another capture was already running
        NotReady,   // restore() has not completed yet
        Failed,     // I/O error, previous file is still the latest valid one
    };

    SnapshotManager(Keyspace& store, std::filesystem::path path);
    ~SnapshotManager();

    SnapshotManager(const SnapshotManager&) = delete;
    SnapshotManager& operator=(const SnapshotManager&) = delete;

    // Loads the snapshot file (if any) into the keyspace and moves to Ready.
    // Returns the number of entries loaded.
    // A corrupt file throws SnapshotError, unless allow_empty_on_corrupt is
    // set: then the file is moved aside to <path>.corrupt and nothing is loaded.
    // Throws std::logic_error if called more than once.
    size_t restore(bool allow_empty_on_corrupt = false);

    CaptureResult capture(bool only_if_changed = false);

    // Periodic captures every `interval`, skipped when nothing changed.
    // A zero interval leaves the timer off.
    void start(std::chrono::seconds interval);

    // Stops the timer. A capture that already took its view finishes first.
    void stop();

    State state() const noexcept;
    uint64_t last_captured_sequence() const noexcept;
    const std::filesystem::path& path() const noexcept { return path_; }

private:
    void timer_loop(std::stop_token stop_token, std::chrono::seconds interval);

    Keyspace& store_;
    std::filesystem::path path_;
    std::atomic<State> state_{State::Idle};
    std::atomic<uint64_t> last_sequence_{0};

    std::mutex timer_mutex_;
    std::condition_variable_any timer_cv_;
    std::jthread timer_;
};

const char* to_string(SnapshotManager::CaptureResult result) noexcept;

} // namespace minikv
