#include "minikv/snapshot_manager.hpp"
#include "minikv/snapshot_file.hpp"

#include <iostream>
#include <stdexcept>
#include <system_error>

namespace minikv {

namespace {

// Puts the manager back to Ready however capture() leaves
class ReadyOnExit {
public:
    explicit ReadyOnExit(std::atomic<SnapshotManager::State>& state) noexcept : state_(state) {}
    ~ReadyOnExit() { state_ = SnapshotManager::State::Ready; }

    ReadyOnExit(const ReadyOnExit&) = delete;
    ReadyOnExit& operator=(const ReadyOnExit&) = delete;

private:
    std::atomic<SnapshotManager::State>& state_;
};

} // namespace

SnapshotManager::SnapshotManager(Keyspace& store, std::filesystem::path path)
    : store_(store), path_(std::move(path)) {}

SnapshotManager::~SnapshotManager() {
    stop();
}

size_t SnapshotManager::restore(bool allow_empty_on_corrupt) {
    State expected = State::Idle;
    if (!state_.compare_exchange_strong(expected, State::Restoring))
        throw std::logic_error("snapshot restore can only run once");

    std::optional<Snapshot> snapshot;
    try {
        snapshot = SnapshotFile::read(path_);
    } catch (const SnapshotError& e) {
        if (!allow_empty_on_corrupt) {
            state_ = State::Idle;
            throw;
        }

        auto aside = path_;
        aside += ".corrupt";
        std::error_code ec;
        std::filesystem::rename(path_, aside, ec);
        std::cerr << "[Snapshot] " << e.what() << "; starting with an empty keyspace"
                  << (ec ? "" : ", corrupt file kept as " + aside.string()) << "\n";
    }

    size_t loaded = 0;
    if (snapshot) {
        // Decoded in full before the first set(): a bad file never leaves partial data
        const TimePoint now = store_.now();
        for (auto& [key, entry] : snapshot->entries) {
            if (entry.expired(now))
                continue;
            store_.set_at(key, std::move(entry.value), entry.expires_at);
            ++loaded;
        }
        store_.advance_sequence(snapshot->sequence);
        std::cout << "[Snapshot] Restored " << loaded << " keys from " << path_.string()
                  << " (sequence " << snapshot->sequence << ")\n";
    } else {
        std::cout << "[Snapshot] No snapshot at " << path_.string() << ", starting empty\n";
    }

    last_sequence_ = store_.sequence();
    state_ = State::Ready;
    return loaded;
}

SnapshotManager::CaptureResult SnapshotManager::capture(bool only_if_changed) {
    State expected = State::Ready;
    if (!state_.compare_exchange_strong(expected, State::Capturing))
        return expected == State::Capturing ? CaptureResult::Coalesced : CaptureResult::NotReady;
    ReadyOnExit ready_on_exit{state_};

    CaptureResult result = CaptureResult::Written;
    if (only_if_changed && store_.sequence() == last_sequence_) {
        result = CaptureResult::Unchanged;
    } else {
        Snapshot view = store_.snapshot_view();
        try {
            SnapshotFile::write(path_, view);
            last_sequence_ = view.sequence;
            std::cout << "[Snapshot] Wrote " << view.entries.size() << " keys to " << path_.string()
                      << " (sequence " << view.sequence << ")\n";
        } catch (const SnapshotError& e) {
            std::cerr << "[Snapshot] Capture failed, keeping previous snapshot: " << e.what() << "\n";
            result = CaptureResult::Failed;
        }
    }
    return result;
}

void SnapshotManager::start(std::chrono::seconds interval) {
    if (interval.count() <= 0 || timer_.joinable())
        return;
    timer_ = std::jthread([this, interval](std::stop_token stop_token) {
        timer_loop(stop_token, interval);
    });
}

void SnapshotManager::stop() {
    if (!timer_.joinable())
        return;
    timer_.request_stop();
    timer_.join();
}

void SnapshotManager::timer_loop(std::stop_token stop_token, std::chrono::seconds interval) {
    while (!stop_token.stop_requested()) {
        {
            std::unique_lock lock(timer_mutex_);
            // Returns early only when a stop is requested
            timer_cv_.wait_for(lock, stop_token, interval, [] { return false; });
        }
        if (stop_token.stop_requested())
            break; // shutting down before the view was taken

        capture(true);
    }
}

SnapshotManager::State SnapshotManager::state() const noexcept {
    return state_;
}

uint64_t SnapshotManager::last_captured_sequence() const noexcept {
    return last_sequence_;
}

const char* to_string(SnapshotManager::CaptureResult result) noexcept {
    switch (result) {
    case SnapshotManager::CaptureResult::Written:
        return "written";
    case SnapshotManager::CaptureResult::Unchanged:
        return "unchanged";
    case SnapshotManager::CaptureResult::Coalesced:
        return "coalesced";
    case SnapshotManager::CaptureResult::NotReady:
        return "not ready";
    case SnapshotManager::CaptureResult::Failed:
        return "failed";
    }
    return "unknown";
}

} // namespace minikv
