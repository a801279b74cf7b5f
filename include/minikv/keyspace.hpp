#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>


namespace minikv {

using WallClock = std::chrono::system_clock;
using TimePoint = WallClock::time_point;

/*
 * One stored value plus its optional absolute expiry.
 */
struct Entry {
    std::string value;
    std::optional<TimePoint> expires_at;

    bool expired(TimePoint now) const {
        return expires_at && *expires_at <= now;
    }
};

/*
 * Immutable point-in-time copy of all live entries.
 * `sequence` is the keyspace mutation counter at the moment of the copy.
 */
struct Snapshot {
    std::vector<std::pair<std::string, Entry>> entries;
    uint64_t sequence{0};
};

/*
 * Thread-safe in-memory keyspace with lazy expiration.
 *
 * Every member function is atomic with respect to the others: reads hold
 * the mutex shared, writes hold it exclusively, and expiry is evaluated
 * inside the same critical section as the access that observes it.
 * Every successful write bumps the mutation sequence.
 */
class Keyspace {
public:
    using Clock = std::function<TimePoint()>;

    Keyspace();
    explicit Keyspace(Clock clock);

    Keyspace(const Keyspace&) = delete;
    Keyspace& operator=(const Keyspace&) = delete;

    // Returns true if a live entry was replaced
    bool set(const std::string& key, std::string value,
             std::optional<std::chrono::milliseconds> ttl = std::nullopt);

    // Same as set() with an absolute expiry, used when restoring
    bool set_at(const std::string& key, std::string value, std::optional<TimePoint> expires_at);

    void set_many(std::vector<std::pair<std::string, std::string>> pairs);

    std::optional<std::string> get(const std::string& key);
    std::vector<std::optional<std::string>> get_many(const std::vector<std::string>& keys);

    bool del(const std::string& key);
    bool exists(const std::string& key);

    // Drops every entry, returns how many of them were live
    size_t clear();

    // Examines roughly `budget` entries, resuming where the previous call
    // stopped, and physically removes the expired ones. Observable results
    // are unchanged and the sequence is not bumped.
    size_t sweep_expired(size_t budget);

    Snapshot snapshot_view() const;

    size_t size() const;
    uint64_t sequence() const;

    // Raises the sequence to at least `floor`, used when restoring
    void advance_sequence(uint64_t floor);
    TimePoint now() const;

private:
    // Caller holds mutex_ exclusively
    bool put_locked(const std::string& key, Entry entry, TimePoint now);

    Clock clock_;
    std::unordered_map<std::string, Entry> data_;
    uint64_t sequence_{0};
    size_t sweep_cursor_{0};
    mutable std::shared_mutex mutex_;
};

} // namespace minikv
