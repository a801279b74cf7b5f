#include "minikv/keyspace.hpp"
#include <mutex>

namespace minikv {

Keyspace::Keyspace() : clock_([] { return WallClock::now(); }) {}

Keyspace::Keyspace(Clock clock) : clock_(std::move(clock)) {}

TimePoint Keyspace::now() const {
    return clock_();
}

bool Keyspace::put_locked(const std::string& key, Entry entry, TimePoint now) {
    auto [it, inserted] = data_.try_emplace(key, std::move(entry));
    bool previous_existed = false;
    if (!inserted) {
        previous_existed = !it->second.expired(now);
        it->second = std::move(entry);
    }
    ++sequence_;
    return previous_existed;
}

bool Keyspace::set(const std::string& key, std::string value,
                   std::optional<std::chrono::milliseconds> ttl) {
    TimePoint now = clock_();
    Entry entry{std::move(value), std::nullopt};
    // Millisecond resolution, the same as the snapshot file
    if (ttl)
        entry.expires_at = std::chrono::ceil<std::chrono::milliseconds>(now + *ttl);

    std::unique_lock lock(mutex_);
    return put_locked(key, std::move(entry), now);
}

bool Keyspace::set_at(const std::string& key, std::string value, std::optional<TimePoint> expires_at) {
    TimePoint now = clock_();
    std::unique_lock lock(mutex_);
    return put_locked(key, Entry{std::move(value), expires_at}, now);
}

void Keyspace::set_many(std::vector<std::pair<std::string, std::string>> pairs) {
    TimePoint now = clock_();
    std::unique_lock lock(mutex_);
    for (auto& [key, value] : pairs)
        put_locked(key, Entry{std::move(value), std::nullopt}, now);
}

std::optional<std::string> Keyspace::get(const std::string& key) {
    TimePoint now = clock_();
    {
        std::shared_lock lock(mutex_);
        auto it = data_.find(key);
        if (it == data_.end())
            return std::nullopt;
        if (!it->second.expired(now))
            return it->second.value;
    }

    // Expired: reclaim it. Recheck because a writer may have replaced the
    // entry between dropping the shared lock and taking the unique one.
    std::unique_lock lock(mutex_);
    auto it = data_.find(key);
    if (it == data_.end())
        return std::nullopt;
    if (!it->second.expired(now))
        return it->second.value;
    data_.erase(it);
    return std::nullopt;
}

std::vector<std::optional<std::string>> Keyspace::get_many(const std::vector<std::string>& keys) {
    TimePoint now = clock_();
    std::vector<std::optional<std::string>> values;
    values.reserve(keys.size());

    std::shared_lock lock(mutex_);
    for (const auto& key : keys) {
        auto it = data_.find(key);
        if (it == data_.end() || it->second.expired(now))
            values.emplace_back(std::nullopt);
        else
            values.emplace_back(it->second.value);
    }
    return values;
}

bool Keyspace::del(const std::string& key) {
    TimePoint now = clock_();
    std::unique_lock lock(mutex_);
    auto it = data_.find(key);
    if (it == data_.end())
        return false;

    bool live = !it->second.expired(now);
    data_.erase(it);
    if (live)
        ++sequence_;
    return live;
}

bool Keyspace::exists(const std::string& key) {
    return get(key).has_value();
}

size_t Keyspace::clear() {
    TimePoint now = clock_();
    std::unique_lock lock(mutex_);
    size_t live = 0;
    for (const auto& [key, entry] : data_) {
        if (!entry.expired(now))
            ++live;
    }
    data_.clear();
    if (live > 0)
        ++sequence_;
    return live;
}

size_t Keyspace::sweep_expired(size_t budget) {
    TimePoint now = clock_();
    std::unique_lock lock(mutex_);
    if (data_.empty())
        return 0;

    // Walk buckets round-robin from where the last sweep stopped
    std::vector<std::string> expired;
    const size_t buckets = data_.bucket_count();
    size_t examined = 0;
    for (size_t n = 0; n < buckets && examined < budget; ++n) {
        size_t bucket = sweep_cursor_++ % buckets;
        for (auto it = data_.begin(bucket); it != data_.end(bucket); ++it) {
            ++examined;
            if (it->second.expired(now))
                expired.push_back(it->first);
        }
    }

    for (const auto& key : expired)
        data_.erase(key);
    return expired.size();
}

Snapshot Keyspace::snapshot_view() const {
    TimePoint now = clock_();
    Snapshot snapshot;

    std::shared_lock lock(mutex_);
    snapshot.entries.reserve(data_.size());
    for (const auto& [key, entry] : data_) {
        if (!entry.expired(now))
            snapshot.entries.emplace_back(key, entry);
    }
    snapshot.sequence = sequence_;
    return snapshot;
}

size_t Keyspace::size() const {
    std::shared_lock lock(mutex_);
    return data_.size();
}

uint64_t Keyspace::sequence() const {
    std::shared_lock lock(mutex_);
    return sequence_;
}

void Keyspace::advance_sequence(uint64_t floor) {
    std::unique_lock lock(mutex_);
    if (sequence_ < floor)
        sequence_ = floor;
}

} // namespace minikv
