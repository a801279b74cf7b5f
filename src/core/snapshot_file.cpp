#include "minikv/snapshot_file.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <unistd.h>

namespace minikv {

namespace {

class ScopedFd {
public:
    explicit ScopedFd(int fd) noexcept : fd_(fd) {}
    ~ScopedFd() {
        if (fd_ != -1)
            ::close(fd_);
    }

    ScopedFd(const ScopedFd&) = delete;
    ScopedFd& operator=(const ScopedFd&) = delete;

    int get() const noexcept { return fd_; }

    // Closes now so the caller sees close(2) errors
    int close() noexcept {
        int rc = ::close(fd_);
        fd_ = -1;
        return rc;
    }

private:
    int fd_;
};

[[noreturn]] void fail(const std::string& what, const std::filesystem::path& path, int err) {
    throw SnapshotError{what + " " + path.string() + ": " + std::strerror(err)};
}

// Latest expiry a TimePoint can hold
const int64_t MAX_EXPIRES_MS =
    std::chrono::duration_cast<std::chrono::milliseconds>(TimePoint::max().time_since_epoch()).count();

int64_t to_epoch_ms(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

void write_fully(int fd, const std::string& data, const std::filesystem::path& path) {
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            fail("write failed for", path, errno);
        }
        written += static_cast<size_t>(n);
    }
}

void sync_directory(const std::filesystem::path& dir) {
    ScopedFd fd{::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC)};
    if (fd.get() == -1)
        fail("cannot open directory", dir, errno);
    if (::fsync(fd.get()) == -1)
        fail("fsync failed for directory", dir, errno);
}

} // namespace


std::string SnapshotFile::encode(const Snapshot& snapshot) {
    std::ostringstream out;
    out << MAGIC << ' ' << VERSION << '\n';
    for (const auto& [key, entry] : snapshot.entries) {
        int64_t expires = entry.expires_at ? to_epoch_ms(*entry.expires_at) : -1;
        out << "ENTRY " << expires << ' ' << std::quoted(key) << ' ' << std::quoted(entry.value) << '\n';
    }
    out << "END " << snapshot.sequence << ' ' << snapshot.entries.size() << '\n';
    return out.str();
}

Snapshot SnapshotFile::decode(std::istream& in) {
    std::string magic;
    int version = 0;
    if (!(in >> magic >> version) || magic != MAGIC)
        throw SnapshotError{"invalid snapshot header"};
    if (version != VERSION)
        throw SnapshotError{"unsupported snapshot version " + std::to_string(version)};

    Snapshot snapshot;
    std::string tag;
    while (in >> tag) {
        if (tag == "ENTRY") {
            int64_t expires = 0;
            std::string key;
            std::string value;
            if (!(in >> expires >> std::quoted(key) >> std::quoted(value)) || expires < -1 ||
                expires > MAX_EXPIRES_MS)
                throw SnapshotError{"malformed entry #" + std::to_string(snapshot.entries.size() + 1)};

            Entry entry{std::move(value), std::nullopt};
            if (expires >= 0)
                entry.expires_at = TimePoint{std::chrono::milliseconds{expires}};
            snapshot.entries.emplace_back(std::move(key), std::move(entry));
            continue;
        }

        if (tag == "END") {
            size_t count = 0;
            if (!(in >> snapshot.sequence >> count))
                throw SnapshotError{"malformed trailer"};
            if (count != snapshot.entries.size())
                throw SnapshotError{"trailer expects " + std::to_string(count) + " entries, found " +
                                    std::to_string(snapshot.entries.size())};
            if (in >> tag)
                throw SnapshotError{"unexpected data after trailer"};
            return snapshot;
        }

        throw SnapshotError{"unknown record '" + tag + "'"};
    }
    throw SnapshotError{"truncated snapshot: missing trailer"};
}

std::filesystem::path SnapshotFile::temp_path(const std::filesystem::path& path) {
    auto tmp = path;
    tmp += ".tmp";
    return tmp;
}

void SnapshotFile::write(const std::filesystem::path& path, const Snapshot& snapshot) {
    const std::string data = encode(snapshot);
    const auto tmp = temp_path(path);

    try {
        ScopedFd fd{::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644)};
        if (fd.get() == -1)
            fail("cannot create", tmp, errno);

        write_fully(fd.get(), data, tmp);
        if (::fsync(fd.get()) == -1)
            fail("fsync failed for", tmp, errno);
        if (fd.close() == -1)
            fail("close failed for", tmp, errno);

        std::error_code ec;
        std::filesystem::rename(tmp, path, ec);
        if (ec)
            fail("cannot rename over", path, ec.value());
    } catch (const SnapshotError&) {
        std::error_code ignored;
        std::filesystem::remove(tmp, ignored);
        throw;
    }

    auto dir = path.parent_path();
    sync_directory(dir.empty() ? std::filesystem::path{"."} : dir);
}

std::optional<Snapshot> SnapshotFile::read(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (ec)
            fail("cannot stat", path, ec.value());
        return std::nullopt;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open())
        fail("cannot open", path, errno);
    return decode(in);
}

} // namespace minikv
