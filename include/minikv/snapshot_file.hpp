#pragma once

#include "minikv/keyspace.hpp"

#include <filesystem>
#include <istream>
#include <optional>
#include <stdexcept>
#include <string>

namespace minikv {

class SnapshotError : public std::runtime_error {
public:
    explicit SnapshotError(const std::string& msg) : std::runtime_error(msg) {}
};

/*
 * On-disk snapshot format.
 *
 *   MINIKV-SNAPSHOT 1
 *   ENTRY <expires_at_ms | -1> "<key>" "<value>"
 *   ...
 *   END <sequence> <entry_count>
 *
 * Keys and values are written with std::quoted, so any byte (newlines
 * included) survives. A file without a matching END trailer is corrupt.
 */
class SnapshotFile {
public:
    static std::string encode(const Snapshot& snapshot);

    // Throws SnapshotError on any malformed or truncated input
    static Snapshot decode(std::istream& in);

    // Writes <path>.tmp, fsyncs it, renames it over <path> and fsyncs the
    // directory. On failure <path> is left untouched and SnapshotError is thrown.
    static void write(const std::filesystem::path& path, const Snapshot& snapshot);

    // std::nullopt when <path> does not exist. Throws SnapshotError if it
    // exists but cannot be read or decoded.
    static std::optional<Snapshot> read(const std::filesystem::path& path);

    static std::filesystem::path temp_path(const std::filesystem::path& path);

private:
    static constexpr const char* MAGIC = "MINIKV-SNAPSHOT";
    static constexpr int VERSION = 1;
};

} // namespace minikv
