#pragma once

#include "minikv/keyspace.hpp"
#include "minikv/protocol.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace minikv {

struct Get {
    std::string key;
};

struct Set {
    std::string key;
    std::string value;
    std::optional<std::chrono::milliseconds> ttl;
};

struct Del {
    std::string key;
};

struct Exists {
    std::string key;
};

struct MGet {
    std::vector<std::string> keys;
};

struct MSet {
    std::vector<std::pair<std::string, std::string>> pairs;
};

struct Flush {};

struct Ping {};

using Command = std::variant<Get, Set, Del, Exists, MGet, MSet, Flush, Ping>;

/*
 * Turns framed requests into keyspace calls and replies.
 * Holds no per-connection state.
 */
class CommandDispatcher {
public:
    // Never throws for bad input: unknown commands and bad arguments
    // come back as error replies and leave the keyspace untouched.
    static Reply execute(const Request& request, Keyspace& store);

    static Reply execute(const Command& command, Keyspace& store);

    // Throws ProtocolError with the client-facing message
    static Command parse(const Request& request);

private:
    static std::optional<std::chrono::milliseconds> parse_ttl(const std::string& option,
                                                              const std::string& amount);
};

} // namespace minikv
