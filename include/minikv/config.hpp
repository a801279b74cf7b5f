#pragma once

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace minikv {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

struct ServerConfig {
    std::string bind = "127.0.0.1";
    uint16_t port = 31337;
    size_t workers = 4;
    std::string snapshot_path = "minikv.snapshot";
    std::chrono::seconds snapshot_interval{60};      // 0 disables the timer
    std::chrono::milliseconds sweep_interval{1000};  // 0 disables active expiry
    bool allow_empty_on_corrupt = false;
};

// Result of command-line parsing. `config_file` is applied before the
// flags themselves, so flags always win.
struct CommandLine {
    ServerConfig config;
    std::string config_file;
    bool show_help = false;
};

// Applies one "key value" setting. Unknown keys return false.
// Throws ConfigError for a malformed value.
bool apply_setting(ServerConfig& config, const std::string& key, const std::string& value);

// Reads "key value" lines, '#' starts a comment. Throws ConfigError if the
// file cannot be opened or a value is malformed.
void load_config_file(ServerConfig& config, const std::string& path);

// Parses --key value flags (same keys as the config file) plus
// --config <file> and --help. Throws ConfigError on bad input.
CommandLine parse_command_line(int argc, const char* const* argv);

std::string usage(const std::string& program);

} // namespace minikv
