#include "minikv/config.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <utility>
#include <vector>

namespace minikv {

namespace {

std::string trim(const std::string& s) {
    const auto first = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    if (first == s.end())
        return "";
    const auto last = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return std::string(first, last);
}

uint64_t parse_unsigned(const std::string& key, const std::string& value, uint64_t max) {
    uint64_t parsed = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
    if (ec != std::errc{} || ptr != value.data() + value.size() || value.empty() || parsed > max)
        throw ConfigError{"invalid value for " + key + ": '" + value + "'"};
    return parsed;
}

bool parse_bool(const std::string& key, const std::string& value) {
    if (value == "yes" || value == "true" || value == "1")
        return true;
    if (value == "no" || value == "false" || value == "0")
        return false;
    throw ConfigError{"invalid value for " + key + ": '" + value + "' (expected yes or no)"};
}

} // namespace


bool apply_setting(ServerConfig& config, const std::string& key, const std::string& value) {
    if (key == "bind") {
        config.bind = value;
    } else if (key == "port") {
        config.port = static_cast<uint16_t>(parse_unsigned(key, value, std::numeric_limits<uint16_t>::max()));
    } else if (key == "workers") {
        config.workers = parse_unsigned(key, value, 1024);
        if (config.workers == 0)
            throw ConfigError{"workers must be at least 1"};
    } else if (key == "snapshot-path") {
        if (value.empty())
            throw ConfigError{"snapshot-path must not be empty"};
        config.snapshot_path = value;
    } else if (key == "snapshot-interval") {
        config.snapshot_interval = std::chrono::seconds{parse_unsigned(key, value, 7 * 24 * 3600)};
    } else if (key == "sweep-interval-ms") {
        config.sweep_interval = std::chrono::milliseconds{parse_unsigned(key, value, 3600 * 1000)};
    } else if (key == "allow-empty-on-corrupt") {
        config.allow_empty_on_corrupt = parse_bool(key, value);
    } else {
        return false;
    }
    return true;
}

void load_config_file(ServerConfig& config, const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open())
        throw ConfigError{"cannot open config file " + path};

    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        const auto cleaned = trim(line.substr(0, line.find('#')));
        if (cleaned.empty())
            continue;

        std::istringstream iss(cleaned);
        std::string key;
        iss >> key;
        std::string value;
        std::getline(iss, value);
        value = trim(value);
        if (value.empty())
            throw ConfigError{path + ":" + std::to_string(line_no) + ": missing value for " + key};

        if (!apply_setting(config, key, value))
            std::cerr << "[Config] Ignoring unknown setting '" << key << "' in " << path << "\n";
    }
}

CommandLine parse_command_line(int argc, const char* const* argv) {
    CommandLine result;
    std::vector<std::pair<std::string, std::string>> flags;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            result.show_help = true;
            return result;
        }
        if (arg.rfind("--", 0) != 0)
            throw ConfigError{"unexpected argument '" + arg + "'"};
        if (i + 1 >= argc)
            throw ConfigError{"missing value for " + arg};

        std::string key = arg.substr(2);
        std::string value = argv[++i];
        if (key == "config")
            result.config_file = value;
        else
            flags.emplace_back(std::move(key), std::move(value));
    }

    if (!result.config_file.empty())
        load_config_file(result.config, result.config_file);

    for (const auto& [key, value] : flags) {
        if (!apply_setting(result.config, key, value))
            throw ConfigError{"unknown option --" + key};
    }
    return result;
}

std::string usage(const std::string& program) {
    return "Usage: " + program + " [options]\n"
           "  --config <file>                 read settings from file (flags override it)\n"
           "  --bind <ipv4>                   listen address (default 127.0.0.1)\n"
           "  --port <port>                   listen port (default 31337)\n"
           "  --workers <n>                   worker threads (default 4)\n"
           "  --snapshot-path <file>          snapshot file (default minikv.snapshot)\n"
           "  --snapshot-interval <seconds>   periodic snapshot, 0 disables (default 60)\n"
           "  --sweep-interval-ms <ms>        expired key sweep, 0 disables (default 1000)\n"
           "  --allow-empty-on-corrupt <yes|no>\n"
           "                                  start empty if the snapshot is corrupt (default no)\n";
}

} // namespace minikv
