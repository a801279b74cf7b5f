#include "tcp_server.hpp"
#include "minikv/config.hpp"
#include "minikv/keyspace.hpp"
#include "minikv/snapshot_file.hpp"
#include "minikv/snapshot_manager.hpp"

#include <exception>
#include <iostream>
#include <system_error>


/*
 * Entry point for the server executable.
 * parse CLI args and config file
 * restore the snapshot before anything listens
 * serve until SIGINT/SIGTERM, then take a final snapshot
 */

int main(int argc, char** argv) {
    minikv::CommandLine cli;
    try {
        cli = minikv::parse_command_line(argc, argv);
    } catch (const minikv::ConfigError& e) {
        std::cerr << "[Config] " << e.what() << "\n" << minikv::usage(argv[0]);
        return 2;
    }
    if (cli.show_help) {
        std::cout << minikv::usage(argv[0]);
        return 0;
    }
    const minikv::ServerConfig& config = cli.config;

    minikv::Keyspace store;
    minikv::SnapshotManager snapshots{store, config.snapshot_path};

    try {
        snapshots.restore(config.allow_empty_on_corrupt);
    } catch (const minikv::SnapshotError& e) {
        std::cerr << "[Snapshot] Refusing to start: " << e.what() << "\n";
        return 1;
    }

    minikv::TcpServer server{store, config};
    try {
        server.listen();
        server.install_signal_handlers();
        snapshots.start(config.snapshot_interval);
        server.run();
    } catch (const std::system_error& e) {
        std::cerr << "[Server] " << e.what() << "\n";
        snapshots.stop();
        return 1;
    }

    snapshots.stop();
    auto result = snapshots.capture(true);
    std::cout << "[Snapshot] Final snapshot: " << minikv::to_string(result) << "\n";
    return result == minikv::SnapshotManager::CaptureResult::Failed ? 1 : 0;
}
