#include <string>
#include <iostream>
#include <csignal>
#include <atomic>
#include <thread>
#include <chrono>
#include "config.hpp"
#include "storage_cluster.hpp"
#include "service_impl.hpp"
#include <grpcpp/server_builder.h>
#include <grpcpp/server.h>

using ::grpc::ServerBuilder;
using ::grpc::Server;

// Global flag for graceful shutdown
std::atomic<bool> running{true};

void RunServer(const ClusterConfig& config) {
    StorageCluster cluster(config);
    FsLiteServiceImpl service(&cluster);

    int max_message_bytes = config.max_message_mb * 1024 * 1024;

    ServerBuilder server_builder;
    server_builder.AddListeningPort(config.listen_addr, grpc::InsecureServerCredentials());
    server_builder.SetMaxReceiveMessageSize(max_message_bytes);
    server_builder.SetMaxSendMessageSize(max_message_bytes);
    server_builder.RegisterService(&service);

    std::unique_ptr<Server> server{server_builder.BuildAndStart()};
    if (!server) {
        std::cerr << "[ERROR] Failed to start server on " << config.listen_addr << "\n";
        return;
    }

    signal(SIGINT, [](int) { running = false; });

    // Shutdown() is not signal-safe, so a watcher thread issues it
    std::thread watcher([&server]() {
        while (running.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        std::cout << "\n[INFO] Shutdown signal received\n";
        server->Shutdown();
    });

    std::cout << "[INFO] Server listening on " << config.listen_addr << "\n";
    std::cout << "[INFO] Data directory: " << config.data_dir << "\n";
    std::cout << "[INFO] Nodes: " << config.nodes.size()
              << ", chunk size: " << config.chunk_size << " bytes\n";

    server->Wait();
    running = false;
    if (watcher.joinable()) {
        watcher.join();
    }
    std::cout << "[INFO] Server shutdown complete\n";
}

int main(int argc, char* argv[]) {
    ClusterConfig config;
    try {
        config = parseArgs(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "[ERROR] " << e.what() << "\n" << usage(argv[0]);
        return 1;
    }

    if (config.show_help) {
        std::cout << usage(argv[0]);
        return 0;
    }

    std::cout << "====================================\n";
    std::cout << "        FS-Lite Server Starting     \n";
    std::cout << "====================================\n";

    try {
        RunServer(config);
    } catch (const FsError& e) {
        std::cerr << "[ERROR] " << e.describe() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 1;
    }
    return 0;
}
