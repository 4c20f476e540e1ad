#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

// gRPC message limits are int byte counts
constexpr int kMaxMessageMb = 2047;

struct ClusterConfig {
    std::string data_dir = "./fslite_data";
    std::vector<std::string> nodes{"node1", "node2", "node3", "node4"};
    size_t chunk_size = 1024 * 1024;  // 1 MB chunks
    size_t log_capacity = 100;
    std::string listen_addr = "0.0.0.0:50051";
    int max_message_mb = 64;
    bool show_help = false;

    // Throws std::invalid_argument naming the offending setting.
    void validate() const;
};

// Parses --flag value pairs on top of the defaults above. Throws
// std::invalid_argument for malformed values or missing flag arguments.
ClusterConfig parseArgs(int argc, char* argv[]);

std::vector<std::string> splitNodeList(const std::string& list);

std::string usage(const std::string& program);
