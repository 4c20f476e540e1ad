#include "config.hpp"
#include <sstream>
#include <string>
#include <stdexcept>
#include <unordered_set>

namespace {

size_t parsePositive(const std::string& flag, const std::string& value) {
    size_t consumed = 0;
    long long parsed = 0;
    try {
        parsed = std::stoll(value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument(flag + " expects a number, got '" + value + "'");
    }
    if (consumed != value.size() || parsed <= 0) {
        throw std::invalid_argument(flag + " expects a positive number, got '" + value + "'");
    }
    return static_cast<size_t>(parsed);
}

} // namespace

std::vector<std::string> splitNodeList(const std::string& list) {
    std::vector<std::string> nodes;
    std::stringstream ss(list);
    std::string item;
    while (std::getline(ss, item, ',')) {
        nodes.push_back(item);
    }
    return nodes;
}

void ClusterConfig::validate() const {
    if (data_dir.empty()) {
        throw std::invalid_argument("--data-dir must not be empty");
    }
    if (nodes.empty()) {
        throw std::invalid_argument("--nodes must name at least one node");
    }

    std::unordered_set<std::string> seen;
    for (const auto& node : nodes) {
        if (node.empty()) {
            throw std::invalid_argument("--nodes contains an empty node id");
        }
        if (node.find('/') != std::string::npos || node == "." || node == "..") {
            throw std::invalid_argument("--nodes contains an invalid node id: " + node);
        }
        if (!seen.insert(node).second) {
            throw std::invalid_argument("--nodes contains duplicate node id: " + node);
        }
    }

    if (chunk_size == 0) {
        throw std::invalid_argument("--chunk-size must be positive");
    }
    if (log_capacity == 0) {
        throw std::invalid_argument("--log-capacity must be positive");
    }
    if (max_message_mb <= 0) {
        throw std::invalid_argument("--max-message-mb must be positive");
    }
    if (max_message_mb > kMaxMessageMb) {
        throw std::invalid_argument("--max-message-mb must not exceed " + std::to_string(kMaxMessageMb));
    }
}

ClusterConfig parseArgs(int argc, char* argv[]) {
    ClusterConfig config;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--help") {
            config.show_help = true;
            continue;
        }
        if (i + 1 >= argc) {
            throw std::invalid_argument(arg + " requires a value");
        }
        std::string value = argv[++i];

        if (arg == "--data-dir") {
            config.data_dir = value;
        } else if (arg == "--nodes") {
            config.nodes = splitNodeList(value);
        } else if (arg == "--chunk-size") {
            config.chunk_size = parsePositive(arg, value);
        } else if (arg == "--log-capacity") {
            config.log_capacity = parsePositive(arg, value);
        } else if (arg == "--listen-addr") {
            config.listen_addr = value;
        } else if (arg == "--max-message-mb") {
            size_t mb = parsePositive(arg, value);
            if (mb > static_cast<size_t>(kMaxMessageMb)) {
                throw std::invalid_argument(arg + " must not exceed " + std::to_string(kMaxMessageMb) +
                                            ", got '" + value + "'");
            }
            config.max_message_mb = static_cast<int>(mb);
        } else {
            throw std::invalid_argument("Unknown option: " + arg);
        }
    }

    config.validate();
    return config;
}

std::string usage(const std::string& program) {
    std::stringstream ss;
    ss << "Usage: " << program << " [options]\n"
       << "Options:\n"
       << "  --data-dir <path>         Root directory for nodes and catalog (default: ./fslite_data)\n"
       << "  --nodes <a,b,c>           Fixed node population (default: node1,node2,node3,node4)\n"
       << "  --chunk-size <bytes>      Maximum chunk size (default: 1048576)\n"
       << "  --log-capacity <n>        Events retained by the event log (default: 100)\n"
       << "  --listen-addr <addr>      gRPC listen address (default: 0.0.0.0:50051)\n"
       << "  --max-message-mb <n>      Largest accepted gRPC message in MB (default: 64)\n"
       << "  --help                    Show this help message\n";
    return ss.str();
}
