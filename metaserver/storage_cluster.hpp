#pragma once

#include "config.hpp"
#include "event_log.hpp"
#include "node_registry.hpp"
#include "chunk_store.hpp"
#include "catalog.hpp"
#include "placement.hpp"
#include "reconstruction.hpp"
#include <string>
#include <vector>
#include <map>
#include <chrono>
#include <mutex>
#include <random>

struct SubmitResult {
    std::string file_id;
    uint32_t total_chunks = 0;
};

struct FileSummary {
    std::string file_id;
    std::string original_name;
    int64_t total_size = 0;
    uint32_t total_chunks = 0;
    std::chrono::system_clock::time_point uploaded_at;
    std::string file_digest;
};

struct DashboardSummary {
    std::vector<NodeState> nodes;
    size_t total_files = 0;
    uint64_t total_chunks = 0;
    std::map<std::string, uint64_t> per_node_chunk_counts;  // from the catalog
    double uptime_seconds = 0;
};

// Owns the storage core for one data directory and exposes the operations
// the transport layer calls.
class StorageCluster {
private:
    ClusterConfig config;
    std::chrono::steady_clock::time_point started_at;

    EventLog events;
    NodeRegistry registry;
    ChunkStore store;
    Catalog catalog;
    PlacementEngine placement;
    ReconstructionEngine reconstruction;

    std::mutex id_mutex;
    std::mt19937_64 id_rng;

    std::string generateFileId();

public:
    // Validates the config (std::invalid_argument) and loads any existing
    // node records, chunk payloads and catalog from config.data_dir.
    explicit StorageCluster(const ClusterConfig& config);

    // Throws FsError(NoOnlineNodes) or FsError(StorageFailure); nothing is
    // committed to the catalog in that case.
    SubmitResult submitFile(const std::string& name, const std::vector<char>& bytes);

    ReconstructionResult requestReconstruction(const std::string& file_id);

    // Bytes of the last successful reconstruction of file_id.
    std::vector<char> downloadFile(const std::string& file_id, std::string* original_name = nullptr);

    std::vector<NodeState> listNodes() const;
    NodeState setNodeStatus(const std::string& node_id, NodeStatus status);
    NodeState toggleNodeStatus(const std::string& node_id);

    std::vector<FileSummary> listFiles() const;
    FileManifest getManifest(const std::string& file_id) const;
    DashboardSummary getDashboardSummary() const;
    std::vector<Event> recentEvents(size_t limit = 0) const;

    const ClusterConfig& getConfig() const { return config; }

    // Direct access for tests and tooling.
    NodeRegistry& nodeRegistry() { return registry; }
    ChunkStore& chunkStore() { return store; }
    PlacementEngine& placementEngine() { return placement; }
};
