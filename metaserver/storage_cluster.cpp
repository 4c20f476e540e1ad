#include "storage_cluster.hpp"
#include "errors.hpp"
#include "clock.hpp"
#include <filesystem>

namespace fs = std::filesystem;

namespace {

const ClusterConfig& validated(const ClusterConfig& config) {
    config.validate();
    return config;
}

std::string nodesRootFor(const ClusterConfig& config) {
    return (fs::path(config.data_dir) / "nodes").string();
}

} // namespace

StorageCluster::StorageCluster(const ClusterConfig& config)
    : config(validated(config)),
      started_at(std::chrono::steady_clock::now()),
      events(config.log_capacity),
      registry(nodesRootFor(config), config.nodes),
      store(nodesRootFor(config)),
      catalog((fs::path(config.data_dir) / "catalog.pb").string()),
      placement(registry, store, events, config.chunk_size),
      reconstruction(catalog, registry, store, events,
                     (fs::path(config.data_dir) / "reconstructed").string()),
      id_rng(std::random_device{}()) {

    events.info("System started");
}

std::string StorageCluster::generateFileId() {
    static const char kAlphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";

    std::lock_guard<std::mutex> lock(id_mutex);
    std::uniform_int_distribution<int> dis(0, 35);

    std::string file_id;
    do {
        file_id = std::to_string(toEpochMillis(std::chrono::system_clock::now())) + "-";
        for (int i = 0; i < 9; ++i) {
            file_id += kAlphabet[dis(id_rng)];
        }
    } while (catalog.contains(file_id));

    return file_id;
}

SubmitResult StorageCluster::submitFile(const std::string& name, const std::vector<char>& bytes) {
    std::string file_id = generateFileId();

    FileManifest manifest = placement.place(file_id, name, bytes);

    try {
        catalog.put(file_id, manifest);
    } catch (const FsError& e) {
        placement.discard(manifest);
        events.error("Upload error: " + std::string(e.what()));
        throw;
    }

    events.info("Upload completed: " + name);
    return {file_id, manifest.total_chunks};
}

ReconstructionResult StorageCluster::requestReconstruction(const std::string& file_id) {
    return reconstruction.reconstruct(file_id);
}

std::vector<char> StorageCluster::downloadFile(const std::string& file_id, std::string* original_name) {
    std::vector<char> bytes = reconstruction.readOutput(file_id);
    if (original_name) {
        *original_name = catalog.get(file_id).original_name;
    }
    return bytes;
}

std::vector<NodeState> StorageCluster::listNodes() const {
    return registry.listNodes();
}

NodeState StorageCluster::setNodeStatus(const std::string& node_id, NodeStatus status) {
    NodeState state = registry.setStatus(node_id, status);
    events.info("Node " + node_id + " is now " + nodeStatusName(state.status));
    return state;
}

NodeState StorageCluster::toggleNodeStatus(const std::string& node_id) {
    if (!registry.isKnown(node_id)) {
        throw FsError(ErrorCode::UnknownNode, "Invalid node ID: " + node_id).withNode(node_id);
    }
    NodeStatus next = registry.isOnline(node_id) ? NodeStatus::Offline : NodeStatus::Online;
    return setNodeStatus(node_id, next);
}

std::vector<FileSummary> StorageCluster::listFiles() const {
    std::vector<FileSummary> summaries;
    for (const auto& manifest : catalog.list()) {
        FileSummary summary;
        summary.file_id = manifest.file_id;
        summary.original_name = manifest.original_name;
        summary.total_size = manifest.total_size;
        summary.total_chunks = manifest.total_chunks;
        summary.uploaded_at = manifest.uploaded_at;
        summary.file_digest = manifest.file_digest;
        summaries.push_back(std::move(summary));
    }
    return summaries;
}

FileManifest StorageCluster::getManifest(const std::string& file_id) const {
    return catalog.get(file_id);
}

DashboardSummary StorageCluster::getDashboardSummary() const {
    DashboardSummary summary;
    summary.nodes = registry.listNodes();

    for (const auto& node_id : registry.nodeIds()) {
        summary.per_node_chunk_counts[node_id] = 0;
    }

    auto manifests = catalog.list();
    summary.total_files = manifests.size();
    for (const auto& manifest : manifests) {
        summary.total_chunks += manifest.total_chunks;
        for (const auto& [index, chunk] : manifest.chunks) {
            summary.per_node_chunk_counts[chunk.node_id]++;
        }
    }

    summary.uptime_seconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - started_at).count();
    return summary;
}

std::vector<Event> StorageCluster::recentEvents(size_t limit) const {
    return events.recent(limit);
}
