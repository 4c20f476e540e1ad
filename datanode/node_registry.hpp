#pragma once

#include "fslite.pb.h"
#include <string>
#include <vector>
#include <unordered_map>
#include <memory>
#include <mutex>
#include <optional>
#include <chrono>
#include <cstdint>

enum class NodeStatus {
    Online,
    Offline
};

// "online" / "offline"
const char* nodeStatusName(NodeStatus status);
std::optional<NodeStatus> parseNodeStatus(const std::string& name);

struct NodeState {
    std::string id;
    NodeStatus status = NodeStatus::Offline;
    int64_t chunk_count = 0;   // cumulative placements, never decremented
    std::optional<std::chrono::system_clock::time_point> last_seen;
};

fslite::NodeStatusRecord toRecord(const NodeState& state);
NodeState fromRecord(const fslite::NodeStatusRecord& record);

// Liveness state for the fixed node population. The population is set at
// construction and never changes, so the slot table itself needs no lock;
// each slot carries its own mutex and every update is a single
// read-modify-write under that mutex.
class NodeRegistry {
private:
    struct NodeSlot {
        std::mutex mutex;
        NodeState state;
    };

    std::string nodes_root;
    std::vector<std::string> population;
    std::unordered_map<std::string, std::unique_ptr<NodeSlot>> slots;

    std::string getStatusPath(const std::string& node_id) const;
    NodeState loadOrInitialize(const std::string& node_id);
    void persist(const NodeState& state) const;
    NodeSlot& requireSlot(const std::string& node_id) const;

public:
    NodeRegistry(const std::string& nodes_root, const std::vector<std::string>& node_ids);

    // Never fails. An id outside the population yields a synthesized
    // Offline state with zero chunks and no lastSeen.
    NodeState getStatus(const std::string& node_id) const;

    // Throws FsError(UnknownNode) for ids outside the population. Updates
    // status and lastSeen; chunk_count is left alone. Idempotent.
    NodeState setStatus(const std::string& node_id, NodeStatus status);

    void incrementChunkCount(const std::string& node_id);

    bool isKnown(const std::string& node_id) const;
    bool isOnline(const std::string& node_id) const;

    const std::vector<std::string>& nodeIds() const { return population; }
    std::vector<NodeState> listNodes() const;
};
