#include "node_registry.hpp"
#include "errors.hpp"
#include "clock.hpp"
#include <fstream>
#include <iostream>
#include <filesystem>

namespace fs = std::filesystem;

const char* nodeStatusName(NodeStatus status) {
    return status == NodeStatus::Online ? "online" : "offline";
}

std::optional<NodeStatus> parseNodeStatus(const std::string& name) {
    if (name == "online") {
        return NodeStatus::Online;
    }
    if (name == "offline") {
        return NodeStatus::Offline;
    }
    return std::nullopt;
}

fslite::NodeStatusRecord toRecord(const NodeState& state) {
    fslite::NodeStatusRecord record;
    record.set_node_id(state.id);
    record.set_online(state.status == NodeStatus::Online);
    record.set_chunk_count(state.chunk_count);
    record.set_last_seen_ms(state.last_seen ? toEpochMillis(*state.last_seen) : 0);
    return record;
}

NodeState fromRecord(const fslite::NodeStatusRecord& record) {
    NodeState state;
    state.id = record.node_id();
    state.status = record.online() ? NodeStatus::Online : NodeStatus::Offline;
    state.chunk_count = record.chunk_count();
    if (record.last_seen_ms() != 0) {
        state.last_seen = fromEpochMillis(record.last_seen_ms());
    }
    return state;
}

NodeRegistry::NodeRegistry(const std::string& nodes_root, const std::vector<std::string>& node_ids)
    : nodes_root(nodes_root), population(node_ids) {

    fs::create_directories(nodes_root);

    for (const auto& node_id : population) {
        auto slot = std::make_unique<NodeSlot>();
        slot->state = loadOrInitialize(node_id);
        slots.emplace(node_id, std::move(slot));
    }

    std::cout << "[INFO] Node registry initialized with " << population.size()
              << " nodes at " << nodes_root << "\n";
}

std::string NodeRegistry::getStatusPath(const std::string& node_id) const {
    return (fs::path(nodes_root) / node_id / "status.pb").string();
}

NodeState NodeRegistry::loadOrInitialize(const std::string& node_id) {
    fs::create_directories(fs::path(nodes_root) / node_id);
    std::string status_path = getStatusPath(node_id);

    if (!fs::exists(status_path)) {
        // First start: every node begins online
        NodeState state;
        state.id = node_id;
        state.status = NodeStatus::Online;
        state.last_seen = std::chrono::system_clock::now();
        persist(state);
        return state;
    }

    std::ifstream in(status_path, std::ios::binary);
    fslite::NodeStatusRecord record;
    if (!in.is_open() || !record.ParseFromIstream(&in) || record.node_id() != node_id) {
        std::cerr << "[WARNING] Unreadable status record for node " << node_id
                  << ", treating it as offline\n";
        NodeState state;
        state.id = node_id;
        return state;
    }

    return fromRecord(record);
}

void NodeRegistry::persist(const NodeState& state) const {
    std::string status_path = getStatusPath(state.id);
    std::string tmp_path = status_path + ".tmp";

    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open() || !toRecord(state).SerializeToOstream(&out)) {
            throw FsError(ErrorCode::StorageFailure,
                          "Failed to write status record").withNode(state.id);
        }
        out.flush();
        if (!out.good()) {
            throw FsError(ErrorCode::StorageFailure,
                          "Failed to flush status record").withNode(state.id);
        }
    }

    std::error_code ec;
    fs::rename(tmp_path, status_path, ec);
    if (ec) {
        throw FsError(ErrorCode::StorageFailure,
                      "Failed to replace status record: " + ec.message()).withNode(state.id);
    }
}

NodeRegistry::NodeSlot& NodeRegistry::requireSlot(const std::string& node_id) const {
    auto it = slots.find(node_id);
    if (it == slots.end()) {
        throw FsError(ErrorCode::UnknownNode, "Invalid node ID: " + node_id).withNode(node_id);
    }
    return *it->second;
}

NodeState NodeRegistry::getStatus(const std::string& node_id) const {
    auto it = slots.find(node_id);
    if (it == slots.end()) {
        NodeState absent;
        absent.id = node_id;
        return absent;
    }

    std::lock_guard<std::mutex> lock(it->second->mutex);
    return it->second->state;
}

NodeState NodeRegistry::setStatus(const std::string& node_id, NodeStatus status) {
    NodeSlot& slot = requireSlot(node_id);

    std::lock_guard<std::mutex> lock(slot.mutex);
    NodeState updated = slot.state;
    updated.status = status;
    updated.last_seen = std::chrono::system_clock::now();

    persist(updated);
    slot.state = updated;
    return updated;
}

void NodeRegistry::incrementChunkCount(const std::string& node_id) {
    NodeSlot& slot = requireSlot(node_id);

    std::lock_guard<std::mutex> lock(slot.mutex);
    NodeState updated = slot.state;
    updated.chunk_count++;

    persist(updated);
    slot.state = updated;
}

bool NodeRegistry::isKnown(const std::string& node_id) const {
    return slots.find(node_id) != slots.end();
}

bool NodeRegistry::isOnline(const std::string& node_id) const {
    return getStatus(node_id).status == NodeStatus::Online;
}

std::vector<NodeState> NodeRegistry::listNodes() const {
    std::vector<NodeState> nodes;
    nodes.reserve(population.size());
    for (const auto& node_id : population) {
        nodes.push_back(getStatus(node_id));
    }
    return nodes;
}
