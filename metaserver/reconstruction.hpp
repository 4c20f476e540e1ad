#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <mutex>

class Catalog;
class NodeRegistry;
class ChunkStore;
class EventLog;

enum class ReconstructionStatus {
    Success,
    Partial,
    Failed
};

enum class MissingReason {
    NodeOffline,
    ChunkReadFailure,
    IntegrityFailure
};

// "success" / "partial" / "failed"
const char* reconstructionStatusName(ReconstructionStatus status);
const char* missingReasonName(MissingReason reason);

struct MissingChunk {
    uint32_t chunk_index = 0;
    std::string node_id;
    MissingReason reason = MissingReason::NodeOffline;
    std::string detail;
};

struct ReconstructionResult {
    ReconstructionStatus status = ReconstructionStatus::Failed;
    std::string file_id;
    std::string original_name;
    uint32_t retrieved_chunks = 0;
    uint32_t total_chunks = 0;
    std::vector<MissingChunk> missing;   // index order
    std::string output_path;             // set on Success only
};

class ReconstructionEngine {
private:
    Catalog& catalog;
    NodeRegistry& registry;
    ChunkStore& store;
    EventLog& events;
    std::string output_dir;
    // Held across write + publish; every reconstruction of a file uses the
    // same temp path.
    mutable std::mutex output_mutex;

    void writeOutput(const std::string& file_id, const std::vector<char>& bytes) const;

public:
    ReconstructionEngine(Catalog& catalog, NodeRegistry& registry, ChunkStore& store,
                         EventLog& events, const std::string& output_dir);

    // Reads every chunk of the file from its owning node, skipping offline
    // nodes and rejecting payloads whose digest does not match the manifest.
    // Per-chunk problems never abort the call; they show up in
    // ReconstructionResult::missing and degrade the status.
    //
    // Throws FsError(FileNotFound) for an unknown file and
    // FsError(FileIntegrityFailure) if the reassembled bytes do not match the
    // whole-file digest even though every chunk verified.
    ReconstructionResult reconstruct(const std::string& file_id);

    std::string outputPathFor(const std::string& file_id) const;

    // Bytes of the last successful reconstruction. Throws
    // FsError(FileNotFound) or FsError(NotReconstructed).
    std::vector<char> readOutput(const std::string& file_id) const;
};
