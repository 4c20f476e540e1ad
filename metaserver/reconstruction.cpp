#include "reconstruction.hpp"
#include "catalog.hpp"
#include "node_registry.hpp"
#include "chunk_store.hpp"
#include "event_log.hpp"
#include "hasher.hpp"
#include "errors.hpp"
#include <fstream>
#include <filesystem>
#include <iterator>

namespace fs = std::filesystem;

const char* reconstructionStatusName(ReconstructionStatus status) {
    switch (status) {
        case ReconstructionStatus::Success: return "success";
        case ReconstructionStatus::Partial: return "partial";
        case ReconstructionStatus::Failed:  return "failed";
    }
    return "failed";
}

const char* missingReasonName(MissingReason reason) {
    switch (reason) {
        case MissingReason::NodeOffline:      return "NodeOffline";
        case MissingReason::ChunkReadFailure: return "ChunkReadFailure";
        case MissingReason::IntegrityFailure: return "IntegrityFailure";
    }
    return "ChunkReadFailure";
}

ReconstructionEngine::ReconstructionEngine(Catalog& catalog, NodeRegistry& registry,
                                           ChunkStore& store, EventLog& events,
                                           const std::string& output_dir)
    : catalog(catalog), registry(registry), store(store), events(events), output_dir(output_dir) {
    fs::create_directories(output_dir);
}

std::string ReconstructionEngine::outputPathFor(const std::string& file_id) const {
    return (fs::path(output_dir) / (file_id + ".bin")).string();
}

void ReconstructionEngine::writeOutput(const std::string& file_id, const std::vector<char>& bytes) const {
    std::string output_path = outputPathFor(file_id);
    std::string tmp_path = output_path + ".tmp";

    std::lock_guard<std::mutex> lock(output_mutex);
    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw FsError(ErrorCode::StorageFailure, "Failed to open reconstruction output")
                .withFile(file_id);
        }
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        out.flush();
        if (!out.good()) {
            throw FsError(ErrorCode::StorageFailure, "Failed to write reconstruction output")
                .withFile(file_id);
        }
    }

    std::error_code ec;
    fs::rename(tmp_path, output_path, ec);
    if (ec) {
        throw FsError(ErrorCode::StorageFailure,
                      "Failed to publish reconstruction output: " + ec.message()).withFile(file_id);
    }
}

ReconstructionResult ReconstructionEngine::reconstruct(const std::string& file_id) {
    FileManifest manifest;
    try {
        manifest = catalog.get(file_id);
    } catch (const FsError& e) {
        events.error("Reconstruction error: " + std::string(e.what()));
        throw;
    }

    events.info("Starting reconstruction: " + manifest.original_name);

    ReconstructionResult result;
    result.file_id = file_id;
    result.original_name = manifest.original_name;
    result.total_chunks = manifest.total_chunks;

    std::vector<std::vector<char>> retrieved(manifest.total_chunks);

    for (uint32_t i = 0; i < manifest.total_chunks; ++i) {
        const ChunkRecord& chunk = manifest.chunks.at(i);
        std::string index = std::to_string(i);

        if (!registry.isOnline(chunk.node_id)) {
            result.missing.push_back({i, chunk.node_id, MissingReason::NodeOffline, "Node offline"});
            events.warning("Chunk " + index + " unavailable (node " + chunk.node_id + " is offline)");
            continue;
        }

        std::vector<char> data;
        try {
            data = store.get(chunk.node_id, file_id, i);
        } catch (const FsError& e) {
            result.missing.push_back({i, chunk.node_id, MissingReason::ChunkReadFailure, e.what()});
            events.error("Failed to retrieve chunk " + index + " from " + chunk.node_id + ": " + e.what());
            continue;
        }

        if (Hasher::digest(data) != chunk.digest) {
            std::string detail = "Chunk " + index + " hash mismatch";
            result.missing.push_back({i, chunk.node_id, MissingReason::IntegrityFailure, detail});
            events.error("Failed to retrieve chunk " + index + " from " + chunk.node_id + ": " + detail);
            continue;
        }

        retrieved[i] = std::move(data);
        result.retrieved_chunks++;
        events.info("Retrieved chunk " + index + " from " + chunk.node_id);
    }

    if (result.retrieved_chunks == result.total_chunks) {
        result.status = ReconstructionStatus::Success;
    } else if (result.retrieved_chunks > 0) {
        result.status = ReconstructionStatus::Partial;
    } else {
        result.status = ReconstructionStatus::Failed;
    }

    if (result.status == ReconstructionStatus::Partial) {
        events.warning("Partial reconstruction (" + std::to_string(result.retrieved_chunks) + "/" +
                       std::to_string(result.total_chunks) + " chunks available): " +
                       manifest.original_name);
        return result;
    }
    if (result.status == ReconstructionStatus::Failed) {
        events.error("Reconstruction failed - no chunks available: " + manifest.original_name);
        return result;
    }

    std::vector<char> bytes;
    bytes.reserve(static_cast<size_t>(manifest.total_size));
    for (const auto& data : retrieved) {
        bytes.insert(bytes.end(), data.begin(), data.end());
    }

    // Unreachable while per-chunk verification holds; kept as an invariant check.
    if (Hasher::digest(bytes) != manifest.file_digest) {
        events.error("Reconstruction error: file hash mismatch - data corrupted (" + file_id + ")");
        throw FsError(ErrorCode::FileIntegrityFailure, "File hash mismatch - data corrupted")
            .withFile(file_id);
    }

    try {
        writeOutput(file_id, bytes);
    } catch (const FsError& e) {
        events.error("Reconstruction error: " + std::string(e.what()));
        throw;
    }

    result.output_path = outputPathFor(file_id);
    events.info("Reconstruction successful: " + manifest.original_name);
    return result;
}

std::vector<char> ReconstructionEngine::readOutput(const std::string& file_id) const {
    // Throws FileNotFound for unknown ids
    catalog.get(file_id);

    std::string output_path = outputPathFor(file_id);
    std::ifstream in(output_path, std::ios::binary);
    if (!in.is_open()) {
        throw FsError(ErrorCode::NotReconstructed, "File not reconstructed yet").withFile(file_id);
    }

    return std::vector<char>((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}
