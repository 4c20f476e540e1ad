#include "placement.hpp"
#include "node_registry.hpp"
#include "chunk_store.hpp"
#include "event_log.hpp"
#include "hasher.hpp"
#include "errors.hpp"
#include <algorithm>
#include <sstream>
#include <iomanip>
#include <stdexcept>

uint32_t chunkCountFor(size_t size, size_t chunk_size) {
    return static_cast<uint32_t>((size + chunk_size - 1) / chunk_size);
}

PlacementEngine::PlacementEngine(NodeRegistry& registry, ChunkStore& store,
                                 EventLog& events, size_t chunk_size)
    : registry(registry), store(store), events(events), chunk_size(chunk_size) {
    if (chunk_size == 0) {
        throw std::invalid_argument("chunk size must be positive");
    }
}

size_t PlacementEngine::cursorPosition() {
    std::lock_guard<std::mutex> lock(cursor.mutex);
    return cursor.next;
}

std::string PlacementEngine::selectNodeForChunk(const std::string& file_id, uint32_t chunk_index) {
    const auto& nodes = registry.nodeIds();

    std::lock_guard<std::mutex> lock(cursor.mutex);
    for (size_t attempt = 0; attempt < nodes.size(); ++attempt) {
        const std::string& candidate = nodes[cursor.next % nodes.size()];
        cursor.next = (cursor.next + 1) % nodes.size();

        if (registry.isOnline(candidate)) {
            return candidate;
        }
    }

    throw FsError(ErrorCode::NoOnlineNodes, "No online nodes available")
        .withFile(file_id).withChunk(chunk_index);
}

void PlacementEngine::rollback(const std::string& file_id, const std::vector<ChunkRecord>& written) {
    for (const auto& chunk : written) {
        store.remove(chunk.node_id, file_id, chunk.chunk_index);
    }
}

void PlacementEngine::discard(const FileManifest& manifest) {
    for (const auto& [index, chunk] : manifest.chunks) {
        store.remove(chunk.node_id, manifest.file_id, index);
    }
}

FileManifest PlacementEngine::place(const std::string& file_id, const std::string& original_name,
                                    const std::vector<char>& bytes) {
    FileManifest manifest;
    manifest.file_id = file_id;
    manifest.original_name = original_name;
    manifest.total_size = static_cast<int64_t>(bytes.size());
    manifest.total_chunks = chunkCountFor(bytes.size(), chunk_size);
    manifest.file_digest = Hasher::digest(bytes);
    manifest.uploaded_at = std::chrono::system_clock::now();

    std::stringstream start;
    start << "Starting upload: " << original_name << " ("
          << std::fixed << std::setprecision(2) << bytes.size() / 1024.0 << " KB)";
    events.info(start.str());
    events.info("Splitting into " + std::to_string(manifest.total_chunks) + " chunks");

    std::vector<ChunkRecord> written;
    written.reserve(manifest.total_chunks);

    try {
        for (uint32_t i = 0; i < manifest.total_chunks; ++i) {
            size_t offset = static_cast<size_t>(i) * chunk_size;
            size_t length = std::min(chunk_size, bytes.size() - offset);
            const char* data = bytes.data() + offset;

            std::string node_id = selectNodeForChunk(file_id, i);

            ChunkRecord chunk;
            chunk.file_id = file_id;
            chunk.chunk_index = i;
            chunk.node_id = node_id;
            chunk.digest = Hasher::digest(data, length);
            chunk.byte_length = static_cast<int64_t>(length);

            // The node may have been taken offline since it was selected
            if (!registry.isOnline(node_id)) {
                throw FsError(ErrorCode::NodeUnavailable, "Node went offline before write")
                    .withFile(file_id).withChunk(i).withNode(node_id);
            }
            store.put(node_id, file_id, i, data, length);
            written.push_back(chunk);
            manifest.chunks[i] = chunk;

            events.info("Chunk " + std::to_string(i) + " stored on " + node_id +
                        " (" + std::to_string(length) + " bytes)");
        }

        // Counts only move once the whole file has landed
        for (const auto& chunk : written) {
            registry.incrementChunkCount(chunk.node_id);
        }
    } catch (const FsError& e) {
        rollback(file_id, written);
        events.error("Upload error: " + std::string(e.what()));
        throw;
    }

    return manifest;
}
