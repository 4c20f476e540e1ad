#pragma once

#include "manifest.hpp"
#include <string>
#include <vector>
#include <mutex>
#include <cstddef>

class NodeRegistry;
class ChunkStore;
class EventLog;

// Round-robin position over the node population. Shared by every placement
// call for the lifetime of the engine, so consecutive uploads continue the
// rotation instead of restarting it.
struct RotationCursor {
    std::mutex mutex;
    size_t next = 0;
};

class PlacementEngine {
private:
    NodeRegistry& registry;
    ChunkStore& store;
    EventLog& events;
    size_t chunk_size;
    RotationCursor cursor;

    // Scans at most |nodes| candidates from the cursor and returns the first
    // online one, leaving the cursor just past it. Throws
    // FsError(NoOnlineNodes) when every candidate is offline.
    std::string selectNodeForChunk(const std::string& file_id, uint32_t chunk_index);

    void rollback(const std::string& file_id, const std::vector<ChunkRecord>& written);

public:
    PlacementEngine(NodeRegistry& registry, ChunkStore& store, EventLog& events, size_t chunk_size);

    // Splits bytes into chunks of at most chunk_size, assigns each to an
    // online node, writes the payloads and returns the complete manifest.
    // All-or-nothing: on failure every payload written by this call is
    // removed and the error is rethrown. Node chunk counts are incremented
    // only after every payload has been written.
    // Throws FsError(NoOnlineNodes) when no node can take a chunk and
    // FsError(NodeUnavailable) when the selected node goes offline before
    // its payload is written. Catalog insertion is left to the caller.
    FileManifest place(const std::string& file_id, const std::string& original_name,
                       const std::vector<char>& bytes);

    // Removes the payloads of a placed manifest that could not be committed
    // to the catalog. Node chunk counts are cumulative and stay as they are.
    void discard(const FileManifest& manifest);

    size_t getChunkSize() const { return chunk_size; }
    size_t cursorPosition();
};

// ceil(size / chunk_size)
uint32_t chunkCountFor(size_t size, size_t chunk_size);
