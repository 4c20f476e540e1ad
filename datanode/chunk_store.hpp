#pragma once

#include <string>
#include <vector>
#include <cstdint>

// Per-node chunk payloads on local disk, one file per
// (node, file, chunk index):
//   <nodes_root>/<node_id>/<file_id>_chunk<index>.chunk
//
// The store does not look at node liveness. Whether a node may receive or
// serve a chunk is decided by the caller.
class ChunkStore {
private:
    std::string nodes_root;

    std::string getChunkPath(const std::string& node_id,
                             const std::string& file_id,
                             uint32_t chunk_index) const;

public:
    explicit ChunkStore(const std::string& nodes_root);

    // Overwrites any existing payload for the key. Throws
    // FsError(StorageFailure) when the write does not complete.
    void put(const std::string& node_id, const std::string& file_id,
             uint32_t chunk_index, const char* data, size_t size);
    void put(const std::string& node_id, const std::string& file_id,
             uint32_t chunk_index, const std::vector<char>& data);

    // Throws FsError(ChunkNotFound) when nothing is stored under the key and
    // FsError(ChunkReadFailure) when the payload exists but cannot be read.
    std::vector<char> get(const std::string& node_id, const std::string& file_id,
                          uint32_t chunk_index) const;

    bool has(const std::string& node_id, const std::string& file_id,
             uint32_t chunk_index) const;

    bool remove(const std::string& node_id, const std::string& file_id,
                uint32_t chunk_index);
};
