#include "chunk_store.hpp"
#include "errors.hpp"
#include <fstream>
#include <iostream>
#include <filesystem>

namespace fs = std::filesystem;

ChunkStore::ChunkStore(const std::string& nodes_root) : nodes_root(nodes_root) {
    fs::create_directories(nodes_root);
}

std::string ChunkStore::getChunkPath(const std::string& node_id,
                                     const std::string& file_id,
                                     uint32_t chunk_index) const {
    std::string name = file_id + "_chunk" + std::to_string(chunk_index) + ".chunk";
    return (fs::path(nodes_root) / node_id / name).string();
}

void ChunkStore::put(const std::string& node_id, const std::string& file_id,
                     uint32_t chunk_index, const char* data, size_t size) {
    std::string chunk_path = getChunkPath(node_id, file_id, chunk_index);

    std::error_code ec;
    fs::create_directories(fs::path(chunk_path).parent_path(), ec);
    if (ec) {
        throw FsError(ErrorCode::StorageFailure,
                      "Failed to create node directory: " + ec.message())
            .withFile(file_id).withChunk(chunk_index).withNode(node_id);
    }

    std::ofstream file(chunk_path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        std::cerr << "[ERROR] Failed to open file for writing: " << chunk_path << "\n";
        throw FsError(ErrorCode::StorageFailure, "Failed to open chunk file for writing")
            .withFile(file_id).withChunk(chunk_index).withNode(node_id);
    }

    file.write(data, static_cast<std::streamsize>(size));
    file.flush();

    if (!file.good()) {
        std::cerr << "[ERROR] Failed to write chunk " << chunk_path << "\n";
        file.close();
        fs::remove(chunk_path, ec);
        throw FsError(ErrorCode::StorageFailure, "Failed to write chunk payload")
            .withFile(file_id).withChunk(chunk_index).withNode(node_id);
    }
}

void ChunkStore::put(const std::string& node_id, const std::string& file_id,
                     uint32_t chunk_index, const std::vector<char>& data) {
    put(node_id, file_id, chunk_index, data.data(), data.size());
}

std::vector<char> ChunkStore::get(const std::string& node_id, const std::string& file_id,
                                  uint32_t chunk_index) const {
    std::string chunk_path = getChunkPath(node_id, file_id, chunk_index);

    std::error_code ec;
    if (!fs::is_regular_file(chunk_path, ec)) {
        throw FsError(ErrorCode::ChunkNotFound, "Chunk not found")
            .withFile(file_id).withChunk(chunk_index).withNode(node_id);
    }

    std::ifstream file(chunk_path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        throw FsError(ErrorCode::ChunkReadFailure, "Failed to open chunk file")
            .withFile(file_id).withChunk(chunk_index).withNode(node_id);
    }

    std::streamsize size = file.tellg();
    if (size < 0) {
        throw FsError(ErrorCode::ChunkReadFailure, "Failed to determine chunk size")
            .withFile(file_id).withChunk(chunk_index).withNode(node_id);
    }
    file.seekg(0, std::ios::beg);

    std::vector<char> data(static_cast<size_t>(size));
    file.read(data.data(), size);
    if (file.gcount() != size) {
        throw FsError(ErrorCode::ChunkReadFailure, "Short read on chunk file")
            .withFile(file_id).withChunk(chunk_index).withNode(node_id);
    }

    return data;
}

bool ChunkStore::has(const std::string& node_id, const std::string& file_id,
                     uint32_t chunk_index) const {
    std::error_code ec;
    return fs::is_regular_file(getChunkPath(node_id, file_id, chunk_index), ec);
}

bool ChunkStore::remove(const std::string& node_id, const std::string& file_id,
                        uint32_t chunk_index) {
    std::error_code ec;
    bool removed = fs::remove(getChunkPath(node_id, file_id, chunk_index), ec);
    if (ec) {
        std::cerr << "[WARNING] Failed to remove chunk " << chunk_index << " of " << file_id
                  << " on " << node_id << ": " << ec.message() << "\n";
        return false;
    }
    return removed;
}
