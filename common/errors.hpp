#pragma once

#include <stdexcept>
#include <string>
#include <optional>
#include <cstdint>

enum class ErrorCode {
    UnknownNode,
    NodeUnavailable,
    NoOnlineNodes,
    FileNotFound,
    ChunkNotFound,
    ChunkReadFailure,
    IntegrityFailure,
    FileIntegrityFailure,
    NotReconstructed,
    InvalidManifest,
    StorageFailure
};

const char* errorCodeName(ErrorCode code);

// Error raised by the storage core. The optional context fields are filled
// in whenever the failing operation knows them, so callers can render a
// message without digging into internal state.
class FsError : public std::runtime_error {
public:
    FsError(ErrorCode code, const std::string& message);

    FsError& withFile(const std::string& file_id);
    FsError& withChunk(uint32_t chunk_index);
    FsError& withNode(const std::string& node_id);

    ErrorCode code() const { return code_; }
    const std::optional<std::string>& fileId() const { return file_id_; }
    const std::optional<uint32_t>& chunkIndex() const { return chunk_index_; }
    const std::optional<std::string>& nodeId() const { return node_id_; }

    // "<CodeName>: <message> (file=..., chunk=..., node=...)"
    std::string describe() const;

private:
    ErrorCode code_;
    std::optional<std::string> file_id_;
    std::optional<uint32_t> chunk_index_;
    std::optional<std::string> node_id_;
};
