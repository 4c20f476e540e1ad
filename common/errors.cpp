#include "errors.hpp"
#include <sstream>

const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::UnknownNode:          return "UnknownNode";
        case ErrorCode::NodeUnavailable:      return "NodeUnavailable";
        case ErrorCode::NoOnlineNodes:        return "NoOnlineNodes";
        case ErrorCode::FileNotFound:         return "FileNotFound";
        case ErrorCode::ChunkNotFound:        return "ChunkNotFound";
        case ErrorCode::ChunkReadFailure:     return "ChunkReadFailure";
        case ErrorCode::IntegrityFailure:     return "IntegrityFailure";
        case ErrorCode::FileIntegrityFailure: return "FileIntegrityFailure";
        case ErrorCode::NotReconstructed:     return "NotReconstructed";
        case ErrorCode::InvalidManifest:      return "InvalidManifest";
        case ErrorCode::StorageFailure:       return "StorageFailure";
    }
    return "Unknown";
}

FsError::FsError(ErrorCode code, const std::string& message)
    : std::runtime_error(message), code_(code) {
}

FsError& FsError::withFile(const std::string& file_id) {
    file_id_ = file_id;
    return *this;
}

FsError& FsError::withChunk(uint32_t chunk_index) {
    chunk_index_ = chunk_index;
    return *this;
}

FsError& FsError::withNode(const std::string& node_id) {
    node_id_ = node_id;
    return *this;
}

std::string FsError::describe() const {
    std::stringstream ss;
    ss << errorCodeName(code_) << ": " << what();

    bool any = file_id_ || chunk_index_ || node_id_;
    if (any) {
        ss << " (";
        const char* sep = "";
        if (file_id_) {
            ss << sep << "file=" << *file_id_;
            sep = ", ";
        }
        if (chunk_index_) {
            ss << sep << "chunk=" << *chunk_index_;
            sep = ", ";
        }
        if (node_id_) {
            ss << sep << "node=" << *node_id_;
        }
        ss << ")";
    }
    return ss.str();
}
