#pragma once

#include "fslite.pb.h"
#include <string>
#include <map>
#include <chrono>
#include <cstdint>

struct ChunkRecord {
    std::string file_id;
    uint32_t chunk_index = 0;
    std::string node_id;
    std::string digest;
    int64_t byte_length = 0;
};

struct FileManifest {
    std::string file_id;
    std::string original_name;
    int64_t total_size = 0;
    uint32_t total_chunks = 0;
    std::string file_digest;
    std::chrono::system_clock::time_point uploaded_at;
    std::map<uint32_t, ChunkRecord> chunks;  // chunk_index -> record

    // Throws FsError(InvalidManifest) unless chunks holds exactly
    // total_chunks records indexed [0, total_chunks), all belonging to this
    // file, with byte lengths summing to total_size.
    void validate() const;
};

fslite::ManifestRecord toRecord(const FileManifest& manifest);
FileManifest fromRecord(const fslite::ManifestRecord& record);
