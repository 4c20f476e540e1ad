#include "manifest.hpp"
#include "errors.hpp"
#include "clock.hpp"

void FileManifest::validate() const {
    if (chunks.size() != total_chunks) {
        throw FsError(ErrorCode::InvalidManifest,
                      "Manifest lists " + std::to_string(chunks.size()) + " chunks, expected " +
                      std::to_string(total_chunks)).withFile(file_id);
    }

    int64_t sum = 0;
    uint32_t expected_index = 0;
    for (const auto& [index, chunk] : chunks) {
        // std::map is ordered, so a gap shows up as index != expected_index
        if (index != expected_index || chunk.chunk_index != index) {
            throw FsError(ErrorCode::InvalidManifest, "Chunk indices are not contiguous")
                .withFile(file_id).withChunk(expected_index);
        }
        if (chunk.file_id != file_id) {
            throw FsError(ErrorCode::InvalidManifest, "Chunk belongs to another file")
                .withFile(file_id).withChunk(index);
        }
        if (chunk.byte_length < 0) {
            throw FsError(ErrorCode::InvalidManifest, "Negative chunk length")
                .withFile(file_id).withChunk(index);
        }
        sum += chunk.byte_length;
        expected_index++;
    }

    if (sum != total_size) {
        throw FsError(ErrorCode::InvalidManifest,
                      "Chunk lengths sum to " + std::to_string(sum) + ", expected " +
                      std::to_string(total_size)).withFile(file_id);
    }
}

fslite::ManifestRecord toRecord(const FileManifest& manifest) {
    fslite::ManifestRecord record;
    record.set_file_id(manifest.file_id);
    record.set_original_name(manifest.original_name);
    record.set_total_size(manifest.total_size);
    record.set_total_chunks(manifest.total_chunks);
    record.set_file_digest(manifest.file_digest);
    record.set_uploaded_at_ms(toEpochMillis(manifest.uploaded_at));

    for (const auto& [index, chunk] : manifest.chunks) {
        auto* entry = record.add_chunks();
        entry->set_file_id(chunk.file_id);
        entry->set_chunk_index(index);
        entry->set_node_id(chunk.node_id);
        entry->set_digest(chunk.digest);
        entry->set_byte_length(chunk.byte_length);
    }
    return record;
}

FileManifest fromRecord(const fslite::ManifestRecord& record) {
    FileManifest manifest;
    manifest.file_id = record.file_id();
    manifest.original_name = record.original_name();
    manifest.total_size = record.total_size();
    manifest.total_chunks = record.total_chunks();
    manifest.file_digest = record.file_digest();
    manifest.uploaded_at = fromEpochMillis(record.uploaded_at_ms());

    for (const auto& entry : record.chunks()) {
        ChunkRecord chunk;
        chunk.file_id = entry.file_id();
        chunk.chunk_index = entry.chunk_index();
        chunk.node_id = entry.node_id();
        chunk.digest = entry.digest();
        chunk.byte_length = entry.byte_length();
        manifest.chunks[chunk.chunk_index] = chunk;
    }
    return manifest;
}
