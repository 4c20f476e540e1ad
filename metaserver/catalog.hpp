#pragma once

#include "manifest.hpp"
#include <string>
#include <vector>
#include <unordered_map>
#include <mutex>

// Durable fileId -> FileManifest mapping. The whole record set is rewritten
// (temp file + rename) on each mutation while the catalog mutex is held, so
// readers only ever see a manifest that is absent or complete.
class Catalog {
private:
    std::string catalog_path;
    mutable std::mutex catalog_mutex;

    std::vector<std::string> insertion_order;
    std::unordered_map<std::string, FileManifest> files;  // file_id -> manifest

    void load();
    void persist(const std::vector<std::string>& order,
                 const std::unordered_map<std::string, FileManifest>& snapshot) const;

public:
    explicit Catalog(const std::string& catalog_path);

    // Throws FsError(FileNotFound).
    FileManifest get(const std::string& file_id) const;

    // Insert or replace. The manifest is validated first; throws
    // FsError(InvalidManifest) or FsError(StorageFailure), in which case the
    // catalog is unchanged.
    void put(const std::string& file_id, const FileManifest& manifest);

    bool contains(const std::string& file_id) const;

    // Insertion order.
    std::vector<FileManifest> list() const;

    size_t size() const;
};
