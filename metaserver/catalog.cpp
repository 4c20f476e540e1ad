#include "catalog.hpp"
#include "errors.hpp"
#include <fstream>
#include <iostream>
#include <filesystem>

namespace fs = std::filesystem;

Catalog::Catalog(const std::string& catalog_path) : catalog_path(catalog_path) {
    fs::path parent = fs::path(catalog_path).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent);
    }

    load();

    std::cout << "[INFO] Catalog loaded from " << catalog_path
              << " with " << files.size() << " files\n";
}

void Catalog::load() {
    std::lock_guard<std::mutex> lock(catalog_mutex);

    if (!fs::exists(catalog_path)) {
        return;
    }

    std::ifstream in(catalog_path, std::ios::binary);
    fslite::CatalogRecord record;
    if (!in.is_open() || !record.ParseFromIstream(&in)) {
        throw FsError(ErrorCode::StorageFailure, "Catalog file is unreadable: " + catalog_path);
    }

    for (const auto& entry : record.files()) {
        FileManifest manifest = fromRecord(entry);
        // Dropping it here would lose the record on the next persist
        try {
            manifest.validate();
        } catch (const FsError& e) {
            throw FsError(ErrorCode::StorageFailure,
                          "Catalog " + catalog_path + " holds an invalid manifest: " + e.describe())
                .withFile(manifest.file_id);
        }

        if (files.find(manifest.file_id) == files.end()) {
            insertion_order.push_back(manifest.file_id);
        }
        files[manifest.file_id] = std::move(manifest);
    }
}

void Catalog::persist(const std::vector<std::string>& order,
                      const std::unordered_map<std::string, FileManifest>& snapshot) const {
    fslite::CatalogRecord record;
    for (const auto& file_id : order) {
        *record.add_files() = toRecord(snapshot.at(file_id));
    }

    std::string tmp_path = catalog_path + ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open() || !record.SerializeToOstream(&out)) {
            throw FsError(ErrorCode::StorageFailure, "Failed to write catalog: " + tmp_path);
        }
        out.flush();
        if (!out.good()) {
            throw FsError(ErrorCode::StorageFailure, "Failed to flush catalog: " + tmp_path);
        }
    }

    std::error_code ec;
    fs::rename(tmp_path, catalog_path, ec);
    if (ec) {
        throw FsError(ErrorCode::StorageFailure, "Failed to replace catalog: " + ec.message());
    }
}

FileManifest Catalog::get(const std::string& file_id) const {
    std::lock_guard<std::mutex> lock(catalog_mutex);

    auto it = files.find(file_id);
    if (it == files.end()) {
        throw FsError(ErrorCode::FileNotFound, "File not found").withFile(file_id);
    }
    return it->second;
}

void Catalog::put(const std::string& file_id, const FileManifest& manifest) {
    if (manifest.file_id != file_id) {
        throw FsError(ErrorCode::InvalidManifest,
                      "Manifest is keyed under a different file id").withFile(file_id);
    }
    manifest.validate();

    std::lock_guard<std::mutex> lock(catalog_mutex);

    auto order = insertion_order;
    auto snapshot = files;
    if (snapshot.find(file_id) == snapshot.end()) {
        order.push_back(file_id);
    }
    snapshot[file_id] = manifest;

    persist(order, snapshot);

    insertion_order = std::move(order);
    files = std::move(snapshot);
}

bool Catalog::contains(const std::string& file_id) const {
    std::lock_guard<std::mutex> lock(catalog_mutex);
    return files.find(file_id) != files.end();
}

std::vector<FileManifest> Catalog::list() const {
    std::lock_guard<std::mutex> lock(catalog_mutex);

    std::vector<FileManifest> manifests;
    manifests.reserve(insertion_order.size());
    for (const auto& file_id : insertion_order) {
        manifests.push_back(files.at(file_id));
    }
    return manifests;
}

size_t Catalog::size() const {
    std::lock_guard<std::mutex> lock(catalog_mutex);
    return files.size();
}
