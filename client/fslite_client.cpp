#include "fslite_client.hpp"
#include <cstdio>
#include <fstream>
#include <iostream>
#include <iomanip>
#include <iterator>
#include <filesystem>
#include <grpcpp/grpcpp.h>

namespace {

void printNode(const fslite::NodeStatusRecord& node) {
    std::cout << "  " << std::left << std::setw(12) << node.node_id()
              << std::setw(9) << (node.online() ? "online" : "offline")
              << "chunks: " << node.chunk_count() << "\n";
}

} // namespace

FsLiteClient::FsLiteClient(std::shared_ptr<grpc::ChannelInterface> aChannel, int aMaxMessageBytes)
    : theStub{fslite::FsLiteService::NewStub(aChannel)}, maxMessageBytes(aMaxMessageBytes) {}

bool FsLiteClient::UploadFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        std::cerr << "[ERROR] Cannot open file: " << path << "\n";
        return false;
    }

    std::string data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    file.close();

    if (data.size() > static_cast<size_t>(maxMessageBytes)) {
        std::cerr << "[ERROR] File exceeds the " << maxMessageBytes / (1024 * 1024)
                  << " MB upload limit: " << path << "\n";
        return false;
    }

    fslite::SubmitFileRequest request;
    request.set_name(std::filesystem::path(path).filename().string());
    request.set_data(std::move(data));

    fslite::SubmitFileResponse response;
    grpc::ClientContext context;
    grpc::Status status = theStub->SubmitFile(&context, request, &response);

    if (!status.ok()) {
        std::cerr << "[ERROR] Upload failed: " << status.error_message() << "\n";
        return false;
    }

    std::cout << "[SUCCESS] Uploaded " << path << " as " << response.file_id()
              << " (" << response.total_chunks() << " chunks)\n";
    return true;
}

bool FsLiteClient::ReconstructFile(const std::string& fileId) {
    fslite::ReconstructionRequest request;
    request.set_file_id(fileId);

    fslite::ReconstructionReply response;
    grpc::ClientContext context;
    grpc::Status status = theStub->RequestReconstruction(&context, request, &response);

    if (!status.ok()) {
        std::cerr << "[ERROR] Reconstruction failed: " << status.error_message() << "\n";
        return false;
    }

    std::cout << "[INFO] Reconstruction " << response.status() << ": "
              << response.retrieved_chunks() << "/" << response.total_chunks() << " chunks\n";
    for (const auto& missing : response.missing()) {
        std::cout << "  chunk " << missing.chunk_index() << " on " << missing.node_id()
                  << ": " << missing.reason() << " (" << missing.detail() << ")\n";
    }

    if (response.status() == "success") {
        std::cout << "[SUCCESS] Ready for download: " << response.output_handle() << "\n";
        return true;
    }
    return false;
}

bool FsLiteClient::DownloadFile(const std::string& fileId, const std::string& outputPath) {
    fslite::DownloadRequest request;
    request.set_file_id(fileId);

    fslite::DownloadReply response;
    grpc::ClientContext context;
    grpc::Status status = theStub->DownloadFile(&context, request, &response);

    if (!status.ok()) {
        std::cerr << "[ERROR] Download failed: " << status.error_message() << "\n";
        return false;
    }

    std::ofstream outFile(outputPath, std::ios::binary | std::ios::trunc);
    if (!outFile.is_open()) {
        std::cerr << "[ERROR] Cannot create output file: " << outputPath << "\n";
        return false;
    }
    outFile.write(response.data().data(), response.data().size());
    outFile.close();

    if (!outFile) {
        std::cerr << "[ERROR] Failed to write output file: " << outputPath << "\n";
        std::remove(outputPath.c_str());
        return false;
    }

    std::cout << "[SUCCESS] Downloaded " << response.original_name() << " to " << outputPath
              << " (" << response.data().size() << " bytes)\n";
    return true;
}

bool FsLiteClient::ShowNodes() {
    fslite::Empty request;
    fslite::NodeList response;
    grpc::ClientContext context;
    grpc::Status status = theStub->ListNodes(&context, request, &response);

    if (!status.ok()) {
        std::cerr << "[ERROR] Failed to list nodes: " << status.error_message() << "\n";
        return false;
    }

    for (const auto& node : response.nodes()) {
        printNode(node);
    }
    return true;
}

bool FsLiteClient::SetNodeStatus(const std::string& nodeId, const std::string& status) {
    fslite::SetNodeStatusRequest request;
    request.set_node_id(nodeId);
    request.set_status(status);

    fslite::NodeStatusRecord response;
    grpc::ClientContext context;
    grpc::Status rpcStatus = theStub->SetNodeStatus(&context, request, &response);

    if (!rpcStatus.ok()) {
        std::cerr << "[ERROR] Failed to update node: " << rpcStatus.error_message() << "\n";
        return false;
    }

    std::cout << "[SUCCESS] Node " << response.node_id() << " is now "
              << (response.online() ? "online" : "offline") << "\n";
    return true;
}

bool FsLiteClient::ShowFiles() {
    fslite::Empty request;
    fslite::FileList response;
    grpc::ClientContext context;
    grpc::Status status = theStub->ListFiles(&context, request, &response);

    if (!status.ok()) {
        std::cerr << "[ERROR] Failed to list files: " << status.error_message() << "\n";
        return false;
    }

    if (response.files_size() == 0) {
        std::cout << "  (no files)\n";
    }
    for (const auto& file : response.files()) {
        std::cout << "  " << file.file_id() << "  " << file.original_name()
                  << "  " << file.total_size() << " bytes, " << file.total_chunks() << " chunks\n";
    }
    return true;
}

bool FsLiteClient::ShowDashboard() {
    fslite::Empty request;
    fslite::DashboardReply response;
    grpc::ClientContext context;
    grpc::Status status = theStub->GetDashboard(&context, request, &response);

    if (!status.ok()) {
        std::cerr << "[ERROR] Failed to fetch dashboard: " << status.error_message() << "\n";
        return false;
    }

    std::cout << "Files: " << response.total_files() << ", chunks: " << response.total_chunks()
              << ", uptime: " << std::fixed << std::setprecision(1)
              << response.uptime_seconds() << "s\n";
    for (const auto& node : response.nodes()) {
        printNode(node);
    }
    std::cout << "Chunk distribution:\n";
    for (const auto& entry : response.per_node_chunk_counts()) {
        std::cout << "  " << entry.first << ": " << entry.second << "\n";
    }
    return true;
}

bool FsLiteClient::ShowEvents(uint32_t limit) {
    fslite::EventsRequest request;
    request.set_limit(limit);

    fslite::EventList response;
    grpc::ClientContext context;
    grpc::Status status = theStub->GetEvents(&context, request, &response);

    if (!status.ok()) {
        std::cerr << "[ERROR] Failed to fetch events: " << status.error_message() << "\n";
        return false;
    }

    for (const auto& event : response.events()) {
        std::cout << "[" << event.timestamp() << "] [" << event.level() << "] "
                  << event.message() << "\n";
    }
    return true;
}
