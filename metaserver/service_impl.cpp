#include "service_impl.hpp"
#include "storage_cluster.hpp"
#include "clock.hpp"

using ::grpc::Status;
using ::grpc::StatusCode;
using ::grpc::ServerContext;

grpc::Status toGrpcStatus(const FsError& error) {
    StatusCode code = StatusCode::INTERNAL;
    switch (error.code()) {
        case ErrorCode::UnknownNode:
        case ErrorCode::FileNotFound:
        case ErrorCode::ChunkNotFound:
            code = StatusCode::NOT_FOUND;
            break;
        case ErrorCode::NoOnlineNodes:
            code = StatusCode::RESOURCE_EXHAUSTED;
            break;
        case ErrorCode::NodeUnavailable:
            code = StatusCode::UNAVAILABLE;
            break;
        case ErrorCode::NotReconstructed:
            code = StatusCode::FAILED_PRECONDITION;
            break;
        case ErrorCode::IntegrityFailure:
        case ErrorCode::FileIntegrityFailure:
            code = StatusCode::DATA_LOSS;
            break;
        case ErrorCode::ChunkReadFailure:
        case ErrorCode::InvalidManifest:
        case ErrorCode::StorageFailure:
            code = StatusCode::INTERNAL;
            break;
    }
    return Status(code, error.describe());
}

Status FsLiteServiceImpl::SubmitFile(ServerContext* context, const fslite::SubmitFileRequest* request,
                                     fslite::SubmitFileResponse* response) {
    if (request->name().empty()) {
        return Status(StatusCode::INVALID_ARGUMENT, "File name is required");
    }

    std::vector<char> data(request->data().begin(), request->data().end());
    try {
        SubmitResult result = theCluster->submitFile(request->name(), data);
        response->set_file_id(result.file_id);
        response->set_total_chunks(result.total_chunks);
    } catch (const FsError& e) {
        return toGrpcStatus(e);
    }
    return Status::OK;
}

Status FsLiteServiceImpl::RequestReconstruction(ServerContext* context,
                                                const fslite::ReconstructionRequest* request,
                                                fslite::ReconstructionReply* response) {
    try {
        ReconstructionResult result = theCluster->requestReconstruction(request->file_id());

        response->set_status(reconstructionStatusName(result.status));
        response->set_file_id(result.file_id);
        response->set_original_name(result.original_name);
        response->set_retrieved_chunks(result.retrieved_chunks);
        response->set_total_chunks(result.total_chunks);
        for (const auto& missing : result.missing) {
            auto* info = response->add_missing();
            info->set_chunk_index(missing.chunk_index);
            info->set_node_id(missing.node_id);
            info->set_reason(missingReasonName(missing.reason));
            info->set_detail(missing.detail);
        }
        if (result.status == ReconstructionStatus::Success) {
            // Handle the client passes back to DownloadFile
            response->set_output_handle(result.file_id);
        }
    } catch (const FsError& e) {
        return toGrpcStatus(e);
    }
    return Status::OK;
}

Status FsLiteServiceImpl::DownloadFile(ServerContext* context, const fslite::DownloadRequest* request,
                                       fslite::DownloadReply* response) {
    try {
        std::string original_name;
        std::vector<char> data = theCluster->downloadFile(request->file_id(), &original_name);
        response->set_original_name(original_name);
        response->set_data(data.data(), data.size());
    } catch (const FsError& e) {
        return toGrpcStatus(e);
    }
    return Status::OK;
}

Status FsLiteServiceImpl::ListNodes(ServerContext* context, const fslite::Empty* request,
                                    fslite::NodeList* response) {
    for (const auto& node : theCluster->listNodes()) {
        *response->add_nodes() = toRecord(node);
    }
    return Status::OK;
}

Status FsLiteServiceImpl::SetNodeStatus(ServerContext* context, const fslite::SetNodeStatusRequest* request,
                                        fslite::NodeStatusRecord* response) {
    try {
        NodeState state;
        if (request->status().empty()) {
            state = theCluster->toggleNodeStatus(request->node_id());
        } else {
            auto status = parseNodeStatus(request->status());
            if (!status) {
                return Status(StatusCode::INVALID_ARGUMENT,
                              "Status must be 'online' or 'offline', got '" + request->status() + "'");
            }
            state = theCluster->setNodeStatus(request->node_id(), *status);
        }
        *response = toRecord(state);
    } catch (const FsError& e) {
        return toGrpcStatus(e);
    }
    return Status::OK;
}

Status FsLiteServiceImpl::ListFiles(ServerContext* context, const fslite::Empty* request,
                                    fslite::FileList* response) {
    for (const auto& file : theCluster->listFiles()) {
        auto* info = response->add_files();
        info->set_file_id(file.file_id);
        info->set_original_name(file.original_name);
        info->set_total_size(file.total_size);
        info->set_total_chunks(file.total_chunks);
        info->set_uploaded_at_ms(toEpochMillis(file.uploaded_at));
        info->set_file_digest(file.file_digest);
    }
    return Status::OK;
}

Status FsLiteServiceImpl::GetDashboard(ServerContext* context, const fslite::Empty* request,
                                       fslite::DashboardReply* response) {
    DashboardSummary summary = theCluster->getDashboardSummary();

    for (const auto& node : summary.nodes) {
        *response->add_nodes() = toRecord(node);
    }
    response->set_total_files(summary.total_files);
    response->set_total_chunks(summary.total_chunks);
    for (const auto& [node_id, count] : summary.per_node_chunk_counts) {
        (*response->mutable_per_node_chunk_counts())[node_id] = count;
    }
    response->set_uptime_seconds(summary.uptime_seconds);
    return Status::OK;
}

Status FsLiteServiceImpl::GetEvents(ServerContext* context, const fslite::EventsRequest* request,
                                    fslite::EventList* response) {
    for (const auto& event : theCluster->recentEvents(request->limit())) {
        auto* info = response->add_events();
        info->set_timestamp(event.timestamp);
        info->set_level(eventLevelName(event.level));
        info->set_message(event.message);
    }
    return Status::OK;
}
