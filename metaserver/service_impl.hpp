#pragma once

#include "fslite_service.grpc.pb.h"
#include "errors.hpp"
#include <grpcpp/grpcpp.h>

class StorageCluster;

grpc::Status toGrpcStatus(const FsError& error);

class FsLiteServiceImpl final : public fslite::FsLiteService::Service {
private:
    StorageCluster* theCluster;

public:
    explicit FsLiteServiceImpl(StorageCluster* aCluster) : theCluster(aCluster) {}

    grpc::Status SubmitFile(grpc::ServerContext* context, const fslite::SubmitFileRequest* request,
                            fslite::SubmitFileResponse* response) override;

    grpc::Status RequestReconstruction(grpc::ServerContext* context,
                                       const fslite::ReconstructionRequest* request,
                                       fslite::ReconstructionReply* response) override;

    grpc::Status DownloadFile(grpc::ServerContext* context, const fslite::DownloadRequest* request,
                              fslite::DownloadReply* response) override;

    grpc::Status ListNodes(grpc::ServerContext* context, const fslite::Empty* request,
                           fslite::NodeList* response) override;

    grpc::Status SetNodeStatus(grpc::ServerContext* context, const fslite::SetNodeStatusRequest* request,
                               fslite::NodeStatusRecord* response) override;

    grpc::Status ListFiles(grpc::ServerContext* context, const fslite::Empty* request,
                           fslite::FileList* response) override;

    grpc::Status GetDashboard(grpc::ServerContext* context, const fslite::Empty* request,
                              fslite::DashboardReply* response) override;

    grpc::Status GetEvents(grpc::ServerContext* context, const fslite::EventsRequest* request,
                           fslite::EventList* response) override;
};
