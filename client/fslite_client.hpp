#pragma once

#include <string>
#include <memory>
#include "fslite_service.grpc.pb.h"

class FsLiteClient {
private:
    std::unique_ptr<fslite::FsLiteService::Stub> theStub;
    int maxMessageBytes;

public:
    FsLiteClient(std::shared_ptr<grpc::ChannelInterface> aChannel, int aMaxMessageBytes = 64 * 1024 * 1024);

    // Each command prints its outcome and returns false on failure.
    bool UploadFile(const std::string& path);
    bool ReconstructFile(const std::string& fileId);
    bool DownloadFile(const std::string& fileId, const std::string& outputPath);
    bool ShowNodes();
    bool SetNodeStatus(const std::string& nodeId, const std::string& status);
    bool ShowFiles();
    bool ShowDashboard();
    bool ShowEvents(uint32_t limit);
};
