#include <gtest/gtest.h>
#include "../utils/test_utils.hpp"
#include "service_impl.hpp"
#include "errors.hpp"

class ServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        server_ = std::make_unique<test_utils::TestServer>(std::vector<std::string>{"a", "b", "c"}, 8);
        ASSERT_TRUE(server_->start()) << "Failed to start FS-Lite server";

        stub_ = fslite::FsLiteService::NewStub(test_utils::createChannel(server_->address()));
    }

    void TearDown() override {
        stub_.reset();
        if (server_) {
            server_->stop();
        }
    }

    grpc::Status submit(const std::string& name, const std::string& data, fslite::SubmitFileResponse* response) {
        fslite::SubmitFileRequest request;
        request.set_name(name);
        request.set_data(data);
        grpc::ClientContext context;
        return stub_->SubmitFile(&context, request, response);
    }

    grpc::Status reconstruct(const std::string& file_id, fslite::ReconstructionReply* response) {
        fslite::ReconstructionRequest request;
        request.set_file_id(file_id);
        grpc::ClientContext context;
        return stub_->RequestReconstruction(&context, request, response);
    }

    grpc::Status setStatus(const std::string& node_id, const std::string& status,
                           fslite::NodeStatusRecord* response) {
        fslite::SetNodeStatusRequest request;
        request.set_node_id(node_id);
        request.set_status(status);
        grpc::ClientContext context;
        return stub_->SetNodeStatus(&context, request, response);
    }

    std::unique_ptr<test_utils::TestServer> server_;
    std::unique_ptr<fslite::FsLiteService::Stub> stub_;
};

TEST_F(ServiceTest, SubmitReconstructDownload) {
    std::string data = "0123456789abcdefghij";   // 3 chunks of 8

    fslite::SubmitFileResponse submitted;
    ASSERT_TRUE(submit("digits.txt", data, &submitted).ok());
    EXPECT_EQ(submitted.total_chunks(), 3);

    fslite::ReconstructionReply reply;
    ASSERT_TRUE(reconstruct(submitted.file_id(), &reply).ok());
    EXPECT_EQ(reply.status(), "success");
    EXPECT_EQ(reply.original_name(), "digits.txt");
    EXPECT_EQ(reply.retrieved_chunks(), 3);
    EXPECT_EQ(reply.output_handle(), submitted.file_id());
    EXPECT_EQ(reply.missing_size(), 0);

    fslite::DownloadRequest request;
    request.set_file_id(submitted.file_id());
    fslite::DownloadReply download;
    grpc::ClientContext context;
    ASSERT_TRUE(stub_->DownloadFile(&context, request, &download).ok());
    EXPECT_EQ(download.original_name(), "digits.txt");
    EXPECT_EQ(download.data(), data);
}

TEST_F(ServiceTest, PartialReplyListsMissingChunks) {
    fslite::SubmitFileResponse submitted;
    ASSERT_TRUE(submit("f", std::string(32, 'x'), &submitted).ok());   // a,b,c,a

    fslite::NodeStatusRecord node;
    ASSERT_TRUE(setStatus("a", "offline", &node).ok());
    EXPECT_FALSE(node.online());

    fslite::ReconstructionReply reply;
    ASSERT_TRUE(reconstruct(submitted.file_id(), &reply).ok());
    EXPECT_EQ(reply.status(), "partial");
    EXPECT_EQ(reply.retrieved_chunks(), 2);
    ASSERT_EQ(reply.missing_size(), 2);
    EXPECT_EQ(reply.missing(0).chunk_index(), 0);
    EXPECT_EQ(reply.missing(0).node_id(), "a");
    EXPECT_EQ(reply.missing(0).reason(), "NodeOffline");
    EXPECT_EQ(reply.missing(1).chunk_index(), 3);
    EXPECT_TRUE(reply.output_handle().empty());

    fslite::DownloadRequest request;
    request.set_file_id(submitted.file_id());
    fslite::DownloadReply download;
    grpc::ClientContext context;
    EXPECT_EQ(stub_->DownloadFile(&context, request, &download).error_code(),
              grpc::StatusCode::FAILED_PRECONDITION);
}

TEST_F(ServiceTest, ErrorCodesMapToStatus) {
    fslite::ReconstructionReply reply;
    EXPECT_EQ(reconstruct("missing", &reply).error_code(), grpc::StatusCode::NOT_FOUND);

    fslite::NodeStatusRecord node;
    EXPECT_EQ(setStatus("zzz", "online", &node).error_code(), grpc::StatusCode::NOT_FOUND);
    EXPECT_EQ(setStatus("a", "maybe", &node).error_code(), grpc::StatusCode::INVALID_ARGUMENT);

    fslite::SubmitFileResponse submitted;
    EXPECT_EQ(submit("", "data", &submitted).error_code(), grpc::StatusCode::INVALID_ARGUMENT);

    for (const std::string id : {"a", "b", "c"}) {
        ASSERT_TRUE(setStatus(id, "offline", &node).ok());
    }
    EXPECT_EQ(submit("f", "data", &submitted).error_code(), grpc::StatusCode::RESOURCE_EXHAUSTED);
}

TEST_F(ServiceTest, ToggleWithEmptyStatus) {
    fslite::NodeStatusRecord node;
    ASSERT_TRUE(setStatus("b", "", &node).ok());
    EXPECT_EQ(node.node_id(), "b");
    EXPECT_FALSE(node.online());

    ASSERT_TRUE(setStatus("b", "", &node).ok());
    EXPECT_TRUE(node.online());
    EXPECT_GT(node.last_seen_ms(), 0);
}

TEST_F(ServiceTest, ListingsAndDashboard) {
    fslite::SubmitFileResponse first;
    fslite::SubmitFileResponse second;
    ASSERT_TRUE(submit("one", std::string(10, '1'), &first).ok());    // a,b
    ASSERT_TRUE(submit("two", std::string(20, '2'), &second).ok());   // c,a,b

    fslite::Empty empty;

    fslite::NodeList nodes;
    {
        grpc::ClientContext context;
        ASSERT_TRUE(stub_->ListNodes(&context, empty, &nodes).ok());
    }
    ASSERT_EQ(nodes.nodes_size(), 3);
    EXPECT_EQ(nodes.nodes(0).node_id(), "a");
    EXPECT_EQ(nodes.nodes(0).chunk_count(), 2);

    fslite::FileList files;
    {
        grpc::ClientContext context;
        ASSERT_TRUE(stub_->ListFiles(&context, empty, &files).ok());
    }
    ASSERT_EQ(files.files_size(), 2);
    EXPECT_EQ(files.files(0).file_id(), first.file_id());
    EXPECT_EQ(files.files(1).original_name(), "two");
    EXPECT_EQ(files.files(1).total_size(), 20);
    EXPECT_EQ(files.files(1).file_digest().size(), 64);

    fslite::DashboardReply dashboard;
    {
        grpc::ClientContext context;
        ASSERT_TRUE(stub_->GetDashboard(&context, empty, &dashboard).ok());
    }
    EXPECT_EQ(dashboard.total_files(), 2);
    EXPECT_EQ(dashboard.total_chunks(), 5);
    EXPECT_EQ(dashboard.per_node_chunk_counts().at("a"), 2);
    EXPECT_EQ(dashboard.per_node_chunk_counts().at("b"), 2);
    EXPECT_EQ(dashboard.per_node_chunk_counts().at("c"), 1);
    EXPECT_GE(dashboard.uptime_seconds(), 0.0);
}

TEST_F(ServiceTest, EventsAreNewestFirst) {
    fslite::SubmitFileResponse submitted;
    ASSERT_TRUE(submit("log.txt", "hello", &submitted).ok());

    fslite::EventsRequest request;
    request.set_limit(1);
    fslite::EventList events;
    grpc::ClientContext context;
    ASSERT_TRUE(stub_->GetEvents(&context, request, &events).ok());

    ASSERT_EQ(events.events_size(), 1);
    EXPECT_EQ(events.events(0).message(), "Upload completed: log.txt");
    EXPECT_EQ(events.events(0).level(), "INFO");
    EXPECT_FALSE(events.events(0).timestamp().empty());
}

TEST(StatusMappingTest, CoversEveryErrorCode) {
    EXPECT_EQ(toGrpcStatus(FsError(ErrorCode::UnknownNode, "x")).error_code(), grpc::StatusCode::NOT_FOUND);
    EXPECT_EQ(toGrpcStatus(FsError(ErrorCode::NodeUnavailable, "x")).error_code(), grpc::StatusCode::UNAVAILABLE);
    EXPECT_EQ(toGrpcStatus(FsError(ErrorCode::NoOnlineNodes, "x")).error_code(),
              grpc::StatusCode::RESOURCE_EXHAUSTED);
    EXPECT_EQ(toGrpcStatus(FsError(ErrorCode::NotReconstructed, "x")).error_code(),
              grpc::StatusCode::FAILED_PRECONDITION);
    EXPECT_EQ(toGrpcStatus(FsError(ErrorCode::FileIntegrityFailure, "x")).error_code(),
              grpc::StatusCode::DATA_LOSS);
    EXPECT_EQ(toGrpcStatus(FsError(ErrorCode::StorageFailure, "x")).error_code(), grpc::StatusCode::INTERNAL);

    FsError error(ErrorCode::FileNotFound, "File not found");
    error.withFile("abc");
    EXPECT_NE(toGrpcStatus(error).error_message().find("abc"), std::string::npos);
}
