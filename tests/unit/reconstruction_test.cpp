#include <gtest/gtest.h>
#include "reconstruction.hpp"
#include "placement.hpp"
#include "catalog.hpp"
#include "node_registry.hpp"
#include "chunk_store.hpp"
#include "event_log.hpp"
#include "hasher.hpp"
#include "errors.hpp"
#include "unit_test_utils.hpp"
#include <filesystem>

class ReconstructionTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_dir_ = std::make_unique<unit_test_utils::TempDirectory>();
        std::string nodes_root = temp_dir_->file_path("nodes");
        registry_ = std::make_unique<NodeRegistry>(nodes_root, std::vector<std::string>{"n1", "n2", "n3"});
        store_ = std::make_unique<ChunkStore>(nodes_root);
        catalog_ = std::make_unique<Catalog>(temp_dir_->file_path("catalog.pb"));
        events_ = std::make_unique<EventLog>(100, false);
        placement_ = std::make_unique<PlacementEngine>(*registry_, *store_, *events_, 8);
        engine_ = std::make_unique<ReconstructionEngine>(*catalog_, *registry_, *store_, *events_,
                                                         temp_dir_->file_path("reconstructed"));
    }

    // Places 30 bytes as chunks n1,n2,n3,n1 of sizes 8,8,8,6
    FileManifest placeFile(const std::string& file_id, const std::vector<char>& data) {
        auto manifest = placement_->place(file_id, file_id + ".dat", data);
        catalog_->put(file_id, manifest);
        return manifest;
    }

    std::string chunkPath(const std::string& node, const std::string& file_id, uint32_t index) {
        return temp_dir_->file_path("nodes/" + node + "/" + file_id + "_chunk" + std::to_string(index) + ".chunk");
    }

    std::unique_ptr<unit_test_utils::TempDirectory> temp_dir_;
    std::unique_ptr<NodeRegistry> registry_;
    std::unique_ptr<ChunkStore> store_;
    std::unique_ptr<Catalog> catalog_;
    std::unique_ptr<EventLog> events_;
    std::unique_ptr<PlacementEngine> placement_;
    std::unique_ptr<ReconstructionEngine> engine_;
};

TEST_F(ReconstructionTest, UnknownFile) {
    try {
        engine_->reconstruct("missing");
        FAIL() << "Expected FileNotFound";
    } catch (const FsError& e) {
        EXPECT_EQ(e.code(), ErrorCode::FileNotFound);
    }
    EXPECT_EQ(events_->recent()[0].level, EventLevel::Error);
}

TEST_F(ReconstructionTest, AllChunksAvailable) {
    auto data = unit_test_utils::generateRandomData(30);
    placeFile("f", data);

    auto result = engine_->reconstruct("f");
    EXPECT_EQ(result.status, ReconstructionStatus::Success);
    EXPECT_EQ(result.retrieved_chunks, 4);
    EXPECT_EQ(result.total_chunks, 4);
    EXPECT_TRUE(result.missing.empty());
    EXPECT_EQ(result.original_name, "f.dat");
    EXPECT_EQ(result.output_path, engine_->outputPathFor("f"));

    unit_test_utils::expectDataEqual(data, engine_->readOutput("f"));
}

TEST_F(ReconstructionTest, OfflineNodeGivesPartial) {
    placeFile("f", unit_test_utils::generateRandomData(30));
    registry_->setStatus("n1", NodeStatus::Offline);

    auto result = engine_->reconstruct("f");
    EXPECT_EQ(result.status, ReconstructionStatus::Partial);
    EXPECT_EQ(result.retrieved_chunks, 2);
    ASSERT_EQ(result.missing.size(), 2);
    EXPECT_EQ(result.missing[0].chunk_index, 0);
    EXPECT_EQ(result.missing[0].node_id, "n1");
    EXPECT_EQ(result.missing[0].reason, MissingReason::NodeOffline);
    EXPECT_EQ(result.missing[1].chunk_index, 3);
    EXPECT_EQ(result.missing[1].reason, MissingReason::NodeOffline);
    EXPECT_TRUE(result.output_path.empty());

    EXPECT_THROW(engine_->readOutput("f"), FsError);
}

TEST_F(ReconstructionTest, TamperedChunkIsIntegrityFailure) {
    placeFile("f", unit_test_utils::generateRandomData(30));

    // Same length, different content
    unit_test_utils::overwriteFile(chunkPath("n2", "f", 1), unit_test_utils::toBytes("XXXXXXXX"));

    auto result = engine_->reconstruct("f");
    EXPECT_EQ(result.status, ReconstructionStatus::Partial);
    ASSERT_EQ(result.missing.size(), 1);
    EXPECT_EQ(result.missing[0].chunk_index, 1);
    EXPECT_EQ(result.missing[0].node_id, "n2");
    EXPECT_EQ(result.missing[0].reason, MissingReason::IntegrityFailure);
    EXPECT_EQ(result.missing[0].detail, "Chunk 1 hash mismatch");
}

TEST_F(ReconstructionTest, DeletedChunkIsReadFailure) {
    placeFile("f", unit_test_utils::generateRandomData(30));
    std::filesystem::remove(chunkPath("n3", "f", 2));

    auto result = engine_->reconstruct("f");
    EXPECT_EQ(result.status, ReconstructionStatus::Partial);
    ASSERT_EQ(result.missing.size(), 1);
    EXPECT_EQ(result.missing[0].chunk_index, 2);
    EXPECT_EQ(result.missing[0].reason, MissingReason::ChunkReadFailure);
}

TEST_F(ReconstructionTest, MixedFailuresAreAllReported) {
    placeFile("f", unit_test_utils::generateRandomData(30));

    registry_->setStatus("n2", NodeStatus::Offline);                                   // chunk 1
    unit_test_utils::overwriteFile(chunkPath("n3", "f", 2), unit_test_utils::toBytes("tampered"));  // chunk 2
    std::filesystem::remove(chunkPath("n1", "f", 3));                                  // chunk 3

    auto result = engine_->reconstruct("f");
    EXPECT_EQ(result.status, ReconstructionStatus::Partial);
    EXPECT_EQ(result.retrieved_chunks, 1);
    ASSERT_EQ(result.missing.size(), 3);
    EXPECT_EQ(result.missing[0].reason, MissingReason::NodeOffline);
    EXPECT_EQ(result.missing[1].reason, MissingReason::IntegrityFailure);
    EXPECT_EQ(result.missing[2].reason, MissingReason::ChunkReadFailure);
}

TEST_F(ReconstructionTest, AllOfflineGivesFailed) {
    placeFile("f", unit_test_utils::generateRandomData(30));
    for (const auto& node : registry_->nodeIds()) {
        registry_->setStatus(node, NodeStatus::Offline);
    }

    auto result = engine_->reconstruct("f");
    EXPECT_EQ(result.status, ReconstructionStatus::Failed);
    EXPECT_EQ(result.retrieved_chunks, 0);
    EXPECT_EQ(result.missing.size(), 4);
    EXPECT_FALSE(std::filesystem::exists(engine_->outputPathFor("f")));
}

TEST_F(ReconstructionTest, RecoversOnceNodeReturns) {
    auto data = unit_test_utils::generateRandomData(30);
    placeFile("f", data);

    registry_->setStatus("n3", NodeStatus::Offline);
    EXPECT_EQ(engine_->reconstruct("f").status, ReconstructionStatus::Partial);

    registry_->setStatus("n3", NodeStatus::Online);
    auto result = engine_->reconstruct("f");
    EXPECT_EQ(result.status, ReconstructionStatus::Success);
    unit_test_utils::expectDataEqual(data, engine_->readOutput("f"));
}

TEST_F(ReconstructionTest, EmptyFileSucceeds) {
    placeFile("empty", {});

    auto result = engine_->reconstruct("empty");
    EXPECT_EQ(result.status, ReconstructionStatus::Success);
    EXPECT_EQ(result.total_chunks, 0);
    EXPECT_TRUE(engine_->readOutput("empty").empty());
}

TEST_F(ReconstructionTest, WholeFileDigestMismatchIsFatal) {
    auto manifest = placeFile("f", unit_test_utils::generateRandomData(30));

    // Chunks verify individually but the recorded whole-file digest is wrong
    manifest.file_digest = Hasher::digest(unit_test_utils::toBytes("something else"));
    catalog_->put("f", manifest);

    try {
        engine_->reconstruct("f");
        FAIL() << "Expected FileIntegrityFailure";
    } catch (const FsError& e) {
        EXPECT_EQ(e.code(), ErrorCode::FileIntegrityFailure);
        EXPECT_EQ(e.fileId().value_or(""), "f");
    }
    EXPECT_FALSE(std::filesystem::exists(engine_->outputPathFor("f")));
}

TEST_F(ReconstructionTest, ReadOutputErrors) {
    try {
        engine_->readOutput("ghost");
        FAIL() << "Expected FileNotFound";
    } catch (const FsError& e) {
        EXPECT_EQ(e.code(), ErrorCode::FileNotFound);
    }

    placeFile("f", unit_test_utils::generateRandomData(10));
    try {
        engine_->readOutput("f");
        FAIL() << "Expected NotReconstructed";
    } catch (const FsError& e) {
        EXPECT_EQ(e.code(), ErrorCode::NotReconstructed);
    }
}

TEST(ReconstructionNamesTest, StableNames) {
    EXPECT_STREQ(reconstructionStatusName(ReconstructionStatus::Success), "success");
    EXPECT_STREQ(reconstructionStatusName(ReconstructionStatus::Partial), "partial");
    EXPECT_STREQ(reconstructionStatusName(ReconstructionStatus::Failed), "failed");
    EXPECT_STREQ(missingReasonName(MissingReason::NodeOffline), "NodeOffline");
    EXPECT_STREQ(missingReasonName(MissingReason::ChunkReadFailure), "ChunkReadFailure");
    EXPECT_STREQ(missingReasonName(MissingReason::IntegrityFailure), "IntegrityFailure");
}
