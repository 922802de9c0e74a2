#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <gtest/gtest.h>
#include <Poco/UUIDGenerator.h>

#include "tidelink/core/ids.h"
#include "tidelink/core/lifecycle.h"
#include "tidelink/core/time.h"
#include "tidelink/metadata/sqlite_metadata_store.h"
#include "tidelink/retention/cleanup_scheduler.h"
#include "tidelink/retention/cleanup_service.h"
#include "tidelink/storage/blob_writer.h"
#include "tidelink/upload/memory_offset_store.h"
#include "tidelink/upload/metadata_binder.h"
#include "tidelink/upload/upload_manager.h"

namespace {

class CleanupTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("tidelink_cleanup_" + Poco::UUIDGenerator().createOne().toString());
        std::filesystem::create_directories(dir_);
        metadata_ = std::make_shared<tidelink::metadata::SqliteMetadataStore>(
            (dir_ / "tidelink.db").string());
        blobs_ = std::make_shared<tidelink::storage::BlobWriter>(dir_.string());
        auto binder = std::make_shared<tidelink::upload::MetadataBinder>(metadata_);
        uploads_ = std::make_shared<tidelink::upload::UploadSessionManager>(
            std::make_shared<tidelink::upload::MemoryOffsetStore>(), blobs_, binder,
            tidelink::upload::UploadLimits{});
        service_ = std::make_shared<tidelink::retention::CleanupService>(metadata_, uploads_, 10);
    }

    void TearDown() override {
        service_.reset();
        uploads_.reset();
        metadata_.reset();
        std::filesystem::remove_all(dir_);
    }

    std::string CreateTransfer(int expires_in_seconds) {
        tidelink::metadata::Transfer transfer;
        transfer.id = tidelink::core::GenerateTransferId();
        transfer.expires_at = tidelink::core::NowIso8601WithOffsetSeconds(expires_in_seconds);
        EXPECT_TRUE(metadata_->CreateTransfer(transfer).ok());
        return transfer.id;
    }

    /// Stages a stored upload directly; expired transfers no longer accept new sessions.
    std::string StageUpload(const std::string& transfer_id, bool complete) {
        tidelink::metadata::FileRecord file;
        file.id = tidelink::core::GenerateUploadId();
        file.transfer_id = transfer_id;
        file.original_name = "staged.bin";
        file.mime_type = "application/octet-stream";
        file.size = 3;
        EXPECT_TRUE(metadata_->CreateFile(file).ok());
        EXPECT_TRUE(blobs_->CreateEmpty(file.id).ok());
        EXPECT_TRUE(blobs_->AppendAt(file.id, 0, "abc").ok());
        if (complete) {
            EXPECT_TRUE(metadata_->MarkFileComplete(file.id, 3).ok());
        }
        return file.id;
    }

    std::filesystem::path dir_;
    std::shared_ptr<tidelink::metadata::SqliteMetadataStore> metadata_;
    std::shared_ptr<tidelink::storage::BlobWriter> blobs_;
    std::shared_ptr<tidelink::upload::UploadSessionManager> uploads_;
    std::shared_ptr<tidelink::retention::CleanupService> service_;
};

}  // namespace

TEST_F(CleanupTest, SweepRemovesExpiredTransfers) {
    const auto expired = CreateTransfer(-60);
    const auto done = StageUpload(expired, true);
    const auto partial = StageUpload(expired, false);

    auto swept = service_->RunSweep();
    ASSERT_TRUE(swept.ok());
    EXPECT_EQ(swept.value(), 1u);

    EXPECT_EQ(metadata_->GetTransfer(expired).value().status, tidelink::metadata::kTransferDeleted);
    EXPECT_TRUE(metadata_->ListFiles(expired, false).value().empty());
    EXPECT_EQ(blobs_->Length(done).error().code, tidelink::core::ErrorCode::kNotFound);
    EXPECT_EQ(blobs_->Length(partial).error().code, tidelink::core::ErrorCode::kNotFound);

    auto again = service_->RunSweep();
    ASSERT_TRUE(again.ok());
    EXPECT_EQ(again.value(), 0u);
}

TEST_F(CleanupTest, SweepKeepsLiveTransfers) {
    const auto live = CreateTransfer(3600);
    auto created = uploads_->CreateSession(3, {{"transferId", live}}, "abc");
    ASSERT_TRUE(created.ok());

    auto swept = service_->RunSweep();
    ASSERT_TRUE(swept.ok());
    EXPECT_EQ(swept.value(), 0u);
    EXPECT_EQ(metadata_->GetTransfer(live).value().status, tidelink::metadata::kTransferPending);
    EXPECT_TRUE(metadata_->GetFile(created.value().id).value().upload_complete);
    EXPECT_EQ(blobs_->Length(created.value().id).value(), 3u);
}

TEST_F(CleanupTest, SchedulerStartsOncePerProcess) {
    boost::asio::io_context ioc;
    tidelink::core::ProcessLifecycle lifecycle;
    tidelink::retention::CleanupScheduler first(ioc, service_, lifecycle, std::chrono::seconds(60));
    tidelink::retention::CleanupScheduler second(ioc, service_, lifecycle,
                                                 std::chrono::seconds(60));

    EXPECT_TRUE(first.Start());
    EXPECT_FALSE(second.Start());
    EXPECT_TRUE(lifecycle.cleanup_started());
    first.Stop();
    second.Stop();
    ioc.run();
}

TEST_F(CleanupTest, SchedulerSweepsImmediately) {
    const auto expired = CreateTransfer(-60);
    StageUpload(expired, true);

    boost::asio::io_context ioc;
    tidelink::core::ProcessLifecycle lifecycle;
    tidelink::retention::CleanupScheduler scheduler(ioc, service_, lifecycle,
                                                    std::chrono::seconds(3600));
    ASSERT_TRUE(scheduler.Start());
    ioc.run_for(std::chrono::milliseconds(200));
    scheduler.Stop();
    ioc.run();

    EXPECT_EQ(metadata_->GetTransfer(expired).value().status, tidelink::metadata::kTransferDeleted);
}
