#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>
#include <Poco/UUIDGenerator.h>

#include "tidelink/core/ids.h"
#include "tidelink/core/time.h"
#include "tidelink/metadata/sqlite_metadata_store.h"
#include "tidelink/storage/blob_writer.h"
#include "tidelink/upload/file_offset_store.h"
#include "tidelink/upload/metadata_binder.h"
#include "tidelink/upload/upload_manager.h"

namespace {

using tidelink::core::ErrorCode;

class FlakyMetadataStore : public tidelink::metadata::SqliteMetadataStore {
public:
    using SqliteMetadataStore::SqliteMetadataStore;

    tidelink::core::Result<void> MarkFileComplete(const std::string& id,
                                                  std::uint64_t final_size) override {
        if (fail_next_complete.exchange(false)) {
            return tidelink::core::Error{ErrorCode::kDbError, "database is locked"};
        }
        return SqliteMetadataStore::MarkFileComplete(id, final_size);
    }

    std::atomic<bool> fail_next_complete{false};
};

class UploadManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("tidelink_uploads_" + Poco::UUIDGenerator().createOne().toString());
        std::filesystem::create_directories(dir_);
        metadata_ = std::make_shared<FlakyMetadataStore>((dir_ / "tidelink.db").string());
        blobs_ = std::make_shared<tidelink::storage::BlobWriter>(dir_.string());
        offsets_ = std::make_shared<tidelink::upload::FileOffsetStore>(blobs_->root());
        auto binder = std::make_shared<tidelink::upload::MetadataBinder>(metadata_);

        tidelink::upload::UploadLimits limits;
        limits.max_size_bytes = 1024;
        uploads_ = std::make_unique<tidelink::upload::UploadSessionManager>(offsets_, blobs_,
                                                                           binder, limits);
        transfer_id_ = CreateTransfer(3600);
    }

    void TearDown() override {
        uploads_.reset();
        offsets_.reset();
        blobs_.reset();
        metadata_.reset();
        std::filesystem::remove_all(dir_);
    }

    std::string CreateTransfer(int expires_in_seconds) {
        tidelink::metadata::Transfer transfer;
        transfer.id = tidelink::core::GenerateTransferId();
        transfer.title = "holiday photos";
        transfer.expires_at = tidelink::core::NowIso8601WithOffsetSeconds(expires_in_seconds);
        auto created = metadata_->CreateTransfer(transfer);
        EXPECT_TRUE(created.ok());
        return transfer.id;
    }

    tidelink::upload::UploadMetadata Metadata() const {
        return {{"transferId", transfer_id_}, {"filename", "report.bin"}};
    }

    std::filesystem::path dir_;
    std::shared_ptr<FlakyMetadataStore> metadata_;
    std::shared_ptr<tidelink::storage::BlobWriter> blobs_;
    std::shared_ptr<tidelink::upload::FileOffsetStore> offsets_;
    std::unique_ptr<tidelink::upload::UploadSessionManager> uploads_;
    std::string transfer_id_;
};

}  // namespace

TEST_F(UploadManagerTest, ChunkedUploadCompletesAndFinalizesFile) {
    auto created = uploads_->CreateSession(10, Metadata());
    ASSERT_TRUE(created.ok());
    const auto id = created.value().id;
    EXPECT_EQ(created.value().offset, 0u);
    EXPECT_FALSE(created.value().complete);

    auto stub = metadata_->GetFile(id);
    ASSERT_TRUE(stub.ok());
    EXPECT_EQ(stub.value().transfer_id, transfer_id_);
    EXPECT_EQ(stub.value().original_name, "report.bin");
    EXPECT_EQ(stub.value().mime_type, "application/octet-stream");
    EXPECT_FALSE(stub.value().upload_complete);

    auto first = uploads_->AppendChunk(id, 0, "abcdef");
    ASSERT_TRUE(first.ok());
    EXPECT_EQ(first.value().offset, 6u);
    EXPECT_FALSE(first.value().complete);

    auto second = uploads_->AppendChunk(id, 6, "ghij");
    ASSERT_TRUE(second.ok());
    EXPECT_EQ(second.value().offset, 10u);
    EXPECT_TRUE(second.value().complete);

    auto file = metadata_->GetFile(id);
    ASSERT_TRUE(file.ok());
    EXPECT_TRUE(file.value().upload_complete);
    EXPECT_EQ(file.value().size, 10u);
    EXPECT_EQ(blobs_->ReadRange(id, 0, 10).value(), "abcdefghij");

    auto status = uploads_->GetStatus(id);
    ASSERT_TRUE(status.ok());
    EXPECT_TRUE(status.value().complete);
    EXPECT_EQ(status.value().metadata.at("filename"), "report.bin");
}

TEST_F(UploadManagerTest, StatusReadFinishesInterruptedFinalize) {
    auto created = uploads_->CreateSession(6, Metadata());
    ASSERT_TRUE(created.ok());
    const auto id = created.value().id;
    ASSERT_TRUE(uploads_->AppendChunk(id, 0, "abc").ok());

    metadata_->fail_next_complete = true;
    auto last = uploads_->AppendChunk(id, 3, "def");
    ASSERT_FALSE(last.ok());
    EXPECT_EQ(last.error().code, ErrorCode::kDbError);
    EXPECT_FALSE(metadata_->GetFile(id).value().upload_complete);

    auto status = uploads_->GetStatus(id);
    ASSERT_TRUE(status.ok());
    EXPECT_EQ(status.value().offset, 6u);
    EXPECT_TRUE(status.value().complete);

    auto file = metadata_->GetFile(id);
    ASSERT_TRUE(file.ok());
    EXPECT_TRUE(file.value().upload_complete);
    EXPECT_EQ(file.value().size, 6u);
    EXPECT_EQ(uploads_->AppendChunk(id, 6, "x").error().code, ErrorCode::kConflict);
}

TEST_F(UploadManagerTest, StatusReadReportsFinalizeFailure) {
    auto created = uploads_->CreateSession(3, Metadata());
    ASSERT_TRUE(created.ok());
    const auto id = created.value().id;

    metadata_->fail_next_complete = true;
    ASSERT_FALSE(uploads_->AppendChunk(id, 0, "abc").ok());

    metadata_->fail_next_complete = true;
    auto failed = uploads_->GetStatus(id);
    ASSERT_FALSE(failed.ok());
    EXPECT_EQ(failed.error().code, ErrorCode::kDbError);

    auto retried = uploads_->GetStatus(id);
    ASSERT_TRUE(retried.ok());
    EXPECT_TRUE(retried.value().complete);
    EXPECT_TRUE(metadata_->GetFile(id).value().upload_complete);
}

TEST_F(UploadManagerTest, OffsetMismatchReportsAuthoritativeOffset) {
    auto created = uploads_->CreateSession(10, Metadata());
    ASSERT_TRUE(created.ok());
    const auto id = created.value().id;
    ASSERT_TRUE(uploads_->AppendChunk(id, 0, "abcdef").ok());

    auto stale = uploads_->AppendChunk(id, 3, "xyz");
    ASSERT_FALSE(stale.ok());
    EXPECT_EQ(stale.error().code, ErrorCode::kOffsetMismatch);
    ASSERT_TRUE(stale.error().offset.has_value());
    EXPECT_EQ(*stale.error().offset, 6u);
    EXPECT_EQ(uploads_->GetStatus(id).value().offset, 6u);

    auto ahead = uploads_->AppendChunk(id, 8, "xy");
    ASSERT_FALSE(ahead.ok());
    EXPECT_EQ(*ahead.error().offset, 6u);

    auto resent = uploads_->AppendChunk(id, *stale.error().offset, "ghij");
    ASSERT_TRUE(resent.ok());
    EXPECT_TRUE(resent.value().complete);
}

TEST_F(UploadManagerTest, CompletedUploadRejectsFurtherWrites) {
    auto created = uploads_->CreateSession(4, Metadata());
    ASSERT_TRUE(created.ok());
    const auto id = created.value().id;
    ASSERT_TRUE(uploads_->AppendChunk(id, 0, "done").ok());

    EXPECT_EQ(uploads_->AppendChunk(id, 4, "x").error().code, ErrorCode::kConflict);
    EXPECT_EQ(uploads_->CancelSession(id).error().code, ErrorCode::kConflict);
}

TEST_F(UploadManagerTest, OversizedChunkLeavesOffsetUnchanged) {
    auto created = uploads_->CreateSession(5, Metadata());
    ASSERT_TRUE(created.ok());
    const auto id = created.value().id;

    EXPECT_EQ(uploads_->AppendChunk(id, 0, "toolong").error().code, ErrorCode::kOversizedChunk);
    EXPECT_EQ(uploads_->GetStatus(id).value().offset, 0u);
    EXPECT_EQ(blobs_->Length(id).value(), 0u);
}

TEST_F(UploadManagerTest, EmptyChunkIsAccepted) {
    auto created = uploads_->CreateSession(5, Metadata());
    ASSERT_TRUE(created.ok());
    auto appended = uploads_->AppendChunk(created.value().id, 0, "");
    ASSERT_TRUE(appended.ok());
    EXPECT_EQ(appended.value().offset, 0u);
    EXPECT_FALSE(appended.value().complete);
}

TEST_F(UploadManagerTest, RejectsSizeAboveCeiling) {
    auto created = uploads_->CreateSession(1025, Metadata());
    ASSERT_FALSE(created.ok());
    EXPECT_EQ(created.error().code, ErrorCode::kSizeLimitExceeded);
    EXPECT_TRUE(metadata_->ListFiles(transfer_id_, false).value().empty());
}

TEST_F(UploadManagerTest, RequiresTransferReference) {
    auto missing = uploads_->CreateSession(10, {{"filename", "a.txt"}});
    ASSERT_FALSE(missing.ok());
    EXPECT_EQ(missing.error().code, ErrorCode::kInvalidArgument);

    auto unknown = uploads_->CreateSession(10, {{"transferId", "no-such-transfer"}});
    ASSERT_FALSE(unknown.ok());
    EXPECT_EQ(unknown.error().code, ErrorCode::kReferenceNotFound);
}

TEST_F(UploadManagerTest, ExpiredTransferRejectsNewUploads) {
    const auto expired = CreateTransfer(-60);
    auto created = uploads_->CreateSession(10, {{"transferId", expired}});
    ASSERT_FALSE(created.ok());
    EXPECT_EQ(created.error().code, ErrorCode::kReferenceNotFound);
}

TEST_F(UploadManagerTest, CreationWithDataAppendsInitialBytes) {
    auto created = uploads_->CreateSession(8, Metadata(), "abcd");
    ASSERT_TRUE(created.ok());
    EXPECT_EQ(created.value().offset, 4u);
    EXPECT_FALSE(created.value().complete);

    auto whole = uploads_->CreateSession(3, Metadata(), "xyz");
    ASSERT_TRUE(whole.ok());
    EXPECT_EQ(whole.value().offset, 3u);
    EXPECT_TRUE(whole.value().complete);
    EXPECT_TRUE(metadata_->GetFile(whole.value().id).value().upload_complete);
}

TEST_F(UploadManagerTest, OversizedInitialDataCreatesNothing) {
    auto created = uploads_->CreateSession(2, Metadata(), "abcd");
    ASSERT_FALSE(created.ok());
    EXPECT_EQ(created.error().code, ErrorCode::kOversizedChunk);
    EXPECT_TRUE(metadata_->ListFiles(transfer_id_, false).value().empty());
    EXPECT_TRUE(std::filesystem::is_empty(blobs_->root()));
}

TEST_F(UploadManagerTest, ZeroLengthUploadIsCompleteOnCreation) {
    auto created = uploads_->CreateSession(0, Metadata());
    ASSERT_TRUE(created.ok());
    EXPECT_TRUE(created.value().complete);
    EXPECT_EQ(created.value().offset, 0u);

    auto file = metadata_->GetFile(created.value().id);
    ASSERT_TRUE(file.ok());
    EXPECT_TRUE(file.value().upload_complete);
    EXPECT_EQ(file.value().size, 0u);
    EXPECT_EQ(uploads_->AppendChunk(created.value().id, 0, "").error().code,
              ErrorCode::kConflict);
}

TEST_F(UploadManagerTest, CancelRemovesEveryArtifact) {
    auto created = uploads_->CreateSession(10, Metadata());
    ASSERT_TRUE(created.ok());
    const auto id = created.value().id;
    ASSERT_TRUE(uploads_->AppendChunk(id, 0, "abc").ok());

    ASSERT_TRUE(uploads_->CancelSession(id).ok());
    EXPECT_EQ(uploads_->GetStatus(id).error().code, ErrorCode::kNotFound);
    EXPECT_EQ(uploads_->AppendChunk(id, 3, "d").error().code, ErrorCode::kNotFound);
    EXPECT_EQ(metadata_->GetFile(id).error().code, ErrorCode::kNotFound);
    EXPECT_EQ(blobs_->Length(id).error().code, ErrorCode::kNotFound);

    EXPECT_TRUE(uploads_->CancelSession(id).ok());
    EXPECT_TRUE(uploads_->CancelSession("not-an-upload").ok());
}

TEST_F(UploadManagerTest, PurgeRemovesCompletedUploads) {
    auto created = uploads_->CreateSession(2, Metadata(), "ok");
    ASSERT_TRUE(created.ok());
    const auto id = created.value().id;

    ASSERT_TRUE(uploads_->PurgeSession(id).ok());
    EXPECT_EQ(uploads_->GetStatus(id).error().code, ErrorCode::kNotFound);
    EXPECT_EQ(metadata_->GetFile(id).error().code, ErrorCode::kNotFound);
}

TEST_F(UploadManagerTest, UnknownIdsAreNotFound) {
    const auto id = tidelink::core::GenerateUploadId();
    EXPECT_EQ(uploads_->GetStatus(id).error().code, ErrorCode::kNotFound);
    EXPECT_EQ(uploads_->AppendChunk(id, 0, "x").error().code, ErrorCode::kNotFound);
    EXPECT_EQ(uploads_->GetStatus("../etc/passwd").error().code, ErrorCode::kNotFound);
}

TEST_F(UploadManagerTest, DiscardsUnacknowledgedTail) {
    auto created = uploads_->CreateSession(10, Metadata());
    ASSERT_TRUE(created.ok());
    const auto id = created.value().id;
    ASSERT_TRUE(uploads_->AppendChunk(id, 0, "abc").ok());

    // Simulate a crash between the blob write and the offset commit.
    ASSERT_TRUE(blobs_->AppendAt(id, 3, "zz").ok());
    ASSERT_EQ(uploads_->GetStatus(id).value().offset, 3u);

    auto resumed = uploads_->AppendChunk(id, 3, "defghij");
    ASSERT_TRUE(resumed.ok());
    EXPECT_TRUE(resumed.value().complete);
    EXPECT_EQ(blobs_->ReadRange(id, 0, 10).value(), "abcdefghij");
}

TEST_F(UploadManagerTest, ShortBlobIsStorageDesync) {
    auto created = uploads_->CreateSession(10, Metadata());
    ASSERT_TRUE(created.ok());
    const auto id = created.value().id;
    ASSERT_TRUE(uploads_->AppendChunk(id, 0, "abcd").ok());
    ASSERT_TRUE(blobs_->Truncate(id, 1).ok());

    EXPECT_EQ(uploads_->AppendChunk(id, 4, "ef").error().code, ErrorCode::kStorageDesync);
    EXPECT_EQ(uploads_->GetStatus(id).value().offset, 4u);
}

TEST_F(UploadManagerTest, ProgressSurvivesManagerRestart) {
    auto created = uploads_->CreateSession(6, Metadata());
    ASSERT_TRUE(created.ok());
    const auto id = created.value().id;
    ASSERT_TRUE(uploads_->AppendChunk(id, 0, "abc").ok());

    auto offsets = std::make_shared<tidelink::upload::FileOffsetStore>(blobs_->root());
    auto binder = std::make_shared<tidelink::upload::MetadataBinder>(metadata_);
    tidelink::upload::UploadSessionManager restarted(offsets, blobs_, binder, {});

    EXPECT_EQ(restarted.GetStatus(id).value().offset, 3u);
    auto finished = restarted.AppendChunk(id, 3, "def");
    ASSERT_TRUE(finished.ok());
    EXPECT_TRUE(finished.value().complete);
}

TEST_F(UploadManagerTest, ConcurrentAppendsAtSameOffsetAdmitOne) {
    auto created = uploads_->CreateSession(8, Metadata());
    ASSERT_TRUE(created.ok());
    const auto id = created.value().id;

    std::atomic<int> accepted{0};
    std::atomic<int> mismatched{0};
    std::vector<std::thread> writers;
    for (int i = 0; i < 4; ++i) {
        writers.emplace_back([&] {
            auto result = uploads_->AppendChunk(id, 0, "abcd");
            if (result.ok()) {
                ++accepted;
            } else if (result.error().code == ErrorCode::kOffsetMismatch) {
                ++mismatched;
            }
        });
    }
    for (auto& t : writers) {
        t.join();
    }
    EXPECT_EQ(accepted.load(), 1);
    EXPECT_EQ(mismatched.load(), 3);
    EXPECT_EQ(uploads_->GetStatus(id).value().offset, 4u);
    EXPECT_EQ(blobs_->Length(id).value(), 4u);
}

TEST_F(UploadManagerTest, DistinctUploadsProgressIndependently) {
    std::vector<std::string> ids;
    for (int i = 0; i < 4; ++i) {
        auto created = uploads_->CreateSession(64, Metadata());
        ASSERT_TRUE(created.ok());
        ids.push_back(created.value().id);
    }

    std::vector<std::thread> writers;
    std::atomic<int> failures{0};
    for (const auto& id : ids) {
        writers.emplace_back([&, id] {
            for (std::uint64_t offset = 0; offset < 64; offset += 16) {
                if (!uploads_->AppendChunk(id, offset, std::string(16, 'q')).ok()) {
                    ++failures;
                }
            }
        });
    }
    for (auto& t : writers) {
        t.join();
    }
    EXPECT_EQ(failures.load(), 0);
    for (const auto& id : ids) {
        EXPECT_TRUE(uploads_->GetStatus(id).value().complete);
    }
    EXPECT_EQ(metadata_->ListFiles(transfer_id_, true).value().size(), 4u);
}
