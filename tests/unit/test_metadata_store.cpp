#include <filesystem>
#include <string>

#include <gtest/gtest.h>
#include <Poco/UUIDGenerator.h>

#include "tidelink/core/time.h"
#include "tidelink/metadata/sqlite_metadata_store.h"

namespace {

std::filesystem::path MakeTempDbPath() {
    const auto name = "tidelink_test_" + Poco::UUIDGenerator().createOne().toString() + ".db";
    return std::filesystem::temp_directory_path() / name;
}

void RemoveDb(const std::filesystem::path& db_path) {
    std::filesystem::remove(db_path);
    std::filesystem::remove(db_path.string() + "-wal");
    std::filesystem::remove(db_path.string() + "-shm");
}

tidelink::metadata::Transfer MakeTransfer(const std::string& id, int expires_in_seconds) {
    tidelink::metadata::Transfer transfer;
    transfer.id = id;
    transfer.title = "title " + id;
    transfer.expires_at = tidelink::core::NowIso8601WithOffsetSeconds(expires_in_seconds);
    return transfer;
}

tidelink::metadata::FileRecord MakeFile(const std::string& id, const std::string& transfer_id,
                                        std::uint64_t size) {
    tidelink::metadata::FileRecord file;
    file.id = id;
    file.transfer_id = transfer_id;
    file.original_name = id + ".bin";
    file.mime_type = "application/octet-stream";
    file.size = size;
    return file;
}

}  // namespace

TEST(MetadataStore, CreateAndFetchTransfer) {
    const auto db_path = MakeTempDbPath();

    {
        tidelink::metadata::SqliteMetadataStore store(db_path.string());
        auto created = store.CreateTransfer(MakeTransfer("alpha", 3600));
        ASSERT_TRUE(created.ok());
        EXPECT_EQ(created.value().status, tidelink::metadata::kTransferPending);
        EXPECT_FALSE(created.value().created_at.empty());

        auto fetched = store.GetTransfer("alpha");
        ASSERT_TRUE(fetched.ok());
        EXPECT_EQ(fetched.value().title, "title alpha");
        EXPECT_EQ(fetched.value().download_count, 0);

        EXPECT_EQ(store.CreateTransfer(MakeTransfer("alpha", 3600)).error().code,
                  tidelink::core::ErrorCode::kAlreadyExists);
        EXPECT_EQ(store.GetTransfer("missing").error().code,
                  tidelink::core::ErrorCode::kNotFound);
    }

    RemoveDb(db_path);
}

TEST(MetadataStore, FileLifecycle) {
    const auto db_path = MakeTempDbPath();

    {
        tidelink::metadata::SqliteMetadataStore store(db_path.string());
        ASSERT_TRUE(store.CreateTransfer(MakeTransfer("beta", 3600)).ok());
        ASSERT_TRUE(store.CreateFile(MakeFile("f1", "beta", 100)).ok());
        ASSERT_TRUE(store.CreateFile(MakeFile("f2", "beta", 50)).ok());

        EXPECT_EQ(store.ListFiles("beta", false).value().size(), 2u);
        EXPECT_TRUE(store.ListFiles("beta", true).value().empty());

        ASSERT_TRUE(store.MarkFileComplete("f1", 100).ok());
        auto done = store.ListFiles("beta", true);
        ASSERT_TRUE(done.ok());
        ASSERT_EQ(done.value().size(), 1u);
        EXPECT_EQ(done.value()[0].id, "f1");
        EXPECT_TRUE(done.value()[0].upload_complete);

        ASSERT_TRUE(store.DeleteFile("f2").ok());
        EXPECT_EQ(store.GetFile("f2").error().code, tidelink::core::ErrorCode::kNotFound);
        EXPECT_TRUE(store.DeleteFile("f2").ok());
        EXPECT_EQ(store.MarkFileComplete("f2", 1).error().code,
                  tidelink::core::ErrorCode::kNotFound);
    }

    RemoveDb(db_path);
}

TEST(MetadataStore, FilesRequireExistingTransfer) {
    const auto db_path = MakeTempDbPath();

    {
        tidelink::metadata::SqliteMetadataStore store(db_path.string());
        EXPECT_FALSE(store.CreateFile(MakeFile("orphan", "nobody", 1)).ok());
    }

    RemoveDb(db_path);
}

TEST(MetadataStore, CompleteTransferTotalsFinishedFiles) {
    const auto db_path = MakeTempDbPath();

    {
        tidelink::metadata::SqliteMetadataStore store(db_path.string());
        ASSERT_TRUE(store.CreateTransfer(MakeTransfer("gamma", 3600)).ok());
        ASSERT_TRUE(store.CreateFile(MakeFile("g1", "gamma", 10)).ok());
        ASSERT_TRUE(store.CreateFile(MakeFile("g2", "gamma", 20)).ok());
        ASSERT_TRUE(store.CreateFile(MakeFile("g3", "gamma", 999)).ok());
        ASSERT_TRUE(store.MarkFileComplete("g1", 10).ok());
        ASSERT_TRUE(store.MarkFileComplete("g2", 20).ok());

        auto completed = store.CompleteTransfer("gamma");
        ASSERT_TRUE(completed.ok());
        EXPECT_EQ(completed.value().status, tidelink::metadata::kTransferComplete);
        EXPECT_EQ(completed.value().total_size, 30u);

        ASSERT_TRUE(store.IncrementDownloadCount("gamma").ok());
        ASSERT_TRUE(store.IncrementDownloadCount("gamma").ok());
        EXPECT_EQ(store.GetTransfer("gamma").value().download_count, 2);
    }

    RemoveDb(db_path);
}

TEST(MetadataStore, ListExpiredSkipsLiveAndDeletedTransfers) {
    const auto db_path = MakeTempDbPath();

    {
        tidelink::metadata::SqliteMetadataStore store(db_path.string());
        ASSERT_TRUE(store.CreateTransfer(MakeTransfer("old-1", -7200)).ok());
        ASSERT_TRUE(store.CreateTransfer(MakeTransfer("old-2", -60)).ok());
        ASSERT_TRUE(store.CreateTransfer(MakeTransfer("gone", -60)).ok());
        ASSERT_TRUE(store.CreateTransfer(MakeTransfer("live", 3600)).ok());
        ASSERT_TRUE(
            store.UpdateTransferStatus("gone", tidelink::metadata::kTransferDeleted).ok());

        auto expired = store.ListExpiredTransfers(tidelink::core::NowIso8601(), 10);
        ASSERT_TRUE(expired.ok());
        ASSERT_EQ(expired.value().size(), 2u);
        EXPECT_EQ(expired.value()[0].id, "old-1");
        EXPECT_EQ(expired.value()[1].id, "old-2");

        auto limited = store.ListExpiredTransfers(tidelink::core::NowIso8601(), 1);
        ASSERT_TRUE(limited.ok());
        ASSERT_EQ(limited.value().size(), 1u);
        EXPECT_EQ(limited.value()[0].id, "old-1");

        EXPECT_EQ(store.UpdateTransferStatus("missing", "deleted").error().code,
                  tidelink::core::ErrorCode::kNotFound);
    }

    RemoveDb(db_path);
}
