#include <gtest/gtest.h>

#include "tidelink/core/ids.h"
#include "tidelink/storage/blob_writer.h"
#include "tidelink/upload/upload_session.h"

TEST(PathSafety, AcceptsSimpleNames) {
    EXPECT_TRUE(tidelink::storage::BlobWriter::IsSafeName("0f3a9c"));
    EXPECT_TRUE(tidelink::storage::BlobWriter::IsSafeName("obj-1.txt"));
}

TEST(PathSafety, RejectsTraversal) {
    EXPECT_FALSE(tidelink::storage::BlobWriter::IsSafeName("../secret"));
    EXPECT_FALSE(tidelink::storage::BlobWriter::IsSafeName(".."));
    EXPECT_FALSE(tidelink::storage::BlobWriter::IsSafeName("a/b"));
}

TEST(PathSafety, GeneratedUploadIdsAreValidSessionIds) {
    const auto id = tidelink::core::GenerateUploadId();
    EXPECT_EQ(id.size(), 32u);
    EXPECT_TRUE(tidelink::upload::IsValidSessionId(id));
    EXPECT_TRUE(tidelink::storage::BlobWriter::IsSafeName(id));
    EXPECT_NE(id, tidelink::core::GenerateUploadId());
}

TEST(PathSafety, SessionIdsRejectUppercaseAndDashes) {
    EXPECT_FALSE(tidelink::upload::IsValidSessionId("0123456789ABCDEF0123456789abcdef"));
    EXPECT_FALSE(tidelink::upload::IsValidSessionId("01234567-89ab-cdef-0123-456789abcdef"));
    EXPECT_FALSE(tidelink::upload::IsValidSessionId("../../etc/passwd"));
}
