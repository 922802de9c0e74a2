#include <gtest/gtest.h>

#include "tidelink/http/tus_protocol.h"

namespace tus = tidelink::http::tus;

TEST(TusProtocol, ParsesUploadMetadata) {
    auto parsed = tus::ParseUploadMetadata(
        "filename d29ybGRfZG9taW5hdGlvbl9wbGFuLnBkZg==,is_confidential, transferId dC0x");
    ASSERT_TRUE(parsed.ok());
    const auto& metadata = parsed.value();
    ASSERT_EQ(metadata.size(), 3u);
    EXPECT_EQ(metadata.at("filename"), "world_domination_plan.pdf");
    EXPECT_EQ(metadata.at("is_confidential"), "");
    EXPECT_EQ(metadata.at("transferId"), "t-1");
}

TEST(TusProtocol, EmptyMetadataHeaderIsEmptyMap) {
    auto parsed = tus::ParseUploadMetadata("");
    ASSERT_TRUE(parsed.ok());
    EXPECT_TRUE(parsed.value().empty());
}

TEST(TusProtocol, RejectsMalformedMetadata) {
    EXPECT_FALSE(tus::ParseUploadMetadata("filename YS50eHQ=,filename YS50eHQ=").ok());
    EXPECT_FALSE(tus::ParseUploadMetadata("filename YS50eHQ=,,other").ok());
    EXPECT_FALSE(tus::ParseUploadMetadata("filename YS50 eHQ=").ok());
    EXPECT_FALSE(tus::ParseUploadMetadata("filename !!!!").ok());
}

TEST(TusProtocol, EncodesMetadataInKeyOrder) {
    tidelink::upload::UploadMetadata metadata{
        {"transferId", "t-1"}, {"filename", "report.bin"}, {"flag", ""}};
    EXPECT_EQ(tus::EncodeUploadMetadata(metadata),
              "filename cmVwb3J0LmJpbg==,flag,transferId dC0x");
}

TEST(TusProtocol, EncodedMetadataParsesBack) {
    tidelink::upload::UploadMetadata metadata{{"note", "hello world"}, {"filename", "a.txt"}};
    auto parsed = tus::ParseUploadMetadata(tus::EncodeUploadMetadata(metadata));
    ASSERT_TRUE(parsed.ok());
    EXPECT_EQ(parsed.value(), metadata);
}

TEST(TusProtocol, ParsesUnsignedHeaders) {
    EXPECT_EQ(tus::ParseUnsignedHeader("0", "Upload-Offset").value(), 0u);
    EXPECT_EQ(tus::ParseUnsignedHeader(" 1048576 ", "Upload-Length").value(), 1048576u);
    EXPECT_EQ(tus::ParseUnsignedHeader("18446744073709551615", "Upload-Length").value(),
              18446744073709551615ULL);

    EXPECT_FALSE(tus::ParseUnsignedHeader("", "Upload-Length").ok());
    EXPECT_FALSE(tus::ParseUnsignedHeader("-1", "Upload-Length").ok());
    EXPECT_FALSE(tus::ParseUnsignedHeader("12abc", "Upload-Length").ok());
    EXPECT_FALSE(tus::ParseUnsignedHeader("18446744073709551616", "Upload-Length").ok());
}

TEST(TusProtocol, ProtocolHeadersAdvertiseCapabilities) {
    tidelink::http::HttpResponse response{boost::beast::http::status::no_content, 11};
    tus::ApplyProtocolHeaders(response, 4096);
    EXPECT_EQ(std::string(response["Tus-Resumable"]), "1.0.0");
    EXPECT_EQ(std::string(response["Tus-Version"]), "1.0.0");
    EXPECT_EQ(std::string(response["Tus-Max-Size"]), "4096");
    EXPECT_NE(std::string(response["Tus-Extension"]).find("creation"), std::string::npos);
    EXPECT_NE(std::string(response["Tus-Extension"]).find("termination"), std::string::npos);
    EXPECT_EQ(std::string(response["Access-Control-Allow-Origin"]), "*");
}

TEST(TusProtocol, RecognizesUploadPaths) {
    EXPECT_TRUE(tus::IsUploadPath("/files"));
    EXPECT_TRUE(tus::IsUploadPath("/files/abc"));
    EXPECT_TRUE(tus::IsUploadPath("/files?x=1"));
    EXPECT_FALSE(tus::IsUploadPath("/filesystem"));
    EXPECT_FALSE(tus::IsUploadPath("/transfers/abc/files"));
    EXPECT_FALSE(tus::IsUploadPath("/health"));
}

TEST(TusProtocol, ProtocolHeadersApplyToAnyResponseBody) {
    boost::beast::http::response<boost::beast::http::empty_body> response{
        boost::beast::http::status::payload_too_large, 11};
    tus::ApplyProtocolHeaders(response, 4096);
    EXPECT_EQ(std::string(response["Access-Control-Allow-Origin"]), "*");
    EXPECT_EQ(std::string(response[tus::kHeaderResumable]), "1.0.0");
    EXPECT_EQ(std::string(response[tus::kHeaderMaxSize]), "4096");
}
