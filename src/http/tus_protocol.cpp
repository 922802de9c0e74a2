#include "tidelink/http/tus_protocol.h"

#include <limits>
#include <sstream>

#include <Poco/Base64Decoder.h>
#include <Poco/Base64Encoder.h>
#include <Poco/Exception.h>
#include <Poco/StreamCopier.h>

namespace tidelink::http::tus {

namespace {

std::string_view Trim(std::string_view value) {
    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == ' ' || value.back() == '\t')) {
        value.remove_suffix(1);
    }
    return value;
}

core::Result<std::string> DecodeBase64(const std::string& encoded) {
    try {
        std::istringstream in(encoded);
        Poco::Base64Decoder decoder(in);
        std::string decoded;
        Poco::StreamCopier::copyToString(decoder, decoded);
        // Decode errors may surface as a bad stream rather than an exception.
        if (decoder.bad()) {
            return core::Error{core::ErrorCode::kInvalidArgument,
                               "invalid base64 in Upload-Metadata"};
        }
        return decoded;
    } catch (const Poco::Exception& ex) {
        return core::Error{core::ErrorCode::kInvalidArgument,
                           "invalid base64 in Upload-Metadata: " + ex.displayText()};
    }
}

}  // namespace

core::Result<std::uint64_t> ParseUnsignedHeader(std::string_view value, const std::string& name) {
    value = Trim(value);
    if (value.empty()) {
        return core::Error{core::ErrorCode::kInvalidArgument, "missing " + name + " header"};
    }
    std::uint64_t parsed = 0;
    for (const char c : value) {
        if (c < '0' || c > '9') {
            return core::Error{core::ErrorCode::kInvalidArgument, "invalid " + name + " header"};
        }
        const auto digit = static_cast<std::uint64_t>(c - '0');
        if (parsed > (std::numeric_limits<std::uint64_t>::max() - digit) / 10) {
            return core::Error{core::ErrorCode::kInvalidArgument, name + " header out of range"};
        }
        parsed = parsed * 10 + digit;
    }
    return parsed;
}

core::Result<upload::UploadMetadata> ParseUploadMetadata(std::string_view header) {
    upload::UploadMetadata metadata;
    header = Trim(header);
    if (header.empty()) {
        return metadata;
    }

    std::size_t start = 0;
    while (start <= header.size()) {
        const auto comma = header.find(',', start);
        const auto end = comma == std::string_view::npos ? header.size() : comma;
        const auto pair = Trim(header.substr(start, end - start));
        if (pair.empty()) {
            return core::Error{core::ErrorCode::kInvalidArgument, "empty Upload-Metadata entry"};
        }

        const auto space = pair.find(' ');
        const std::string key(pair.substr(0, space));
        std::string value;
        if (space != std::string_view::npos) {
            const auto encoded = Trim(pair.substr(space + 1));
            if (encoded.find(' ') != std::string_view::npos) {
                return core::Error{core::ErrorCode::kInvalidArgument,
                                   "malformed Upload-Metadata entry for " + key};
            }
            auto decoded = DecodeBase64(std::string(encoded));
            if (!decoded.ok()) {
                return decoded.error();
            }
            value = std::move(decoded.value());
        }
        if (!metadata.emplace(key, std::move(value)).second) {
            return core::Error{core::ErrorCode::kInvalidArgument,
                               "duplicate Upload-Metadata key " + key};
        }

        if (comma == std::string_view::npos) {
            break;
        }
        start = comma + 1;
    }
    return metadata;
}

std::string EncodeUploadMetadata(const upload::UploadMetadata& metadata) {
    std::string header;
    for (const auto& entry : metadata) {
        if (!header.empty()) {
            header += ",";
        }
        header += entry.first;
        if (entry.second.empty()) {
            continue;
        }
        std::ostringstream out;
        Poco::Base64Encoder encoder(out);
        encoder.rdbuf()->setLineLength(0);
        encoder << entry.second;
        encoder.close();
        header += " " + out.str();
    }
    return header;
}

bool IsUploadPath(std::string_view target) {
    const auto path = target.substr(0, target.find('?'));
    return path == "/files" || path.rfind("/files/", 0) == 0;
}

void ApplyProtocolHeaders(boost::beast::http::response_header<>& response,
                          std::uint64_t max_size) {
    response.set(kHeaderResumable, kVersion);
    response.set(kHeaderVersion, kVersion);
    response.set(kHeaderExtension, kExtensions);
    response.set(kHeaderMaxSize, std::to_string(max_size));
    response.set("Access-Control-Allow-Origin", "*");
    response.set("Access-Control-Allow-Methods", "POST, PATCH, HEAD, DELETE, OPTIONS");
    response.set("Access-Control-Allow-Headers",
                 "Content-Type, Upload-Length, Upload-Offset, Upload-Metadata, Tus-Resumable, "
                 "Tus-Version, Tus-Extension, Tus-Max-Size, Content-Length");
    response.set("Access-Control-Expose-Headers",
                 "Upload-Offset, Upload-Length, Tus-Resumable, Tus-Version, Tus-Extension, "
                 "Tus-Max-Size, Location, Upload-Metadata");
}

}  // namespace tidelink::http::tus
