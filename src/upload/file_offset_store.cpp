#include "tidelink/upload/file_offset_store.h"

#include <cerrno>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <Poco/JSON/Object.h>
#include <Poco/JSON/Parser.h>
#include <Poco/UUIDGenerator.h>

#include "tidelink/core/time.h"

#ifdef _WIN32
#include <windows.h>
#else
#include <fcntl.h>
#include <unistd.h>
#endif

namespace tidelink::upload {

namespace {

std::string Serialize(const UploadRecord& record) {
    Poco::JSON::Object::Ptr metadata = new Poco::JSON::Object();
    for (const auto& entry : record.metadata) {
        metadata->set(entry.first, entry.second);
    }
    Poco::JSON::Object::Ptr root = new Poco::JSON::Object();
    root->set("id", record.id);
    root->set("size", static_cast<Poco::UInt64>(record.declared_size));
    root->set("offset", static_cast<Poco::UInt64>(record.offset));
    root->set("complete", record.complete);
    root->set("metadata", metadata);
    root->set("created_at", record.created_at);
    std::stringstream ss;
    root->stringify(ss);
    return ss.str();
}

core::Result<UploadRecord> Deserialize(const std::string& body) {
    try {
        Poco::JSON::Parser parser;
        auto root = parser.parse(body).extract<Poco::JSON::Object::Ptr>();
        UploadRecord record;
        record.id = root->getValue<std::string>("id");
        record.declared_size = root->getValue<Poco::UInt64>("size");
        record.offset = root->getValue<Poco::UInt64>("offset");
        record.complete = root->optValue<bool>("complete", false);
        record.created_at = root->optValue<std::string>("created_at", "");
        auto metadata = root->getObject("metadata");
        if (metadata) {
            for (const auto& entry : *metadata) {
                record.metadata[entry.first] = entry.second.convert<std::string>();
            }
        }
        return record;
    } catch (const Poco::Exception& ex) {
        return core::Error{core::ErrorCode::kIoError, "corrupt upload record: " + ex.displayText()};
    }
}

}  // namespace

FileOffsetStore::FileOffsetStore(std::string record_dir) : record_dir_(std::move(record_dir)) {
    std::filesystem::create_directories(record_dir_);
}

core::Result<UploadRecord> FileOffsetStore::Create(const std::string& id,
                                                   std::uint64_t declared_size,
                                                   const UploadMetadata& metadata) {
    if (!IsValidSessionId(id)) {
        return core::Error{core::ErrorCode::kInvalidArgument, "invalid upload id"};
    }
    if (std::filesystem::exists(RecordPath(id))) {
        return core::Error{core::ErrorCode::kAlreadyExists, "upload record exists"};
    }
    UploadRecord record;
    record.id = id;
    record.declared_size = declared_size;
    record.metadata = metadata;
    record.created_at = core::NowIso8601();
    auto written = Write(record);
    if (!written.ok()) {
        return written.error();
    }
    return record;
}

core::Result<UploadRecord> FileOffsetStore::Get(const std::string& id) {
    if (!IsValidSessionId(id)) {
        return core::Error{core::ErrorCode::kNotFound, "upload not found"};
    }
    std::ifstream in(RecordPath(id), std::ios::binary);
    if (!in.is_open()) {
        return core::Error{core::ErrorCode::kNotFound, "upload not found"};
    }
    std::stringstream ss;
    ss << in.rdbuf();
    return Deserialize(ss.str());
}

core::Result<void> FileOffsetStore::Put(const std::string& id, std::uint64_t offset) {
    auto record = Get(id);
    if (!record.ok()) {
        return record.error();
    }
    auto valid = ValidateOffsetUpdate(record.value(), offset);
    if (!valid.ok()) {
        return valid.error();
    }
    record.value().offset = offset;
    return Write(record.value());
}

core::Result<void> FileOffsetStore::MarkComplete(const std::string& id) {
    auto record = Get(id);
    if (!record.ok()) {
        return record.error();
    }
    if (record.value().offset != record.value().declared_size) {
        return core::Error{core::ErrorCode::kInvalidArgument, "upload is not fully written"};
    }
    record.value().complete = true;
    return Write(record.value());
}

core::Result<void> FileOffsetStore::Delete(const std::string& id) {
    if (!IsValidSessionId(id)) {
        return core::Ok();
    }
    std::error_code ec;
    std::filesystem::remove(RecordPath(id), ec);
    if (ec) {
        return core::Error{core::ErrorCode::kIoError, ec.message()};
    }
    return core::Ok();
}

std::string FileOffsetStore::RecordPath(const std::string& id) const {
    return (std::filesystem::path(record_dir_) / (id + ".json")).string();
}

core::Result<void> FileOffsetStore::Write(const UploadRecord& record) {
    const auto body = Serialize(record);
    // The temp file must share the record's filesystem for the rename to be atomic.
    const auto temp_path =
        (std::filesystem::path(record_dir_) /
         ("." + record.id + "." + Poco::UUIDGenerator().createOne().toString() + ".tmp"))
            .string();

#ifdef _WIN32
    {
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return core::Error{core::ErrorCode::kIoError, "failed to open temp record"};
        }
        out.write(body.data(), static_cast<std::streamsize>(body.size()));
        out.flush();
        if (!out) {
            return core::Error{core::ErrorCode::kIoError, "failed to write temp record"};
        }
    }
#else
    const int fd = ::open(temp_path.c_str(), O_CREAT | O_WRONLY | O_TRUNC, 0644);
    if (fd < 0) {
        return core::Error{core::ErrorCode::kIoError, "failed to open temp record"};
    }
    std::size_t written_total = 0;
    while (written_total < body.size()) {
        const ssize_t written =
            ::write(fd, body.data() + written_total, body.size() - written_total);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            ::close(fd);
            std::error_code ignored;
            std::filesystem::remove(temp_path, ignored);
            return core::Error{core::ErrorCode::kIoError, "failed to write temp record"};
        }
        written_total += static_cast<std::size_t>(written);
    }
    if (::fsync(fd) != 0) {
        ::close(fd);
        std::error_code ignored;
        std::filesystem::remove(temp_path, ignored);
        return core::Error{core::ErrorCode::kIoError, "failed to sync temp record"};
    }
    ::close(fd);
#endif

    std::error_code ec;
    std::filesystem::rename(temp_path, RecordPath(record.id), ec);
    if (ec) {
        const auto message = ec.message();
        std::filesystem::remove(temp_path, ec);
        return core::Error{core::ErrorCode::kIoError, "failed to commit upload record: " + message};
    }
#ifndef _WIN32
    // Persist the directory entry so the rename survives a crash.
    const int dir_fd = ::open(record_dir_.c_str(), O_RDONLY | O_DIRECTORY);
    if (dir_fd < 0) {
        return core::Error{core::ErrorCode::kIoError, "failed to open record directory"};
    }
    const int synced = ::fsync(dir_fd);
    ::close(dir_fd);
    if (synced != 0) {
        return core::Error{core::ErrorCode::kIoError, "failed to sync record directory"};
    }
#endif
    return core::Ok();
}

}  // namespace tidelink::upload
