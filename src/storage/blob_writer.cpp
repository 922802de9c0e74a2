#include "tidelink/storage/blob_writer.h"

#include <cctype>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <system_error>

#ifdef _WIN32
#include <windows.h>
#else
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace tidelink::storage {

namespace {

core::Error Desync(const std::string& id, std::uint64_t expected, std::uint64_t actual) {
    return core::Error{core::ErrorCode::kStorageDesync,
                       "blob " + id + " has length " + std::to_string(actual) + ", expected " +
                           std::to_string(expected)};
}

}  // namespace

BlobWriter::BlobWriter(std::string base_path)
    : root_((std::filesystem::path(base_path) / "uploads").string()) {
    std::filesystem::create_directories(root_);
}

core::Result<void> BlobWriter::CreateEmpty(const std::string& id) {
    if (!IsSafeName(id)) {
        return core::Error{core::ErrorCode::kInvalidArgument, "invalid upload id"};
    }
    const auto path = PathFor(id);
#ifdef _WIN32
    if (std::filesystem::exists(path)) {
        return core::Error{core::ErrorCode::kAlreadyExists, "blob already exists"};
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return core::Error{core::ErrorCode::kIoError, "failed to create blob"};
    }
#else
    const int fd = ::open(path.c_str(), O_CREAT | O_EXCL | O_WRONLY, 0644);
    if (fd < 0) {
        if (errno == EEXIST) {
            return core::Error{core::ErrorCode::kAlreadyExists, "blob already exists"};
        }
        return core::Error{core::ErrorCode::kIoError, "failed to create blob"};
    }
    ::fsync(fd);
    ::close(fd);
#endif
    return core::Ok();
}

core::Result<std::uint64_t> BlobWriter::AppendAt(const std::string& id,
                                                 std::uint64_t expected_length,
                                                 std::string_view bytes) {
    if (!IsSafeName(id)) {
        return core::Error{core::ErrorCode::kInvalidArgument, "invalid upload id"};
    }
    const auto path = PathFor(id);

#ifdef _WIN32
    std::error_code ec;
    const auto actual = std::filesystem::file_size(path, ec);
    if (ec) {
        return core::Error{core::ErrorCode::kNotFound, "blob not found"};
    }
    if (actual != expected_length) {
        return Desync(id, expected_length, actual);
    }
    std::ofstream out(path, std::ios::binary | std::ios::app);
    if (!out.is_open()) {
        return core::Error{core::ErrorCode::kIoError, "failed to open blob"};
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    out.flush();
    if (!out) {
        out.close();
        std::filesystem::resize_file(path, expected_length, ec);
        return core::Error{core::ErrorCode::kIoError, "failed to write blob"};
    }
#else
    const int fd = ::open(path.c_str(), O_WRONLY);
    if (fd < 0) {
        if (errno == ENOENT) {
            return core::Error{core::ErrorCode::kNotFound, "blob not found"};
        }
        return core::Error{core::ErrorCode::kIoError, "failed to open blob"};
    }
    struct stat st {};
    if (::fstat(fd, &st) != 0) {
        ::close(fd);
        return core::Error{core::ErrorCode::kIoError, "failed to stat blob"};
    }
    const auto actual = static_cast<std::uint64_t>(st.st_size);
    if (actual != expected_length) {
        ::close(fd);
        return Desync(id, expected_length, actual);
    }

    // Positional writes never move below expected_length; a failed chunk is cut back
    // so the object length always equals the last committed offset.
    std::uint64_t written_total = 0;
    while (written_total < bytes.size()) {
        const auto position = static_cast<off_t>(expected_length + written_total);
        const ssize_t written =
            ::pwrite(fd, bytes.data() + written_total,
                     static_cast<size_t>(bytes.size() - written_total), position);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            (void)::ftruncate(fd, static_cast<off_t>(expected_length));
            ::close(fd);
            return core::Error{core::ErrorCode::kIoError, "failed to write blob"};
        }
        written_total += static_cast<std::uint64_t>(written);
    }
    if (::fsync(fd) != 0) {
        (void)::ftruncate(fd, static_cast<off_t>(expected_length));
        ::close(fd);
        return core::Error{core::ErrorCode::kIoError, "failed to sync blob"};
    }
    ::close(fd);
#endif
    return expected_length + static_cast<std::uint64_t>(bytes.size());
}

core::Result<std::string> BlobWriter::ReadRange(const std::string& id, std::uint64_t offset,
                                                std::uint64_t length) const {
    auto size = Length(id);
    if (!size.ok()) {
        return size.error();
    }
    if (offset > size.value() || length > size.value() - offset) {
        return core::Error{core::ErrorCode::kInvalidArgument, "range outside blob"};
    }
    std::ifstream in(PathFor(id), std::ios::binary);
    if (!in.is_open()) {
        return core::Error{core::ErrorCode::kIoError, "failed to open blob"};
    }
    in.seekg(static_cast<std::streamoff>(offset));
    std::string out(static_cast<size_t>(length), '\0');
    in.read(out.data(), static_cast<std::streamsize>(length));
    if (static_cast<std::uint64_t>(in.gcount()) != length) {
        return core::Error{core::ErrorCode::kIoError, "short read from blob"};
    }
    return out;
}

core::Result<std::uint64_t> BlobWriter::Length(const std::string& id) const {
    if (!IsSafeName(id)) {
        return core::Error{core::ErrorCode::kInvalidArgument, "invalid upload id"};
    }
    std::error_code ec;
    const auto size = std::filesystem::file_size(PathFor(id), ec);
    if (ec) {
        if (ec == std::errc::no_such_file_or_directory) {
            return core::Error{core::ErrorCode::kNotFound, "blob not found"};
        }
        return core::Error{core::ErrorCode::kIoError, ec.message()};
    }
    return static_cast<std::uint64_t>(size);
}

core::Result<void> BlobWriter::Truncate(const std::string& id, std::uint64_t length) {
    auto size = Length(id);
    if (!size.ok()) {
        return size.error();
    }
    if (size.value() < length) {
        return Desync(id, length, size.value());
    }
    std::error_code ec;
    std::filesystem::resize_file(PathFor(id), length, ec);
    if (ec) {
        return core::Error{core::ErrorCode::kIoError, ec.message()};
    }
    return core::Ok();
}

core::Result<void> BlobWriter::Delete(const std::string& id) {
    if (!IsSafeName(id)) {
        return core::Error{core::ErrorCode::kInvalidArgument, "invalid upload id"};
    }
    std::error_code ec;
    std::filesystem::remove(PathFor(id), ec);
    if (ec) {
        return core::Error{core::ErrorCode::kIoError, ec.message()};
    }
    return core::Ok();
}

std::string BlobWriter::PathFor(const std::string& id) const {
    return (std::filesystem::path(root_) / id).string();
}

bool BlobWriter::IsSafeName(const std::string& name) {
    if (name.empty() || name.size() > 255) {
        return false;
    }
    for (char c : name) {
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.')) {
            return false;
        }
    }
    if (name == "." || name == "..") {
        return false;
    }
    return true;
}

}  // namespace tidelink::storage
