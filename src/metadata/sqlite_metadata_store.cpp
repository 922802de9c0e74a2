#include "tidelink/metadata/sqlite_metadata_store.h"

#include <Poco/Data/SQLite/Connector.h>
#include <Poco/Data/SessionFactory.h>
#include <Poco/Data/Statement.h>

#include "tidelink/core/time.h"

namespace {
using namespace Poco::Data::Keywords;
}

namespace tidelink::metadata {

SqliteMetadataStore::SqliteMetadataStore(const std::string& db_path)
    : session_([](const std::string& path) {
          Poco::Data::SQLite::Connector::registerConnector();
          return Poco::Data::Session("SQLite", path);
      }(db_path)) {
    InitSchema();
}

void SqliteMetadataStore::InitSchema() {
    session_ << "PRAGMA foreign_keys = ON", now;
    session_ << "PRAGMA journal_mode = WAL", now;

    // Schema is created on startup for developer convenience; migrations will replace this later.
    session_ <<
            "CREATE TABLE IF NOT EXISTS transfers ("
            "id TEXT NOT NULL PRIMARY KEY,"
            "title TEXT NOT NULL DEFAULT '',"
            "message TEXT NOT NULL DEFAULT '',"
            "status TEXT NOT NULL DEFAULT 'pending',"
            "expires_at TEXT NOT NULL,"
            "created_at TEXT NOT NULL,"
            "download_count INTEGER NOT NULL DEFAULT 0,"
            "total_size INTEGER NOT NULL DEFAULT 0"
            ")",
        now;

    session_ <<
            "CREATE TABLE IF NOT EXISTS files ("
            "id TEXT NOT NULL PRIMARY KEY,"
            "transfer_id TEXT NOT NULL,"
            "original_name TEXT NOT NULL,"
            "mime_type TEXT NOT NULL,"
            "size INTEGER NOT NULL,"
            "upload_complete INTEGER NOT NULL DEFAULT 0,"
            "created_at TEXT NOT NULL,"
            "FOREIGN KEY(transfer_id) REFERENCES transfers(id) ON DELETE CASCADE"
            ")",
        now;

    session_ << "CREATE INDEX IF NOT EXISTS idx_transfers_expires_at ON transfers(expires_at)",
        now;
    session_ << "CREATE INDEX IF NOT EXISTS idx_files_transfer_id ON files(transfer_id)", now;
}

core::Result<Transfer> SqliteMetadataStore::CreateTransfer(const Transfer& transfer) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        std::string id_value = transfer.id;
        std::string title_value = transfer.title;
        std::string message_value = transfer.message;
        std::string status_value = transfer.status;
        std::string expires_value = transfer.expires_at;
        std::string created_at = core::NowIso8601();
        session_ <<
                "INSERT INTO transfers(id, title, message, status, expires_at, created_at) "
                "VALUES(?, ?, ?, ?, ?, ?)",
            use(id_value), use(title_value), use(message_value), use(status_value),
            use(expires_value), use(created_at), now;
    } catch (const Poco::Exception& ex) {
        // SQLite uniqueness errors surface here; map them to a conflict-like error.
        return core::Error{core::ErrorCode::kAlreadyExists, ex.displayText()};
    }
    return GetTransferLocked(transfer.id);
}

core::Result<Transfer> SqliteMetadataStore::GetTransfer(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return GetTransferLocked(id);
}

core::Result<Transfer> SqliteMetadataStore::GetTransferLocked(const std::string& id) {
    Transfer transfer;
    transfer.status.clear();
    std::string id_value = id;
    try {
        Poco::Data::Statement select(session_);
        select <<
                "SELECT id, title, message, status, expires_at, created_at, download_count, "
                "total_size FROM transfers WHERE id = ?",
            use(id_value), into(transfer.id), into(transfer.title), into(transfer.message),
            into(transfer.status), into(transfer.expires_at), into(transfer.created_at),
            into(transfer.download_count), into(transfer.total_size), now;
    } catch (const Poco::Exception& ex) {
        return core::Error{core::ErrorCode::kDbError, ex.displayText()};
    }

    if (transfer.id.empty()) {
        return core::Error{core::ErrorCode::kNotFound, "transfer not found"};
    }
    return transfer;
}

core::Result<std::vector<Transfer>> SqliteMetadataStore::ListExpiredTransfers(
    const std::string& expires_before, int limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Transfer> transfers;
    Transfer transfer;

    std::string cutoff_value = expires_before;
    std::string deleted_value = kTransferDeleted;
    int limit_value = limit;
    try {
        Poco::Data::Statement select(session_);
        select <<
                "SELECT id, title, message, status, expires_at, created_at, download_count, "
                "total_size FROM transfers WHERE status != ? AND expires_at < ? "
                "ORDER BY expires_at ASC LIMIT ?",
            use(deleted_value), use(cutoff_value), use(limit_value), into(transfer.id),
            into(transfer.title), into(transfer.message), into(transfer.status),
            into(transfer.expires_at), into(transfer.created_at), into(transfer.download_count),
            into(transfer.total_size), range(0, 1);

        while (!select.done()) {
            transfer = {};
            transfer.status.clear();
            select.execute();
            if (select.done() && transfer.id.empty()) {
                break;
            }
            if (!transfer.id.empty()) {
                transfers.push_back(transfer);
            }
        }
    } catch (const Poco::Exception& ex) {
        return core::Error{core::ErrorCode::kDbError, ex.displayText()};
    }

    return transfers;
}

core::Result<void> SqliteMetadataStore::UpdateTransferStatus(const std::string& id,
                                                             const std::string& status) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto existing = GetTransferLocked(id);
    if (!existing.ok()) {
        return existing.error();
    }

    std::string id_value = id;
    std::string status_value = status;
    try {
        Poco::Data::Statement update(session_);
        update << "UPDATE transfers SET status = ? WHERE id = ?", use(status_value),
            use(id_value), now;
    } catch (const Poco::Exception& ex) {
        return core::Error{core::ErrorCode::kDbError, ex.displayText()};
    }
    return core::Ok();
}

core::Result<Transfer> SqliteMetadataStore::CompleteTransfer(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto existing = GetTransferLocked(id);
    if (!existing.ok()) {
        return existing.error();
    }

    std::string id_value = id;
    std::string file_transfer_value = id;
    std::string status_value = kTransferComplete;
    try {
        Poco::Data::Statement update(session_);
        update <<
                "UPDATE transfers SET status = ?, total_size = ("
                "SELECT COALESCE(SUM(size), 0) FROM files "
                "WHERE transfer_id = ? AND upload_complete = 1) WHERE id = ?",
            use(status_value), use(file_transfer_value), use(id_value), now;
    } catch (const Poco::Exception& ex) {
        return core::Error{core::ErrorCode::kDbError, ex.displayText()};
    }
    return GetTransferLocked(id);
}

core::Result<void> SqliteMetadataStore::IncrementDownloadCount(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string id_value = id;
    try {
        Poco::Data::Statement update(session_);
        update << "UPDATE transfers SET download_count = download_count + 1 WHERE id = ?",
            use(id_value), now;
    } catch (const Poco::Exception& ex) {
        return core::Error{core::ErrorCode::kDbError, ex.displayText()};
    }
    return core::Ok();
}

core::Result<FileRecord> SqliteMetadataStore::CreateFile(const FileRecord& file) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        std::string id_value = file.id;
        std::string transfer_value = file.transfer_id;
        std::string name_value = file.original_name;
        std::string mime_value = file.mime_type;
        std::uint64_t size_value = file.size;
        int complete_value = file.upload_complete ? 1 : 0;
        std::string created_at = core::NowIso8601();
        session_ <<
                "INSERT INTO files(id, transfer_id, original_name, mime_type, size, "
                "upload_complete, created_at) VALUES(?, ?, ?, ?, ?, ?, ?)",
            use(id_value), use(transfer_value), use(name_value), use(mime_value),
            use(size_value), use(complete_value), use(created_at), now;
    } catch (const Poco::Exception& ex) {
        return core::Error{core::ErrorCode::kDbError, ex.displayText()};
    }
    return GetFileLocked(file.id);
}

core::Result<FileRecord> SqliteMetadataStore::GetFile(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return GetFileLocked(id);
}

core::Result<FileRecord> SqliteMetadataStore::GetFileLocked(const std::string& id) {
    FileRecord file;
    int complete_value = 0;
    std::string id_value = id;
    try {
        Poco::Data::Statement select(session_);
        select <<
                "SELECT id, transfer_id, original_name, mime_type, size, upload_complete, "
                "created_at FROM files WHERE id = ?",
            use(id_value), into(file.id), into(file.transfer_id), into(file.original_name),
            into(file.mime_type), into(file.size), into(complete_value), into(file.created_at),
            now;
    } catch (const Poco::Exception& ex) {
        return core::Error{core::ErrorCode::kDbError, ex.displayText()};
    }

    if (file.id.empty()) {
        return core::Error{core::ErrorCode::kNotFound, "file not found"};
    }
    file.upload_complete = complete_value != 0;
    return file;
}

core::Result<std::vector<FileRecord>> SqliteMetadataStore::ListFiles(
    const std::string& transfer_id, bool completed_only) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<FileRecord> files;
    FileRecord file;
    int complete_value = 0;

    std::string transfer_value = transfer_id;
    int min_complete = completed_only ? 1 : 0;
    try {
        Poco::Data::Statement select(session_);
        select <<
                "SELECT id, transfer_id, original_name, mime_type, size, upload_complete, "
                "created_at FROM files WHERE transfer_id = ? AND upload_complete >= ? "
                "ORDER BY created_at ASC, id ASC",
            use(transfer_value), use(min_complete), into(file.id), into(file.transfer_id),
            into(file.original_name), into(file.mime_type), into(file.size),
            into(complete_value), into(file.created_at), range(0, 1);

        while (!select.done()) {
            file = {};
            complete_value = 0;
            select.execute();
            if (select.done() && file.id.empty()) {
                break;
            }
            if (!file.id.empty()) {
                file.upload_complete = complete_value != 0;
                files.push_back(file);
            }
        }
    } catch (const Poco::Exception& ex) {
        return core::Error{core::ErrorCode::kDbError, ex.displayText()};
    }

    return files;
}

core::Result<void> SqliteMetadataStore::MarkFileComplete(const std::string& id,
                                                         std::uint64_t final_size) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto existing = GetFileLocked(id);
    if (!existing.ok()) {
        return existing.error();
    }

    std::string id_value = id;
    std::uint64_t size_value = final_size;
    try {
        Poco::Data::Statement update(session_);
        update << "UPDATE files SET upload_complete = 1, size = ? WHERE id = ?",
            use(size_value), use(id_value), now;
    } catch (const Poco::Exception& ex) {
        return core::Error{core::ErrorCode::kDbError, ex.displayText()};
    }
    return core::Ok();
}

core::Result<void> SqliteMetadataStore::DeleteFile(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string id_value = id;
    try {
        Poco::Data::Statement del(session_);
        del << "DELETE FROM files WHERE id = ?", use(id_value), now;
    } catch (const Poco::Exception& ex) {
        return core::Error{core::ErrorCode::kDbError, ex.displayText()};
    }
    return core::Ok();
}

}  // namespace tidelink::metadata
