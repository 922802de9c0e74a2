#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace tidelink::upload {

/// @brief Mutual exclusion keyed by upload id.
///
/// Entries live only while some caller holds or waits for them, and ids hash onto
/// independent shards, so uploads with different ids never contend on one mutex.
class SessionLockTable {
    struct Entry;

public:
    class Guard {
    public:
        Guard(Guard&& other) noexcept;
        Guard& operator=(Guard&&) = delete;
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;
        ~Guard();

    private:
        friend class SessionLockTable;
        Guard(SessionLockTable* table, std::string id, std::shared_ptr<Entry> entry);

        SessionLockTable* table_{nullptr};
        std::string id_;
        std::shared_ptr<Entry> entry_;
    };

    explicit SessionLockTable(std::size_t shard_count = 16);

    /// @brief Block until the caller exclusively owns id.
    Guard Acquire(const std::string& id);
    /// @brief Number of ids currently held or awaited.
    std::size_t ActiveCount() const;

private:
    struct Shard {
        mutable std::mutex mutex;
        std::unordered_map<std::string, std::shared_ptr<Entry>> entries;
    };

    Shard& ShardFor(const std::string& id);
    void Release(const std::string& id, const std::shared_ptr<Entry>& entry);

    std::vector<std::unique_ptr<Shard>> shards_;
};

}  // namespace tidelink::upload
