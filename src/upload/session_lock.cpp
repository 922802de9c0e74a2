#include "tidelink/upload/session_lock.h"

#include <functional>

namespace tidelink::upload {

struct SessionLockTable::Entry {
    std::mutex mutex;
    // Guarded by the owning shard mutex.
    std::size_t users{0};
};

SessionLockTable::Guard::Guard(SessionLockTable* table, std::string id,
                               std::shared_ptr<Entry> entry)
    : table_(table), id_(std::move(id)), entry_(std::move(entry)) {}

SessionLockTable::Guard::Guard(Guard&& other) noexcept
    : table_(other.table_), id_(std::move(other.id_)), entry_(std::move(other.entry_)) {
    other.table_ = nullptr;
}

SessionLockTable::Guard::~Guard() {
    if (table_ && entry_) {
        entry_->mutex.unlock();
        table_->Release(id_, entry_);
    }
}

SessionLockTable::SessionLockTable(std::size_t shard_count) {
    if (shard_count == 0) {
        shard_count = 1;
    }
    shards_.reserve(shard_count);
    for (std::size_t i = 0; i < shard_count; ++i) {
        shards_.push_back(std::make_unique<Shard>());
    }
}

SessionLockTable::Guard SessionLockTable::Acquire(const std::string& id) {
    std::shared_ptr<Entry> entry;
    {
        auto& shard = ShardFor(id);
        std::lock_guard<std::mutex> lock(shard.mutex);
        auto& slot = shard.entries[id];
        if (!slot) {
            slot = std::make_shared<Entry>();
        }
        ++slot->users;
        entry = slot;
    }
    // Wait outside the shard mutex so other ids in the shard stay available.
    entry->mutex.lock();
    return Guard(this, id, std::move(entry));
}

std::size_t SessionLockTable::ActiveCount() const {
    std::size_t total = 0;
    for (const auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        total += shard->entries.size();
    }
    return total;
}

SessionLockTable::Shard& SessionLockTable::ShardFor(const std::string& id) {
    return *shards_[std::hash<std::string>{}(id) % shards_.size()];
}

void SessionLockTable::Release(const std::string& id,
                               const std::shared_ptr<Entry>& entry) {
    auto& shard = ShardFor(id);
    std::lock_guard<std::mutex> lock(shard.mutex);
    if (--entry->users == 0) {
        shard.entries.erase(id);
    }
}

}  // namespace tidelink::upload
