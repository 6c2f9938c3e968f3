#include "metadata_cache.hpp"
#include <iostream>
#include <stdexcept>

namespace mediacache {

MetadataCache::MetadataCache(ConnectionManager& connection, std::size_t capacity, bool debug_mode)
    : connection_(connection),
      capacity_(capacity),
      debug_mode_(debug_mode)
{
    if (capacity_ == 0) {
        throw std::invalid_argument("Metadata cache capacity must be greater than zero");
    }

    // Entries fetched under credentials that just expired are not trusted
    reset_listener_id_ = connection_.addResetListener([this]() {
        std::cout << "Clearing metadata cache after connection reset" << std::endl;
        clearAll();
    });
}

MetadataCache::~MetadataCache()
{
    connection_.removeResetListener(reset_listener_id_);
}

std::optional<MetadataRecord> MetadataCache::get(const std::string& object_id)
{
    std::uint64_t epoch;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(object_id);
        if (it != entries_.end()) {
            lru_.splice(lru_.begin(), lru_, it->second.lru_it);
            ++hits_;
            if (debug_mode_) {
                std::cout << "[DEBUG] Metadata cache HIT for: " << object_id << std::endl;
            }
            return it->second.record;
        }
        ++misses_;
        epoch = invalidation_epoch_;
    }

    if (debug_mode_) {
        std::cout << "[DEBUG] Metadata cache MISS for: " << object_id << std::endl;
    }

    // Network I/O happens without the lock held
    std::optional<MetadataRecord> record = connection_.withConnection(
        [&object_id](IObjectStore& store) { return store.fetchMetadata(object_id); });

    if (!record.has_value()) {
        if (debug_mode_) {
            std::cout << "[DEBUG] Object not found: " << object_id << std::endl;
        }
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (epoch == invalidation_epoch_) {
        insertLocked(object_id, *record);
    } else if (debug_mode_) {
        std::cout << "[DEBUG] Not caching metadata for " << object_id
                  << ": invalidated while fetching" << std::endl;
    }
    return record;
}

void MetadataCache::insertLocked(const std::string& object_id, const MetadataRecord& record)
{
    auto it = entries_.find(object_id);
    if (it != entries_.end()) {
        it->second.record = record;
        lru_.splice(lru_.begin(), lru_, it->second.lru_it);
        return;
    }

    lru_.push_front(object_id);
    entries_.emplace(object_id, Node{record, lru_.begin()});

    while (entries_.size() > capacity_) {
        const std::string& victim = lru_.back();
        if (debug_mode_) {
            std::cout << "[DEBUG] Evicting metadata for: " << victim << std::endl;
        }
        entries_.erase(victim);
        lru_.pop_back();
    }
}

void MetadataCache::invalidate(const std::string& object_id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    ++invalidation_epoch_;
    auto it = entries_.find(object_id);
    if (it == entries_.end()) {
        return;
    }
    lru_.erase(it->second.lru_it);
    entries_.erase(it);
}

void MetadataCache::clearAll()
{
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    lru_.clear();
    ++invalidation_epoch_;
}

MetadataCache::Stats MetadataCache::stats() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    Stats stats;
    stats.hits = hits_;
    stats.misses = misses_;
    stats.size = entries_.size();
    stats.capacity = capacity_;
    return stats;
}

} // namespace mediacache
