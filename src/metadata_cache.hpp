#pragma once

#include <cstdint>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include "connection_manager.hpp"
#include "object_store.hpp"

namespace mediacache {

/**
 * MetadataCache - bounded LRU cache of object metadata
 *
 * A miss fetches synchronously through the ConnectionManager and inserts the
 * result before returning it. Objects that do not exist are reported as
 * std::nullopt and are never cached, so a newly created object is visible on
 * the next lookup. There is no TTL: entries leave only through LRU eviction,
 * invalidate(), clearAll(), or a connection reset (which clears everything).
 */
class MetadataCache {
public:
    struct Stats {
        std::uint64_t hits = 0;
        std::uint64_t misses = 0;
        std::size_t size = 0;
        std::size_t capacity = 0;

        double hitRate() const {
            std::uint64_t total = hits + misses;
            return total > 0 ? static_cast<double>(hits) / static_cast<double>(total) : 0.0;
        }
    };

    MetadataCache(ConnectionManager& connection, std::size_t capacity = 1000, bool debug_mode = false);
    ~MetadataCache();

    MetadataCache(const MetadataCache&) = delete;
    MetadataCache& operator=(const MetadataCache&) = delete;

    /**
     * Look up metadata, fetching from the remote store on a miss.
     *
     * @return The record, or std::nullopt if the object does not exist
     * @throws RemoteUnavailableError if the store cannot be reached
     * @throws RemoteError for other remote failures
     */
    std::optional<MetadataRecord> get(const std::string& object_id);

    // Drop one object; must be called after any mutation of that object
    void invalidate(const std::string& object_id);

    void clearAll();

    Stats stats() const;

private:
    struct Node {
        MetadataRecord record;
        std::list<std::string>::iterator lru_it;
    };

    void insertLocked(const std::string& object_id, const MetadataRecord& record);

    ConnectionManager& connection_;
    std::size_t capacity_;
    bool debug_mode_;
    std::size_t reset_listener_id_;

    mutable std::mutex mutex_;
    // Front is most recently used
    std::list<std::string> lru_;
    std::unordered_map<std::string, Node> entries_;
    // Bumped by every invalidate() so an in-flight fetch does not
    // re-insert data that was invalidated while it was on the wire
    std::uint64_t invalidation_epoch_ = 0;
    std::uint64_t hits_ = 0;
    std::uint64_t misses_ = 0;
};

} // namespace mediacache
