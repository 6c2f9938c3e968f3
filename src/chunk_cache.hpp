#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace mediacache {

/**
 * ChunkEntryInfo - snapshot of one cached byte window
 */
struct ChunkEntryInfo {
    std::string key;
    std::string object_id;
    std::uint64_t start = 0;
    std::uint64_t end = 0;
    std::uint64_t size_bytes = 0;
    std::filesystem::path storage_path;
    std::chrono::system_clock::time_point created_at;
    std::chrono::system_clock::time_point last_access_at;
    std::uint64_t hit_count = 0;
};

/**
 * ChunkCache - disk-backed cache of byte windows of remote objects
 *
 * Each entry is keyed by SHA-256 of (object id, start, end) and stored as one
 * <key>.chunk file plus a small YAML <key>.meta sidecar naming the object and
 * window, so the cache can be rebuilt from its directory after a restart.
 * Overlapping windows are independent entries.
 *
 * The in-memory index keeps LRU order by last access. Before an insert that
 * would exceed the budget, least recently used entries are evicted until usage
 * is at most min(80% of budget, budget - incoming size).
 *
 * One mutex guards the index. Reads of a hit's file happen outside it. An
 * entry whose file has disappeared is dropped from the index on the next get
 * and reported as a miss.
 *
 * The cache directory belongs to this object; nothing else may write there.
 */
class ChunkCache {
public:
    struct Stats {
        std::size_t items = 0;
        std::uint64_t bytes_used = 0;
        std::uint64_t budget_bytes = 0;
        std::uint64_t hits = 0;
        std::uint64_t misses = 0;
        std::string cache_dir;

        double utilization() const {
            return budget_bytes > 0
                ? static_cast<double>(bytes_used) * 100.0 / static_cast<double>(budget_bytes)
                : 0.0;
        }
        double hitRate() const {
            std::uint64_t total = hits + misses;
            return total > 0 ? static_cast<double>(hits) / static_cast<double>(total) : 0.0;
        }
    };

    struct DetailedStats {
        Stats summary;
        // Sorted by hit count, highest first
        std::vector<ChunkEntryInfo> top_entries;
    };

    ChunkCache(const std::filesystem::path& cache_dir,
               std::uint64_t budget_bytes,
               bool debug_mode = false,
               bool verbose_logging = false);

    ChunkCache(const ChunkCache&) = delete;
    ChunkCache& operator=(const ChunkCache&) = delete;

    // Returns the cached bytes for exactly this window, or std::nullopt
    std::optional<std::string> get(const std::string& object_id, std::uint64_t start, std::uint64_t end);

    /**
     * Store bytes for a window, replacing any previous entry for it.
     *
     * @return false if the data was not cached (larger than the whole budget,
     *         or the disk write failed)
     */
    bool set(const std::string& object_id, std::uint64_t start, std::uint64_t end, const std::string& data);

    // Remove every entry derived from object_id
    void invalidate(const std::string& object_id);

    void clear();

    Stats stats() const;

    DetailedStats detailedStats(std::size_t top_n = 10) const;

    // Index entry for a window without touching LRU order or hit counts
    std::optional<ChunkEntryInfo> lookup(const std::string& object_id, std::uint64_t start, std::uint64_t end) const;

    static std::string makeKey(const std::string& object_id, std::uint64_t start, std::uint64_t end);

private:
    struct Entry {
        ChunkEntryInfo info;
        std::list<std::string>::iterator lru_it;
        // Distinguishes an entry from a later one stored under the same key
        std::uint64_t generation = 0;
    };

    using EntryMap = std::unordered_map<std::string, Entry>;

    std::filesystem::path chunkPath(const std::string& key) const;
    std::filesystem::path metaPath(const std::string& key) const;

    void loadExisting();
    void insertLocked(ChunkEntryInfo info);
    void eraseLocked(EntryMap::iterator it, bool remove_files);
    void evictLocked(std::uint64_t incoming_size);
    void dropIfCurrent(const std::string& key, std::uint64_t generation, bool remove_files);

    std::filesystem::path cache_dir_;
    std::uint64_t budget_bytes_;
    bool debug_mode_;
    bool verbose_logging_;

    mutable std::mutex mutex_;
    // Front is most recently used
    std::list<std::string> lru_;
    EntryMap entries_;
    std::unordered_map<std::string, std::unordered_set<std::string>> keys_by_object_;
    std::uint64_t total_bytes_ = 0;
    std::uint64_t next_generation_ = 0;
    std::uint64_t hits_ = 0;
    std::uint64_t misses_ = 0;

    std::atomic<std::uint64_t> temp_counter_{0};
};

} // namespace mediacache
