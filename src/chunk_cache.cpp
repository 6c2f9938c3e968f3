#include "chunk_cache.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <openssl/evp.h>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

namespace mediacache {

namespace {
    constexpr char kChunkExtension[] = ".chunk";
    constexpr char kMetaExtension[] = ".meta";
    constexpr char kTempMarker[] = ".tmp";

    std::chrono::system_clock::time_point toSystemTime(fs::file_time_type file_time) {
        return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
            file_time - fs::file_time_type::clock::now() + std::chrono::system_clock::now());
    }

    std::int64_t toEpochSeconds(std::chrono::system_clock::time_point tp) {
        return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
    }

    bool writeFile(const fs::path& path, const std::string& content) {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return false;
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.close();
        return out.good();
    }

    std::optional<std::string> readFile(const fs::path& path) {
        std::ifstream in(path, std::ios::binary);
        if (!in.is_open()) {
            return std::nullopt;
        }
        std::string content{std::istreambuf_iterator<char>{in}, {}};
        if (in.bad()) {
            return std::nullopt;
        }
        return content;
    }

    void removeQuietly(const fs::path& path) {
        std::error_code ec;
        fs::remove(path, ec);
        if (ec) {
            std::cerr << "[WARN] Failed to delete cache file " << path << ": " << ec.message() << std::endl;
        }
    }

    std::string shortKey(const std::string& key) {
        return key.substr(0, 16) + "...";
    }
}

ChunkCache::ChunkCache(const fs::path& cache_dir,
                       std::uint64_t budget_bytes,
                       bool debug_mode,
                       bool verbose_logging)
    : cache_dir_(cache_dir),
      budget_bytes_(budget_bytes),
      debug_mode_(debug_mode),
      verbose_logging_(verbose_logging)
{
    if (budget_bytes_ == 0) {
        throw std::invalid_argument("Chunk cache budget must be greater than zero");
    }
    fs::create_directories(cache_dir_);
    loadExisting();

    std::cout << "Chunk cache initialized: " << cache_dir_.string()
              << " (budget: " << budget_bytes_ / (1024 * 1024) << " MB, "
              << entries_.size() << " entries loaded)" << std::endl;
}

std::string ChunkCache::makeKey(const std::string& object_id, std::uint64_t start, std::uint64_t end)
{
    const std::string material = object_id + ":" + std::to_string(start) + ":" + std::to_string(end);

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_Digest(material.data(), material.size(), digest, &digest_len, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA-256 digest failed for cache key");
    }

    std::ostringstream hex;
    hex << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < digest_len; ++i) {
        hex << std::setw(2) << static_cast<int>(digest[i]);
    }
    return hex.str();
}

fs::path ChunkCache::chunkPath(const std::string& key) const
{
    return cache_dir_ / (key + kChunkExtension);
}

fs::path ChunkCache::metaPath(const std::string& key) const
{
    return cache_dir_ / (key + kMetaExtension);
}

void ChunkCache::loadExisting()
{
    std::vector<ChunkEntryInfo> loaded;

    for (const auto& dir_entry : fs::directory_iterator(cache_dir_)) {
        if (!dir_entry.is_regular_file()) {
            continue;
        }
        const fs::path& path = dir_entry.path();
        const std::string filename = path.filename().string();

        // Leftovers from a write interrupted by a crash
        if (filename.find(kTempMarker) != std::string::npos) {
            removeQuietly(path);
            continue;
        }
        if (path.extension() == kMetaExtension) {
            if (!fs::exists(chunkPath(path.stem().string()))) {
                removeQuietly(path);
            }
            continue;
        }
        if (path.extension() != kChunkExtension) {
            continue;
        }

        const std::string key = path.stem().string();
        const fs::path meta = metaPath(key);
        try {
            YAML::Node node = YAML::LoadFile(meta.string());
            ChunkEntryInfo info;
            info.key = key;
            info.object_id = node["object_id"].as<std::string>();
            info.start = node["start"].as<std::uint64_t>();
            info.end = node["end"].as<std::uint64_t>();
            info.created_at = std::chrono::system_clock::time_point(
                std::chrono::seconds(node["created"].as<std::int64_t>()));
            info.size_bytes = fs::file_size(path);
            info.storage_path = path;
            info.last_access_at = toSystemTime(fs::last_write_time(path));

            if (makeKey(info.object_id, info.start, info.end) != key) {
                throw std::runtime_error("key does not match recorded window");
            }
            loaded.push_back(std::move(info));
        } catch (const std::exception& e) {
            std::cerr << "[WARN] Dropping unreadable cache entry " << filename << ": " << e.what() << std::endl;
            removeQuietly(path);
            removeQuietly(meta);
        }
    }

    // Oldest first, so the most recently used ends up at the front
    std::sort(loaded.begin(), loaded.end(), [](const ChunkEntryInfo& a, const ChunkEntryInfo& b) {
        return a.last_access_at < b.last_access_at;
    });

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& info : loaded) {
        insertLocked(std::move(info));
    }

    if (total_bytes_ > budget_bytes_) {
        std::cout << "Loaded cache exceeds budget (" << total_bytes_ << " > " << budget_bytes_
                  << " bytes), cleaning up..." << std::endl;
        evictLocked(0);
    }
}

void ChunkCache::insertLocked(ChunkEntryInfo info)
{
    const std::string key = info.key;
    auto existing = entries_.find(key);
    if (existing != entries_.end()) {
        // Files were already replaced by the caller
        eraseLocked(existing, false);
    }

    lru_.push_front(key);
    keys_by_object_[info.object_id].insert(key);
    total_bytes_ += info.size_bytes;

    Entry entry;
    entry.info = std::move(info);
    entry.lru_it = lru_.begin();
    entry.generation = ++next_generation_;
    entries_.emplace(key, std::move(entry));
}

void ChunkCache::eraseLocked(EntryMap::iterator it, bool remove_files)
{
    const Entry& entry = it->second;

    auto by_object = keys_by_object_.find(entry.info.object_id);
    if (by_object != keys_by_object_.end()) {
        by_object->second.erase(it->first);
        if (by_object->second.empty()) {
            keys_by_object_.erase(by_object);
        }
    }

    if (remove_files) {
        removeQuietly(entry.info.storage_path);
        removeQuietly(metaPath(it->first));
    }

    total_bytes_ -= entry.info.size_bytes;
    lru_.erase(entry.lru_it);
    entries_.erase(it);
}

void ChunkCache::evictLocked(std::uint64_t incoming_size)
{
    std::uint64_t target = budget_bytes_ - budget_bytes_ / 5;
    if (incoming_size > 0) {
        target = std::min(target, budget_bytes_ - incoming_size);
    }

    std::size_t removed_count = 0;
    std::uint64_t removed_bytes = 0;

    while (total_bytes_ > target && !lru_.empty()) {
        auto victim = entries_.find(lru_.back());
        removed_bytes += victim->second.info.size_bytes;
        ++removed_count;
        if (debug_mode_) {
            std::cout << "[DEBUG] Evicting chunk " << shortKey(victim->first)
                      << " (" << victim->second.info.object_id << " "
                      << victim->second.info.start << "-" << victim->second.info.end << ")" << std::endl;
        }
        eraseLocked(victim, true);
    }

    if (removed_count > 0) {
        std::cout << "Evicted " << removed_count << " chunks (" << removed_bytes << " bytes), "
                  << total_bytes_ << " bytes remain" << std::endl;
    }
}

std::optional<std::string> ChunkCache::get(const std::string& object_id, std::uint64_t start, std::uint64_t end)
{
    const std::string key = makeKey(object_id, start, end);

    fs::path path;
    std::uint64_t expected_size = 0;
    std::uint64_t generation = 0;
    std::uint64_t hit_count = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            ++misses_;
            if (debug_mode_) {
                std::cout << "[DEBUG] Chunk cache MISS: " << object_id << " " << start << "-" << end << std::endl;
            }
            return std::nullopt;
        }

        Entry& entry = it->second;
        entry.info.last_access_at = std::chrono::system_clock::now();
        entry.info.hit_count++;
        lru_.splice(lru_.begin(), lru_, entry.lru_it);
        ++hits_;

        path = entry.info.storage_path;
        expected_size = entry.info.size_bytes;
        generation = entry.generation;
        hit_count = entry.info.hit_count;
    }

    // Disk read happens without the lock held
    std::optional<std::string> data = readFile(path);
    if (!data.has_value()) {
        std::cerr << "[WARN] Cache file missing, dropping entry: " << path.string() << std::endl;
        dropIfCurrent(key, generation, false);
        return std::nullopt;
    }
    if (data->size() != expected_size) {
        std::cerr << "[WARN] Cache file " << path.string() << " has " << data->size()
                  << " bytes, index says " << expected_size << "; dropping entry" << std::endl;
        dropIfCurrent(key, generation, true);
        return std::nullopt;
    }

    // Keeps LRU order meaningful across restarts
    std::error_code ec;
    fs::last_write_time(path, fs::file_time_type::clock::now(), ec);

    if (debug_mode_) {
        std::cout << "[DEBUG] Chunk cache HIT: " << object_id << " " << start << "-" << end
                  << " (" << data->size() << " bytes, hits: " << hit_count << ")" << std::endl;
    }
    return data;
}

void ChunkCache::dropIfCurrent(const std::string& key, std::uint64_t generation, bool remove_files)
{
    std::lock_guard<std::mutex> lock(mutex_);
    // The hit was counted before the read failed
    if (hits_ > 0) {
        --hits_;
    }
    ++misses_;

    auto it = entries_.find(key);
    if (it == entries_.end() || it->second.generation != generation) {
        return;
    }
    eraseLocked(it, remove_files);
}

bool ChunkCache::set(const std::string& object_id, std::uint64_t start, std::uint64_t end, const std::string& data)
{
    const std::uint64_t size = data.size();
    if (size > budget_bytes_) {
        std::cerr << "[WARN] Not caching " << object_id << " " << start << "-" << end << ": "
                  << size << " bytes exceeds the whole cache budget" << std::endl;
        return false;
    }

    const std::string key = makeKey(object_id, start, end);
    const auto now = std::chrono::system_clock::now();

    YAML::Emitter meta;
    meta << YAML::BeginMap;
    meta << YAML::Key << "object_id" << YAML::Value << object_id;
    meta << YAML::Key << "start" << YAML::Value << start;
    meta << YAML::Key << "end" << YAML::Value << end;
    meta << YAML::Key << "created" << YAML::Value << toEpochSeconds(now);
    meta << YAML::EndMap;

    // Write to private temp names first; only the rename happens under the lock
    const std::string suffix = kTempMarker + std::to_string(temp_counter_.fetch_add(1));
    const fs::path chunk_tmp = cache_dir_ / (key + kChunkExtension + suffix);
    const fs::path meta_tmp = cache_dir_ / (key + kMetaExtension + suffix);

    if (!writeFile(chunk_tmp, data) || !writeFile(meta_tmp, meta.c_str())) {
        std::cerr << "[WARN] Failed to write cache entry for " << object_id << " " << start << "-" << end << std::endl;
        removeQuietly(chunk_tmp);
        removeQuietly(meta_tmp);
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    std::uint64_t projected = total_bytes_ + size;
    auto existing = entries_.find(key);
    if (existing != entries_.end()) {
        projected -= existing->second.info.size_bytes;
        eraseLocked(existing, false);
    }
    if (projected > budget_bytes_) {
        if (verbose_logging_) {
            std::cout << "Chunk cache full (" << total_bytes_ << " bytes), cleaning up..." << std::endl;
        }
        evictLocked(size);
    }

    std::error_code ec;
    fs::rename(chunk_tmp, chunkPath(key), ec);
    if (!ec) {
        fs::rename(meta_tmp, metaPath(key), ec);
    }
    if (ec) {
        std::cerr << "[WARN] Failed to move cache entry into place for " << object_id << ": "
                  << ec.message() << std::endl;
        removeQuietly(chunk_tmp);
        removeQuietly(meta_tmp);
        removeQuietly(chunkPath(key));
        return false;
    }

    ChunkEntryInfo info;
    info.key = key;
    info.object_id = object_id;
    info.start = start;
    info.end = end;
    info.size_bytes = size;
    info.storage_path = chunkPath(key);
    info.created_at = now;
    info.last_access_at = now;
    insertLocked(std::move(info));

    if (verbose_logging_) {
        std::cout << "Cached " << size << " bytes for " << object_id << " " << start << "-" << end
                  << " (total: " << total_bytes_ << " bytes)" << std::endl;
    }
    return true;
}

void ChunkCache::invalidate(const std::string& object_id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto by_object = keys_by_object_.find(object_id);
    if (by_object == keys_by_object_.end()) {
        return;
    }

    // eraseLocked edits the reverse index, so work from a copy
    const std::vector<std::string> keys(by_object->second.begin(), by_object->second.end());
    for (const auto& key : keys) {
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            eraseLocked(it, true);
        }
    }

    if (debug_mode_) {
        std::cout << "[DEBUG] Invalidated " << keys.size() << " chunks for " << object_id << std::endl;
    }
}

void ChunkCache::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    const std::size_t removed_count = entries_.size();
    const std::uint64_t removed_bytes = total_bytes_;

    while (!entries_.empty()) {
        eraseLocked(entries_.begin(), true);
    }

    std::cout << "Chunk cache cleared: " << removed_count << " files (" << removed_bytes << " bytes)" << std::endl;
}

ChunkCache::Stats ChunkCache::stats() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    Stats stats;
    stats.items = entries_.size();
    stats.bytes_used = total_bytes_;
    stats.budget_bytes = budget_bytes_;
    stats.hits = hits_;
    stats.misses = misses_;
    stats.cache_dir = cache_dir_.string();
    return stats;
}

ChunkCache::DetailedStats ChunkCache::detailedStats(std::size_t top_n) const
{
    DetailedStats detailed;
    detailed.summary = stats();

    std::lock_guard<std::mutex> lock(mutex_);
    detailed.top_entries.reserve(entries_.size());
    for (const auto& [key, entry] : entries_) {
        detailed.top_entries.push_back(entry.info);
    }

    std::sort(detailed.top_entries.begin(), detailed.top_entries.end(),
              [](const ChunkEntryInfo& a, const ChunkEntryInfo& b) { return a.hit_count > b.hit_count; });
    if (detailed.top_entries.size() > top_n) {
        detailed.top_entries.resize(top_n);
    }
    return detailed;
}

std::optional<ChunkEntryInfo> ChunkCache::lookup(const std::string& object_id,
                                                 std::uint64_t start,
                                                 std::uint64_t end) const
{
    const std::string key = makeKey(object_id, start, end);
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.info;
}

} // namespace mediacache
