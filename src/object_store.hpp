#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include "errors.hpp"

namespace mediacache {

/**
 * MetadataRecord - what the cache layer knows about one remote object.
 * Immutable once built; replaced wholesale on re-fetch.
 */
struct MetadataRecord {
    std::string name;
    std::uint64_t size = 0;
    std::string content_type;
    std::string etag;
    std::string md5_hash;
    std::chrono::system_clock::time_point updated;
    std::map<std::string, std::string> attributes;
    std::chrono::system_clock::time_point fetched_at;
};

// Interface for the remote object store holding the media objects.
// Every failure is raised as RemoteError with a RemoteErrorKind, so callers
// can react to the kind without knowing which SDK sits underneath.
class IObjectStore {
public:
    virtual ~IObjectStore() = default;

    virtual bool exists(const std::string& object_id) = 0;

    // Returns std::nullopt when the object does not exist
    virtual std::optional<MetadataRecord> fetchMetadata(const std::string& object_id) = 0;

    // Read bytes [start, end] (end inclusive). The store may return fewer
    // bytes near the end of the object.
    virtual std::string fetchRange(const std::string& object_id,
                                   std::uint64_t start,
                                   std::uint64_t end) = 0;

    virtual std::string fetchFull(const std::string& object_id) = 0;

    virtual void upload(const std::string& object_id,
                        const std::string& content,
                        const std::string& content_type) = 0;

    virtual void remove(const std::string& object_id) = 0;

    // Cheap connectivity check; throws RemoteError on failure
    virtual void ping() = 0;

    // Bucket or other location this store serves, for status reporting
    virtual std::string location() const = 0;
};

// In-memory store - serves predefined data, for offline runs and tests
class DummyObjectStore : public IObjectStore {
public:
    DummyObjectStore() = default;

    void setMockData(const std::string& object_id,
                     const std::string& content,
                     const std::string& content_type = "video/mp4") {
        std::lock_guard<std::mutex> lock(mutex_);
        Object& object = objects_[object_id];
        object.content = content;
        object.content_type = content_type;
        object.generation++;
    }

    // Add every regular file under dir, named by its path relative to dir.
    // Returns the number of objects added.
    std::size_t loadDirectory(const std::filesystem::path& dir) {
        namespace fs = std::filesystem;
        std::size_t loaded = 0;
        for (const auto& entry : fs::recursive_directory_iterator(dir)) {
            if (!entry.is_regular_file()) {
                continue;
            }
            std::ifstream file(entry.path(), std::ios::binary);
            if (!file) {
                throw std::runtime_error("Cannot read " + entry.path().string());
            }
            std::string content{std::istreambuf_iterator<char>{file}, {}};
            setMockData(fs::relative(entry.path(), dir).generic_string(), content,
                        contentTypeFor(entry.path()));
            ++loaded;
        }
        return loaded;
    }

    bool exists(const std::string& object_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        return objects_.count(object_id) > 0;
    }

    std::optional<MetadataRecord> fetchMetadata(const std::string& object_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = objects_.find(object_id);
        if (it == objects_.end()) {
            return std::nullopt;
        }

        MetadataRecord record;
        record.name = object_id;
        record.size = it->second.content.size();
        record.content_type = it->second.content_type;
        record.etag = object_id + "-" + std::to_string(it->second.generation);
        record.updated = std::chrono::system_clock::now();
        record.fetched_at = record.updated;
        return record;
    }

    std::string fetchRange(const std::string& object_id,
                           std::uint64_t start,
                           std::uint64_t end) override {
        std::lock_guard<std::mutex> lock(mutex_);
        const std::string& content = find(object_id).content;
        if (start >= content.size() || end < start) {
            return "";
        }
        return content.substr(start, end - start + 1);
    }

    std::string fetchFull(const std::string& object_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        return find(object_id).content;
    }

    void upload(const std::string& object_id,
                const std::string& content,
                const std::string& content_type) override {
        setMockData(object_id, content, content_type);
    }

    void remove(const std::string& object_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (objects_.erase(object_id) == 0) {
            throw RemoteError(RemoteErrorKind::kNotFound, object_id, "no such object");
        }
    }

    void ping() override {}

    std::string location() const override { return "dummy"; }

private:
    struct Object {
        std::string content;
        std::string content_type;
        std::uint64_t generation = 0;
    };

    const Object& find(const std::string& object_id) const {
        auto it = objects_.find(object_id);
        if (it == objects_.end()) {
            throw RemoteError(RemoteErrorKind::kNotFound, object_id, "no such object");
        }
        return it->second;
    }

    static std::string contentTypeFor(const std::filesystem::path& path) {
        static const std::map<std::string, std::string> types = {
            {".mp4", "video/mp4"},
            {".m4v", "video/mp4"},
            {".mov", "video/quicktime"},
            {".webm", "video/webm"},
            {".mkv", "video/x-matroska"},
            {".mp3", "audio/mpeg"},
            {".m4a", "audio/mp4"},
        };
        auto it = types.find(path.extension().string());
        return it != types.end() ? it->second : "application/octet-stream";
    }

    std::mutex mutex_;
    std::unordered_map<std::string, Object> objects_;
};

} // namespace mediacache
