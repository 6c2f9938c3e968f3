#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include "chunk_cache.hpp"
#include "connection_manager.hpp"
#include "metadata_cache.hpp"
#include "range_spec.hpp"

namespace mediacache {

// Source of a response body, drained piece by piece by the HTTP layer
class BodyProducer {
public:
    virtual ~BodyProducer() = default;

    // Next piece of the body, or std::nullopt once the body is complete
    virtual std::optional<std::string> next() = 0;

    // Stop producing; may be called from another thread (client went away)
    virtual void cancel() = 0;
};

// Body already held in memory, produced as one piece
class BufferedBody : public BodyProducer {
public:
    explicit BufferedBody(std::string content) : content_(std::move(content)) {}

    std::optional<std::string> next() override;
    void cancel() override { done_ = true; }

private:
    std::string content_;
    std::atomic<bool> done_{false};
};

/**
 * ChunkedObjectStream - lazy, forward-only body for large objects
 *
 * Each call to next() fetches the following fixed-size window from the remote
 * store. Nothing is fetched ahead and nothing goes through the chunk cache.
 * An empty chunk before the declared size ends the stream early (logged, not
 * an error). After cancel() no further fetches are issued. Not restartable.
 * If the object disappears mid-stream, on_missing runs and next() throws
 * NotFoundError.
 */
class ChunkedObjectStream : public BodyProducer {
public:
    using MissingHandler = std::function<void()>;

    ChunkedObjectStream(ConnectionManager& connection,
                        std::string object_id,
                        std::uint64_t object_size,
                        std::uint64_t chunk_size,
                        bool debug_mode = false,
                        MissingHandler on_missing = nullptr);

    std::optional<std::string> next() override;
    void cancel() override { cancelled_ = true; }

    std::uint64_t position() const { return position_; }
    bool cancelled() const { return cancelled_; }

private:
    ConnectionManager& connection_;
    std::string object_id_;
    std::uint64_t object_size_;
    std::uint64_t chunk_size_;
    bool debug_mode_;
    MissingHandler on_missing_;

    std::uint64_t position_ = 0;
    bool finished_ = false;
    std::atomic<bool> cancelled_{false};
};

struct StreamResponse {
    int status = 200;
    std::map<std::string, std::string> headers;
    // Null for HEAD responses
    std::unique_ptr<BodyProducer> body;

    // Drain the whole body into memory
    std::string readBody();
};

struct StreamOptions {
    RangeLimits range_limits;
    // Whole-object requests below this size are served from one buffer
    std::uint64_t full_buffer_threshold_bytes = 50ULL * 1024 * 1024;
    std::uint64_t streaming_chunk_bytes = 2ULL * 1024 * 1024;
    std::string default_content_type = "video/mp4";
};

/**
 * StreamService - serves byte ranges and whole objects from the remote store
 * through the metadata and chunk caches.
 *
 * The HTTP layer calls serve()/head() per request and onObjectChanged() after
 * any upload, delete or rename it performs itself.
 */
class StreamService {
public:
    struct HealthReport {
        bool healthy = false;
        std::string error;
        ConnectionManager::Status connection;
        MetadataCache::Stats metadata;
        ChunkCache::Stats chunks;
    };

    StreamService(ConnectionManager& connection,
                  MetadataCache& metadata_cache,
                  ChunkCache& chunk_cache,
                  const StreamOptions& options = StreamOptions{},
                  bool debug_mode = false,
                  bool verbose_logging = false);

    /**
     * Serve a range (206) or the whole object (200).
     *
     * A malformed range header falls back to the whole object.
     *
     * @throws NotFoundError if the object does not exist
     * @throws ContentLengthMismatchError / ShortReadError on a bad remote read
     * @throws RemoteUnavailableError if the store cannot be reached
     */
    StreamResponse serve(const std::string& object_id, const std::optional<std::string>& range_header);

    // Headers of a whole-object GET, no body
    StreamResponse head(const std::string& object_id);

    // Drop everything cached about an object
    void onObjectChanged(const std::string& object_id);

    void upload(const std::string& object_id, const std::string& content, const std::string& content_type);
    void remove(const std::string& object_id);

    // Checks connectivity; never throws
    HealthReport health();

    const StreamOptions& options() const { return options_; }

private:
    MetadataRecord requireMetadata(const std::string& object_id);
    std::map<std::string, std::string> baseHeaders(const MetadataRecord& metadata) const;

    StreamResponse serveRange(const std::string& object_id, const MetadataRecord& metadata, RangeWindow window);
    StreamResponse serveWhole(const std::string& object_id, const MetadataRecord& metadata);
    StreamResponse rangeResponse(const MetadataRecord& metadata, std::uint64_t start,
                                 std::string data, const char* cache_status) const;

    ConnectionManager& connection_;
    MetadataCache& metadata_cache_;
    ChunkCache& chunk_cache_;
    StreamOptions options_;
    RangeResolver resolver_;
    bool debug_mode_;
    bool verbose_logging_;
};

} // namespace mediacache
