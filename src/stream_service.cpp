#include "stream_service.hpp"
#include <chrono>
#include <iostream>
#include <stdexcept>

namespace mediacache {

namespace {
    double elapsedMs(std::chrono::steady_clock::time_point since) {
        return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - since).count();
    }
}

// ==================== Body producers ====================

std::optional<std::string> BufferedBody::next()
{
    if (done_.exchange(true)) {
        return std::nullopt;
    }
    return std::move(content_);
}

ChunkedObjectStream::ChunkedObjectStream(ConnectionManager& connection,
                                         std::string object_id,
                                         std::uint64_t object_size,
                                         std::uint64_t chunk_size,
                                         bool debug_mode,
                                         MissingHandler on_missing)
    : connection_(connection),
      object_id_(std::move(object_id)),
      object_size_(object_size),
      chunk_size_(chunk_size),
      debug_mode_(debug_mode),
      on_missing_(std::move(on_missing))
{
    if (chunk_size_ == 0) {
        throw std::invalid_argument("Streaming chunk size must be greater than zero");
    }
}

std::optional<std::string> ChunkedObjectStream::next()
{
    if (finished_ || cancelled_ || position_ >= object_size_) {
        return std::nullopt;
    }

    const std::uint64_t chunk_start = position_;
    const std::uint64_t chunk_end = std::min(position_ + chunk_size_ - 1, object_size_ - 1);

    if (debug_mode_) {
        std::cout << "[DEBUG] Streaming chunk " << chunk_start << "-" << chunk_end
                  << " of " << object_id_ << std::endl;
    }

    std::string chunk;
    try {
        chunk = connection_.withConnection([&](IObjectStore& store) {
            return store.fetchRange(object_id_, chunk_start, chunk_end);
        });
    } catch (const RemoteError& e) {
        if (e.kind() != RemoteErrorKind::kNotFound) {
            throw;
        }
        finished_ = true;
        if (on_missing_) {
            on_missing_();
        }
        throw NotFoundError(object_id_);
    }

    // Client went away while the fetch was in flight
    if (cancelled_) {
        return std::nullopt;
    }

    if (chunk.empty()) {
        std::cerr << "[WARN] Empty chunk at offset " << chunk_start << " of " << object_id_
                  << " (declared size " << object_size_ << "), stopping stream" << std::endl;
        finished_ = true;
        return std::nullopt;
    }

    const std::uint64_t requested = chunk_end - chunk_start + 1;
    if (chunk.size() > requested) {
        chunk.resize(requested);
    }
    position_ += chunk.size();
    return chunk;
}

std::string StreamResponse::readBody()
{
    std::string content;
    if (!body) {
        return content;
    }
    while (auto piece = body->next()) {
        content += *piece;
    }
    return content;
}

// ==================== StreamService ====================

StreamService::StreamService(ConnectionManager& connection,
                             MetadataCache& metadata_cache,
                             ChunkCache& chunk_cache,
                             const StreamOptions& options,
                             bool debug_mode,
                             bool verbose_logging)
    : connection_(connection),
      metadata_cache_(metadata_cache),
      chunk_cache_(chunk_cache),
      options_(options),
      resolver_(options.range_limits),
      debug_mode_(debug_mode),
      verbose_logging_(verbose_logging)
{
}

MetadataRecord StreamService::requireMetadata(const std::string& object_id)
{
    auto metadata = metadata_cache_.get(object_id);
    if (!metadata.has_value()) {
        throw NotFoundError(object_id);
    }
    return *metadata;
}

std::map<std::string, std::string> StreamService::baseHeaders(const MetadataRecord& metadata) const
{
    std::map<std::string, std::string> headers;
    headers["Content-Type"] = metadata.content_type.empty() ? options_.default_content_type : metadata.content_type;
    headers["Accept-Ranges"] = "bytes";
    headers["Cache-Control"] = "public, max-age=3600";
    if (!metadata.etag.empty()) {
        headers["ETag"] = "\"" + metadata.etag + "\"";
    }
    return headers;
}

StreamResponse StreamService::serve(const std::string& object_id, const std::optional<std::string>& range_header)
{
    if (verbose_logging_) {
        std::cout << "Stream request: " << object_id
                  << (range_header ? " range " + *range_header : std::string(" (whole object)")) << std::endl;
    }

    MetadataRecord metadata = requireMetadata(object_id);

    // Nothing to range over
    if (metadata.size == 0) {
        StreamResponse response;
        response.status = 200;
        response.headers = baseHeaders(metadata);
        response.headers["Content-Length"] = "0";
        response.body = std::make_unique<BufferedBody>(std::string());
        return response;
    }

    if (range_header.has_value()) {
        try {
            RangeWindow window = resolver_.resolve(range_header, metadata.size);
            return serveRange(object_id, metadata, window);
        } catch (const MalformedRangeError& e) {
            std::cerr << "[WARN] " << e.what() << ", serving whole object " << object_id << std::endl;
        }
    }

    return serveWhole(object_id, metadata);
}

StreamResponse StreamService::serveRange(const std::string& object_id,
                                         const MetadataRecord& metadata,
                                         RangeWindow window)
{
    const auto request_start = std::chrono::steady_clock::now();

    auto cached = chunk_cache_.get(object_id, window.start, window.end);
    if (cached.has_value() && !cached->empty()) {
        if (verbose_logging_) {
            std::cout << "Cache HIT for " << object_id << " " << window.start << "-" << window.end
                      << " (" << elapsedMs(request_start) << " ms)" << std::endl;
        }
        return rangeResponse(metadata, window.start, std::move(*cached), "HIT");
    }

    if (debug_mode_) {
        std::cout << "[DEBUG] Cache MISS, fetching " << object_id << " " << window.start << "-" << window.end
                  << " from remote" << std::endl;
    }

    std::string data;
    try {
        data = connection_.withConnection([&](IObjectStore& store) {
            return store.fetchRange(object_id, window.start, window.end);
        });
    } catch (const RemoteError& e) {
        if (e.kind() == RemoteErrorKind::kNotFound) {
            // Deleted since its metadata was cached
            onObjectChanged(object_id);
            throw NotFoundError(object_id);
        }
        std::cerr << "Error reading " << object_id << " [" << window.start << "-" << window.end
                  << "]: " << e.what() << std::endl;
        throw;
    }

    const std::uint64_t expected = window.length();
    const std::uint64_t actual = data.size();

    if (actual == 0) {
        throw ShortReadError(object_id, expected, actual);
    }
    const std::uint64_t difference = actual > expected ? actual - expected : expected - actual;
    if (difference > 1) {
        std::cerr << "Error: length mismatch for " << object_id << ": expected " << expected
                  << ", got " << actual << std::endl;
        throw ContentLengthMismatchError(object_id, window.start, window.end, expected, actual);
    }
    if (actual != expected) {
        std::cerr << "[WARN] Remote returned " << actual << " bytes for a " << expected
                  << "-byte window of " << object_id << ", adjusting" << std::endl;
        // An extra byte would run past the window, so only a short read moves the end
        if (actual > expected) {
            data.resize(expected);
        }
    }

    chunk_cache_.set(object_id, window.start, window.end, data);

    if (verbose_logging_) {
        std::cout << "Fetched " << data.size() << " bytes of " << object_id << " in "
                  << elapsedMs(request_start) << " ms" << std::endl;
    }
    return rangeResponse(metadata, window.start, std::move(data), "MISS");
}

StreamResponse StreamService::rangeResponse(const MetadataRecord& metadata,
                                            std::uint64_t start,
                                            std::string data,
                                            const char* cache_status) const
{
    const std::uint64_t end = start + data.size() - 1;

    StreamResponse response;
    response.status = 206;
    response.headers = baseHeaders(metadata);
    response.headers["Content-Range"] =
        "bytes " + std::to_string(start) + "-" + std::to_string(end) + "/" + std::to_string(metadata.size);
    response.headers["Content-Length"] = std::to_string(data.size());
    response.headers["X-Cache"] = cache_status;
    response.body = std::make_unique<BufferedBody>(std::move(data));
    return response;
}

StreamResponse StreamService::serveWhole(const std::string& object_id, const MetadataRecord& metadata)
{
    StreamResponse response;
    response.status = 200;
    response.headers = baseHeaders(metadata);

    if (metadata.size < options_.full_buffer_threshold_bytes) {
        if (debug_mode_) {
            std::cout << "[DEBUG] Small object, buffering " << object_id << " in memory" << std::endl;
        }
        std::string content;
        try {
            content = connection_.withConnection([&](IObjectStore& store) {
                return store.fetchFull(object_id);
            });
        } catch (const RemoteError& e) {
            if (e.kind() == RemoteErrorKind::kNotFound) {
                onObjectChanged(object_id);
                throw NotFoundError(object_id);
            }
            std::cerr << "Error reading " << object_id << ": " << e.what() << std::endl;
            throw;
        }
        if (content.size() != metadata.size) {
            std::cerr << "[WARN] Size mismatch for " << object_id << ": metadata says " << metadata.size
                      << ", read " << content.size() << std::endl;
        }
        response.headers["Content-Length"] = std::to_string(content.size());
        response.body = std::make_unique<BufferedBody>(std::move(content));
        return response;
    }

    if (debug_mode_) {
        std::cout << "[DEBUG] Large object, streaming " << object_id << " in "
                  << options_.streaming_chunk_bytes << "-byte chunks" << std::endl;
    }
    response.headers["Content-Length"] = std::to_string(metadata.size);
    response.body = std::make_unique<ChunkedObjectStream>(
        connection_, object_id, metadata.size, options_.streaming_chunk_bytes, debug_mode_,
        [this, object_id]() { onObjectChanged(object_id); });
    return response;
}

StreamResponse StreamService::head(const std::string& object_id)
{
    MetadataRecord metadata = requireMetadata(object_id);

    StreamResponse response;
    response.status = 200;
    response.headers = baseHeaders(metadata);
    response.headers["Content-Length"] = std::to_string(metadata.size);
    return response;
}

void StreamService::onObjectChanged(const std::string& object_id)
{
    if (debug_mode_) {
        std::cout << "[DEBUG] Object changed, invalidating caches: " << object_id << std::endl;
    }
    metadata_cache_.invalidate(object_id);
    chunk_cache_.invalidate(object_id);
}

void StreamService::upload(const std::string& object_id, const std::string& content, const std::string& content_type)
{
    if (verbose_logging_) {
        std::cout << "Uploading " << content.size() << " bytes to " << object_id << std::endl;
    }
    try {
        connection_.withConnection([&](IObjectStore& store) {
            store.upload(object_id, content, content_type);
        });
    } catch (...) {
        // A failed write may still have replaced the object
        onObjectChanged(object_id);
        throw;
    }
    onObjectChanged(object_id);
}

void StreamService::remove(const std::string& object_id)
{
    try {
        connection_.withConnection([&](IObjectStore& store) { store.remove(object_id); });
    } catch (const RemoteError& e) {
        onObjectChanged(object_id);
        if (e.kind() == RemoteErrorKind::kNotFound) {
            throw NotFoundError(object_id);
        }
        throw;
    }
    onObjectChanged(object_id);

    if (verbose_logging_) {
        std::cout << "Deleted " << object_id << std::endl;
    }
}

StreamService::HealthReport StreamService::health()
{
    HealthReport report;
    try {
        connection_.withConnection([](IObjectStore& store) { store.ping(); });
        report.healthy = true;
    } catch (const std::exception& e) {
        report.healthy = false;
        report.error = e.what();
        std::cerr << "Remote health check failed: " << e.what() << std::endl;
    }

    report.connection = connection_.status();
    report.metadata = metadata_cache_.stats();
    report.chunks = chunk_cache_.stats();
    return report;
}

} // namespace mediacache
