#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace mediacache {

/**
 * Base class for every error raised by the cache layer.
 * Configuration problems stay plain std::runtime_error.
 */
class MediaCacheError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Range header did not match "bytes=<start>-<end?>"; callers fall back to the whole object
class MalformedRangeError : public MediaCacheError {
public:
    explicit MalformedRangeError(const std::string& header)
        : MediaCacheError("Malformed range header: '" + header + "'"),
          header_(header) {}

    const std::string& header() const { return header_; }

private:
    std::string header_;
};

// Object is absent from the store
class NotFoundError : public MediaCacheError {
public:
    explicit NotFoundError(const std::string& object_id)
        : MediaCacheError("Object not found: " + object_id),
          object_id_(object_id) {}

    const std::string& objectId() const { return object_id_; }

private:
    std::string object_id_;
};

/**
 * Classification of a failed remote call. The connection manager decides
 * whether to rebuild the connection by looking at this, never at SDK types.
 */
enum class RemoteErrorKind {
    kAuthExpired,
    kNotFound,
    kPermissionDenied,
    kTransient,
    kOther
};

inline const char* toString(RemoteErrorKind kind);

class RemoteError : public MediaCacheError {
public:
    RemoteError(RemoteErrorKind kind, const std::string& object_id, const std::string& message)
        : MediaCacheError(std::string(toString(kind)) + " (" + object_id + "): " + message),
          kind_(kind),
          object_id_(object_id) {}

    RemoteErrorKind kind() const { return kind_; }
    const std::string& objectId() const { return object_id_; }

private:
    RemoteErrorKind kind_;
    std::string object_id_;
};

// Transport failure, timeout, or repeated authentication failure
class RemoteUnavailableError : public MediaCacheError {
public:
    using MediaCacheError::MediaCacheError;
};

// Remote returned fewer bytes than the window asked for
class ShortReadError : public MediaCacheError {
public:
    ShortReadError(const std::string& object_id, std::uint64_t expected, std::uint64_t actual)
        : MediaCacheError("Short read for " + object_id + ": expected " + std::to_string(expected) +
                          " bytes, got " + std::to_string(actual)),
          expected_(expected),
          actual_(actual) {}

    std::uint64_t expected() const { return expected_; }
    std::uint64_t actual() const { return actual_; }

private:
    std::uint64_t expected_;
    std::uint64_t actual_;
};

// Remote length differs from the window by more than the one byte we tolerate
class ContentLengthMismatchError : public MediaCacheError {
public:
    ContentLengthMismatchError(const std::string& object_id, std::uint64_t start, std::uint64_t end,
                               std::uint64_t expected, std::uint64_t actual)
        : MediaCacheError("Content length mismatch for " + object_id + " [" + std::to_string(start) + "-" +
                          std::to_string(end) + "]: expected " + std::to_string(expected) + ", got " +
                          std::to_string(actual)),
          expected_(expected),
          actual_(actual) {}

    std::uint64_t expected() const { return expected_; }
    std::uint64_t actual() const { return actual_; }

private:
    std::uint64_t expected_;
    std::uint64_t actual_;
};

inline const char* toString(RemoteErrorKind kind) {
    switch (kind) {
        case RemoteErrorKind::kAuthExpired:      return "authentication expired";
        case RemoteErrorKind::kNotFound:         return "not found";
        case RemoteErrorKind::kPermissionDenied: return "permission denied";
        case RemoteErrorKind::kTransient:        return "transient failure";
        case RemoteErrorKind::kOther:            return "remote error";
    }
    return "remote error";
}

} // namespace mediacache
