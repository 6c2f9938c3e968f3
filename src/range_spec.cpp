#include "range_spec.hpp"
#include "errors.hpp"
#include <algorithm>
#include <charconv>
#include <stdexcept>

namespace mediacache {

namespace {
    constexpr char kUnitPrefix[] = "bytes=";

    // Parse a run of decimal digits starting at pos; advances pos past them
    std::optional<std::uint64_t> parseNumber(const std::string& text, size_t& pos) {
        const char* first = text.data() + pos;
        const char* last = text.data() + text.size();
        std::uint64_t value = 0;
        auto [ptr, ec] = std::from_chars(first, last, value);
        if (ec != std::errc() || ptr == first) {
            return std::nullopt;
        }
        pos += static_cast<size_t>(ptr - first);
        return value;
    }
}

RangeWindow RangeResolver::resolve(const std::optional<std::string>& range_header,
                                   std::uint64_t object_size) const
{
    if (object_size == 0) {
        throw std::invalid_argument("Cannot resolve a range against an empty object");
    }
    const std::uint64_t last_byte = object_size - 1;

    if (!range_header.has_value()) {
        return RangeWindow{0, last_byte};
    }

    const std::string& header = *range_header;
    if (header.compare(0, sizeof(kUnitPrefix) - 1, kUnitPrefix) != 0) {
        throw MalformedRangeError(header);
    }

    size_t pos = sizeof(kUnitPrefix) - 1;
    auto start = parseNumber(header, pos);
    if (!start || pos >= header.size() || header[pos] != '-') {
        throw MalformedRangeError(header);
    }
    ++pos;

    std::optional<std::uint64_t> end;
    if (pos < header.size() && header[pos] != ',') {
        end = parseNumber(header, pos);
        if (!end) {
            throw MalformedRangeError(header);
        }
    }
    // Anything after the first range must be another range
    if (pos < header.size() && header[pos] != ',') {
        throw MalformedRangeError(header);
    }

    std::uint64_t first = std::min(*start, last_byte);
    std::uint64_t second;
    if (end.has_value()) {
        second = *end;
    } else {
        // first + max - 1 without overflowing near the top of the u64 range
        std::uint64_t room = last_byte - first;
        second = first + std::min(room, limits_.max_unbounded_range_bytes - 1);
    }
    second = std::max(first, std::min(second, last_byte));

    RangeWindow window{first, second};
    if (limits_.max_range_chunk_bytes > 0 && window.length() > limits_.max_range_chunk_bytes) {
        window.end = window.start + limits_.max_range_chunk_bytes - 1;
    }
    return window;
}

} // namespace mediacache
