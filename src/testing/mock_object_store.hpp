#pragma once

#include <gmock/gmock.h>
#include "../object_store.hpp"

namespace mediacache {
namespace mocks {

class MockObjectStore : public IObjectStore {
public:
    MOCK_METHOD(bool, exists, (const std::string& object_id), (override));
    MOCK_METHOD(std::optional<MetadataRecord>, fetchMetadata, (const std::string& object_id), (override));
    MOCK_METHOD(std::string, fetchRange,
                (const std::string& object_id, std::uint64_t start, std::uint64_t end), (override));
    MOCK_METHOD(std::string, fetchFull, (const std::string& object_id), (override));
    MOCK_METHOD(void, upload,
                (const std::string& object_id, const std::string& content, const std::string& content_type),
                (override));
    MOCK_METHOD(void, remove, (const std::string& object_id), (override));
    MOCK_METHOD(void, ping, (), (override));
    MOCK_METHOD(std::string, location, (), (const, override));
};

inline MetadataRecord makeRecord(const std::string& name, std::uint64_t size,
                                 const std::string& content_type = "video/mp4") {
    MetadataRecord record;
    record.name = name;
    record.size = size;
    record.content_type = content_type;
    record.etag = name + "-1";
    record.updated = std::chrono::system_clock::now();
    record.fetched_at = record.updated;
    return record;
}

} // namespace mocks
} // namespace mediacache
