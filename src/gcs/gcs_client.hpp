#pragma once

#include <memory>
#include <optional>
#include <string>
#include "gcs_sdk_interface.hpp"
#include "../object_store.hpp"

namespace mediacache {

// Map an SDK status to the error kind the connection manager reacts to
RemoteErrorKind classifyStatus(const google::cloud::Status& status);

/**
 * GCSClient - IObjectStore backed by one Google Cloud Storage bucket
 *
 * Uses dependency injection with IGCSSDKClient to enable proper unit testing.
 * Every failed SDK call is raised as RemoteError; a missing object reported by
 * a metadata lookup is std::nullopt instead.
 */
class GCSClient : public IObjectStore {
public:
    GCSClient(std::string bucket_name, std::unique_ptr<IGCSSDKClient> sdk_client, bool debug_mode = false);

    bool exists(const std::string& object_id) override;

    std::optional<MetadataRecord> fetchMetadata(const std::string& object_id) override;

    std::string fetchRange(const std::string& object_id, std::uint64_t start, std::uint64_t end) override;

    std::string fetchFull(const std::string& object_id) override;

    void upload(const std::string& object_id, const std::string& content, const std::string& content_type) override;

    void remove(const std::string& object_id) override;

    // Lists at most one object in the bucket
    void ping() override;

    std::string location() const override;

private:
    std::string read(const IGCSSDKClient::ReadObjectRequest& request);

    [[noreturn]] void raise(const google::cloud::Status& status, const std::string& object_id, const char* operation) const;

    std::string bucket_name_;
    std::unique_ptr<IGCSSDKClient> sdk_client_;
    bool debug_mode_;
};

/**
 * Build a GCS-backed store with real SDK credentials and timeouts.
 * Used as the ConnectionManager's client factory.
 */
std::shared_ptr<IObjectStore> makeGCSObjectStore(const std::string& bucket_name,
                                                 const GCSConnectionSettings& settings,
                                                 bool debug_mode = false);

} // namespace mediacache
