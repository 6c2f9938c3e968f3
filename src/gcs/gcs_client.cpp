#include "gcs_client.hpp"
#include <iostream>
#include <iterator>

namespace mediacache {

RemoteErrorKind classifyStatus(const google::cloud::Status& status) {
    switch (status.code()) {
        case google::cloud::StatusCode::kUnauthenticated:
            return RemoteErrorKind::kAuthExpired;
        case google::cloud::StatusCode::kNotFound:
            return RemoteErrorKind::kNotFound;
        case google::cloud::StatusCode::kPermissionDenied:
            return RemoteErrorKind::kPermissionDenied;
        case google::cloud::StatusCode::kDeadlineExceeded:
        case google::cloud::StatusCode::kUnavailable:
        case google::cloud::StatusCode::kResourceExhausted:
            return RemoteErrorKind::kTransient;
        default:
            return RemoteErrorKind::kOther;
    }
}

GCSClient::GCSClient(std::string bucket_name, std::unique_ptr<IGCSSDKClient> sdk_client, bool debug_mode)
    : bucket_name_(std::move(bucket_name)),
      sdk_client_(std::move(sdk_client)),
      debug_mode_(debug_mode)
{
}

void GCSClient::raise(const google::cloud::Status& status, const std::string& object_id, const char* operation) const {
    std::cerr << "Error " << operation << " gs://" << bucket_name_ << "/" << object_id << ": "
              << status.message() << std::endl;
    throw RemoteError(classifyStatus(status), object_id, status.message());
}

bool GCSClient::exists(const std::string& object_id) {
    return fetchMetadata(object_id).has_value();
}

std::optional<MetadataRecord> GCSClient::fetchMetadata(const std::string& object_id) {
    auto metadata = sdk_client_->GetObjectMetadata({bucket_name_, object_id});
    if (!metadata) {
        if (metadata.status().code() == google::cloud::StatusCode::kNotFound) {
            return std::nullopt;
        }
        raise(metadata.status(), object_id, "getting metadata for");
    }

    MetadataRecord record;
    record.name = metadata->name();
    record.size = metadata->size();
    record.content_type = metadata->content_type();
    record.etag = metadata->etag();
    record.md5_hash = metadata->md5_hash();
    record.updated = metadata->updated();
    for (const auto& attribute : metadata->metadata()) {
        record.attributes[attribute.first] = attribute.second;
    }
    record.fetched_at = std::chrono::system_clock::now();

    if (debug_mode_) {
        std::cout << "[DEBUG] Metadata for " << object_id << ": " << record.size << " bytes, "
                  << record.content_type << std::endl;
    }
    return record;
}

std::string GCSClient::read(const IGCSSDKClient::ReadObjectRequest& request) {
    auto reader = sdk_client_->ReadObject(request);
    if (!reader) {
        raise(reader.status(), request.object_name, "reading");
    }
    std::string content{std::istreambuf_iterator<char>{reader}, {}};
    if (!reader.status().ok()) {
        raise(reader.status(), request.object_name, "reading");
    }
    return content;
}

std::string GCSClient::fetchRange(const std::string& object_id, std::uint64_t start, std::uint64_t end) {
    IGCSSDKClient::ReadObjectRequest request{bucket_name_, object_id, std::nullopt};
    // SDK ranges are end-exclusive
    request.range = std::make_pair(static_cast<std::int64_t>(start), static_cast<std::int64_t>(end) + 1);
    return read(request);
}

std::string GCSClient::fetchFull(const std::string& object_id) {
    return read({bucket_name_, object_id, std::nullopt});
}

void GCSClient::upload(const std::string& object_id, const std::string& content, const std::string& content_type) {
    auto writer = sdk_client_->WriteObject({bucket_name_, object_id, content_type});
    writer << content;
    writer.Close();

    if (!writer.metadata()) {
        raise(writer.metadata().status(), object_id, "writing");
    }
}

void GCSClient::remove(const std::string& object_id) {
    auto status = sdk_client_->DeleteObject({bucket_name_, object_id});
    if (!status.ok()) {
        raise(status, object_id, "deleting");
    }
}

void GCSClient::ping() {
    auto objects = sdk_client_->ListObjects({bucket_name_, "", 1});
    for (auto&& object_metadata : objects) {
        if (!object_metadata) {
            raise(object_metadata.status(), "", "listing");
        }
        break;
    }
}

std::string GCSClient::location() const {
    return "gs://" + bucket_name_;
}

std::shared_ptr<IObjectStore> makeGCSObjectStore(const std::string& bucket_name,
                                                 const GCSConnectionSettings& settings,
                                                 bool debug_mode)
{
    if (debug_mode) {
        std::cout << "[DEBUG] Creating GCS client for gs://" << bucket_name << std::endl;
    }
    return std::make_shared<GCSClient>(
        bucket_name,
        std::make_unique<GCSSDKClientImpl>(makeClientOptions(settings)),
        debug_mode);
}

} // namespace mediacache
