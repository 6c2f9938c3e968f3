#include "gcs_sdk_interface.hpp"
#include <fstream>
#include <iterator>
#include <stdexcept>
#include "google/cloud/credentials.h"

namespace mediacache {

google::cloud::Options makeClientOptions(const GCSConnectionSettings& settings) {
    auto options = google::cloud::Options{}
        .set<gcs::RetryPolicyOption>(gcs::LimitedTimeRetryPolicy(settings.timeout).clone())
        .set<gcs::TransferStallTimeoutOption>(settings.timeout)
        .set<gcs::DownloadStallTimeoutOption>(settings.timeout);

    if (!settings.project_id.empty()) {
        options.set<gcs::ProjectIdOption>(settings.project_id);
    }

    if (!settings.credentials_file.empty()) {
        std::ifstream key_file(settings.credentials_file);
        if (!key_file) {
            throw std::runtime_error("Cannot read credentials file: " + settings.credentials_file);
        }
        std::string contents{std::istreambuf_iterator<char>{key_file}, {}};
        options.set<google::cloud::UnifiedCredentialsOption>(
            google::cloud::MakeServiceAccountCredentials(contents));
    }

    return options;
}

GCSSDKClientImpl::GCSSDKClientImpl() : client_(gcs::Client()) {}

GCSSDKClientImpl::GCSSDKClientImpl(google::cloud::Options options) : client_(std::move(options)) {}

GCSSDKClientImpl::GCSSDKClientImpl(const gcs::Client& client) : client_(client) {}

gcs::ObjectReadStream GCSSDKClientImpl::ReadObject(const ReadObjectRequest& request) const {
    if (request.range.has_value()) {
        return client_.ReadObject(request.bucket_name, request.object_name,
                                  gcs::ReadRange(request.range->first, request.range->second));
    }
    return client_.ReadObject(request.bucket_name, request.object_name);
}

StatusOr<gcs::ObjectMetadata> GCSSDKClientImpl::GetObjectMetadata(const GetObjectMetadataRequest& request) const {
    return client_.GetObjectMetadata(request.bucket_name, request.object_name);
}

gcs::ObjectWriteStream GCSSDKClientImpl::WriteObject(const WriteObjectRequest& request) const {
    return client_.WriteObject(
        request.bucket_name,
        request.object_name,
        gcs::WithObjectMetadata(gcs::ObjectMetadata().set_content_type(request.content_type)));
}

Status GCSSDKClientImpl::DeleteObject(const DeleteObjectRequest& request) const {
    return client_.DeleteObject(request.bucket_name, request.object_name);
}

gcs::ListObjectsReader GCSSDKClientImpl::ListObjects(const ListObjectsRequest& request) const {
    return client_.ListObjects(
        request.bucket_name,
        gcs::Prefix(request.prefix),
        gcs::MaxResults(request.max_results));
}

} // namespace mediacache
