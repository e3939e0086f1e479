#include "macros.hh"
#include "s3.connection.hh"

#include <cstdlib> // std::getenv
#include <string_view>

namespace {
std::string
get_env(const char* name)
{
    const char* value = std::getenv(name);
    return value == nullptr ? std::string{} : std::string(value);
}

minio::http::ProgressFunction
make_progress_function(const upload::TransferCallback& on_progress)
{
    if (!on_progress) {
        return nullptr;
    }

    return [&on_progress](minio::http::ProgressFunctionArgs args) -> bool {
        return on_progress(static_cast<size_t>(args.uploaded_bytes),
                           static_cast<size_t>(args.upload_total_bytes));
    };
}

minio::utils::Multimap
make_headers(const upload::ObjectMetadata& metadata)
{
    minio::utils::Multimap headers;
    if (!metadata.content_type.empty()) {
        headers.Add("Content-Type", metadata.content_type);
    }

    for (const auto& [key, value] : metadata.user_metadata) {
        headers.Add("x-amz-meta-" + key, value);
    }

    return headers;
}
} // namespace

upload::S3Connection::S3Connection(const S3Settings& settings)
{
    const std::string access_key_id = get_env("AWS_ACCESS_KEY_ID");
    const std::string secret_access_key = get_env("AWS_SECRET_ACCESS_KEY");
    EXPECT(!access_key_id.empty(), "AWS_ACCESS_KEY_ID is not set.");
    EXPECT(!secret_access_key.empty(), "AWS_SECRET_ACCESS_KEY is not set.");

    minio::s3::BaseUrl url(settings.endpoint);
    url.https = settings.endpoint.starts_with("https://");
    if (settings.region) {
        region_ = *settings.region;
        url.region = region_;
    }

    provider_ = std::make_unique<minio::creds::StaticProvider>(
      access_key_id, secret_access_key, get_env("AWS_SESSION_TOKEN"));
    client_ = std::make_unique<minio::s3::Client>(url, provider_.get());
}

bool
upload::S3Connection::is_connection_valid()
{
    return static_cast<bool>(client_->ListBuckets());
}

bool
upload::S3Connection::bucket_exists(std::string_view bucket_name)
{
    EXPECT(!bucket_name.empty(), "Bucket name must not be empty.");

    minio::s3::BucketExistsArgs args;
    args.bucket = bucket_name;
    args.region = region_;

    auto response = client_->BucketExists(args);
    if (!response) {
        LOG_ERROR("Failed to check bucket ",
                  bucket_name,
                  ": ",
                  response.Error().String());
        return false;
    }

    return response.exist;
}

std::string
upload::S3Connection::put_object(std::string_view bucket_name,
                                 std::string_view object_name,
                                 ConstByteSpan data,
                                 const ObjectMetadata& metadata,
                                 const TransferCallback& on_progress,
                                 std::string& error)
{
    EXPECT(!bucket_name.empty(), "Bucket name must not be empty.");
    EXPECT(!object_name.empty(), "Object name must not be empty.");

    std::string_view data_buffer(reinterpret_cast<const char*>(data.data()),
                                 data.size());

    LOG_DEBUG("Putting object ", object_name, " in bucket ", bucket_name);

    // one PUT request, whatever the size
    minio::s3::PutObjectApiArgs args;
    args.bucket = bucket_name;
    args.object = object_name;
    args.region = region_;
    args.data = data_buffer;
    args.headers = make_headers(metadata);
    args.progressfunc = make_progress_function(on_progress);

    // Client::PutObject(PutObjectArgs) hides the single-request overload
    auto response = client_->minio::s3::BaseClient::PutObject(args);
    if (!response) {
        error = "Failed to put object " + std::string(object_name) +
                " in bucket " + std::string(bucket_name) + ": " +
                response.Error().String();
        return {};
    }

    if (response.etag.empty()) {
        error = "No ETag returned for object " + std::string(object_name);
    }

    return response.etag;
}

std::string
upload::S3Connection::create_multipart_object(std::string_view bucket_name,
                                              std::string_view object_name,
                                              const ObjectMetadata& metadata,
                                              std::string& error)
{
    EXPECT(!bucket_name.empty(), "Bucket name must not be empty.");
    EXPECT(!object_name.empty(), "Object name must not be empty.");

    minio::s3::CreateMultipartUploadArgs args;
    args.bucket = bucket_name;
    args.object = object_name;
    args.region = region_;
    args.headers = make_headers(metadata);

    auto response = client_->CreateMultipartUpload(args);
    if (!response) {
        error = "Failed to create multipart object " +
                std::string(object_name) + " in bucket " +
                std::string(bucket_name) + ": " + response.Error().String();
        return {};
    }

    if (response.upload_id.empty()) {
        error = "No upload ID returned for object " + std::string(object_name);
    }

    return response.upload_id;
}

std::string
upload::S3Connection::upload_multipart_object_part(
  std::string_view bucket_name,
  std::string_view object_name,
  std::string_view upload_id,
  ConstByteSpan data,
  unsigned int part_number,
  const TransferCallback& on_progress,
  std::string& error)
{
    EXPECT(!bucket_name.empty(), "Bucket name must not be empty.");
    EXPECT(!object_name.empty(), "Object name must not be empty.");
    EXPECT(!upload_id.empty(), "Upload ID must not be empty.");
    EXPECT(part_number > 0, "Part number must be positive.");

    std::string_view data_buffer(reinterpret_cast<const char*>(data.data()),
                                 data.size());

    minio::s3::UploadPartArgs args;
    args.bucket = bucket_name;
    args.object = object_name;
    args.region = region_;
    args.part_number = part_number;
    args.upload_id = upload_id;
    args.data = data_buffer;
    args.progressfunc = make_progress_function(on_progress);

    auto response = client_->UploadPart(args);
    if (!response) {
        error = "Failed to upload part " + std::to_string(part_number) +
                " of object " + std::string(object_name) + ": " +
                response.Error().String();
        return {};
    }

    if (response.etag.empty()) {
        error = "No ETag returned for part " + std::to_string(part_number) +
                " of object " + std::string(object_name);
    }

    return response.etag;
}

bool
upload::S3Connection::complete_multipart_object(
  std::string_view bucket_name,
  std::string_view object_name,
  std::string_view upload_id,
  const std::list<minio::s3::Part>& parts,
  std::string& error)
{
    EXPECT(!bucket_name.empty(), "Bucket name must not be empty.");
    EXPECT(!object_name.empty(), "Object name must not be empty.");
    EXPECT(!upload_id.empty(), "Upload ID must not be empty.");
    EXPECT(!parts.empty(), "Parts list must not be empty.");

    minio::s3::CompleteMultipartUploadArgs args;
    args.bucket = bucket_name;
    args.object = object_name;
    args.region = region_;
    args.upload_id = upload_id;
    args.parts = parts;

    auto response = client_->CompleteMultipartUpload(args);
    if (!response) {
        error = "Failed to complete multipart object " +
                std::string(object_name) + ": " + response.Error().String();
        return false;
    }

    return true;
}

bool
upload::S3Connection::abort_multipart_object(std::string_view bucket_name,
                                             std::string_view object_name,
                                             std::string_view upload_id,
                                             std::string& error)
{
    EXPECT(!bucket_name.empty(), "Bucket name must not be empty.");
    EXPECT(!object_name.empty(), "Object name must not be empty.");
    EXPECT(!upload_id.empty(), "Upload ID must not be empty.");

    minio::s3::AbortMultipartUploadArgs args;
    args.bucket = bucket_name;
    args.object = object_name;
    args.region = region_;
    args.upload_id = upload_id;

    auto response = client_->AbortMultipartUpload(args);
    if (!response) {
        error = "Failed to abort multipart object " +
                std::string(object_name) + ": " + response.Error().String();
        return false;
    }

    return true;
}

upload::S3ConnectionPool::S3ConnectionPool(size_t n_connections,
                                           const S3Settings& settings)
{
    EXPECT(n_connections > 0,
           "Must have a positive number of connections, got ",
           n_connections);

    for (auto i = 0; i < n_connections; ++i) {
        auto connection = std::make_unique<S3Connection>(settings);
        if (connection->is_connection_valid()) {
            connections_.push_back(std::move(connection));
        }
    }

    EXPECT(!connections_.empty(),
           "Failed to connect to S3 endpoint ",
           settings.endpoint);
}

upload::S3ConnectionPool::~S3ConnectionPool() noexcept
{
    is_accepting_connections_ = false;
    cv_.notify_all();
}

std::unique_ptr<upload::S3Connection>
upload::S3ConnectionPool::get_connection()
{
    std::unique_lock lock(connections_mutex_);
    cv_.wait(lock, [this] {
        return !is_accepting_connections_ || !connections_.empty();
    });

    if (!is_accepting_connections_ || connections_.empty()) {
        return nullptr;
    }

    auto conn = std::move(connections_.back());
    connections_.pop_back();
    return conn;
}

void
upload::S3ConnectionPool::return_connection(
  std::unique_ptr<S3Connection>&& conn)
{
    std::scoped_lock lock(connections_mutex_);
    connections_.push_back(std::move(conn));
    cv_.notify_one();
}
