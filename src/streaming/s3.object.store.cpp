#include "macros.hh"
#include "s3.object.store.hh"

upload::S3ObjectStore::S3ObjectStore(
  std::shared_ptr<S3ConnectionPool> connection_pool)
  : connection_pool_(std::move(connection_pool))
{
    EXPECT(connection_pool_, "S3 connection pool not provided.");
}

template<typename F>
bool
upload::S3ObjectStore::with_connection_(F&& fun, std::string& error)
{
    auto connection = connection_pool_->get_connection();
    if (connection == nullptr) {
        error = "No S3 connection available";
        return false;
    }

    bool retval = false;
    try {
        retval = fun(*connection);
    } catch (const std::exception& exc) {
        error = exc.what();
    }

    // cleanup
    connection_pool_->return_connection(std::move(connection));

    return retval;
}

bool
upload::S3ObjectStore::bucket_exists(std::string_view bucket_name)
{
    std::string error;
    const bool exists = with_connection_(
      [bucket_name](S3Connection& conn) {
          return conn.bucket_exists(bucket_name);
      },
      error);

    if (!error.empty()) {
        LOG_ERROR(error);
    }

    return exists;
}

bool
upload::S3ObjectStore::create_multipart_upload(const UploadTarget& target,
                                               const ObjectMetadata& metadata,
                                               std::string& upload_id,
                                               std::string& error)
{
    return with_connection_(
      [&](S3Connection& conn) {
          upload_id = conn.create_multipart_object(
            target.bucket_name, target.object_key, metadata, error);
          return !upload_id.empty();
      },
      error);
}

bool
upload::S3ObjectStore::upload_part(const UploadTarget& target,
                                   std::string_view upload_id,
                                   unsigned int part_number,
                                   ConstByteSpan data,
                                   const TransferCallback& on_progress,
                                   std::string& etag,
                                   std::string& error)
{
    return with_connection_(
      [&](S3Connection& conn) {
          etag = conn.upload_multipart_object_part(target.bucket_name,
                                                   target.object_key,
                                                   upload_id,
                                                   data,
                                                   part_number,
                                                   on_progress,
                                                   error);
          return !etag.empty();
      },
      error);
}

bool
upload::S3ObjectStore::complete_multipart_upload(
  const UploadTarget& target,
  std::string_view upload_id,
  const std::vector<UploadedPart>& parts,
  std::string& error)
{
    std::list<minio::s3::Part> s3_parts;
    for (const auto& part : parts) {
        minio::s3::Part s3_part;
        s3_part.number = part.number;
        s3_part.etag = part.etag;
        s3_part.size = part.size;
        s3_parts.push_back(s3_part);
    }

    return with_connection_(
      [&](S3Connection& conn) {
          return conn.complete_multipart_object(
            target.bucket_name, target.object_key, upload_id, s3_parts, error);
      },
      error);
}

bool
upload::S3ObjectStore::abort_multipart_upload(const UploadTarget& target,
                                              std::string_view upload_id,
                                              std::string& error)
{
    return with_connection_(
      [&](S3Connection& conn) {
          return conn.abort_multipart_object(
            target.bucket_name, target.object_key, upload_id, error);
      },
      error);
}

bool
upload::S3ObjectStore::put_object(const UploadTarget& target,
                                  const ObjectMetadata& metadata,
                                  ConstByteSpan data,
                                  const TransferCallback& on_progress,
                                  std::string& error)
{
    return with_connection_(
      [&](S3Connection& conn) {
          const auto etag = conn.put_object(target.bucket_name,
                                            target.object_key,
                                            data,
                                            metadata,
                                            on_progress,
                                            error);
          return !etag.empty();
      },
      error);
}
