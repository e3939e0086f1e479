#pragma once

#include "definitions.hh"
#include "object.store.hh"

#include <miniocpp/client.h>

#include <atomic>
#include <condition_variable>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace upload {
struct S3Settings
{
    std::string endpoint;
    std::string bucket_name;
    std::optional<std::string> region;
};

class S3Connection
{
  public:
    /**
     * @brief Create a client for the endpoint in @p settings.
     * @details Credentials are read from AWS_ACCESS_KEY_ID,
     * AWS_SECRET_ACCESS_KEY and, if set, AWS_SESSION_TOKEN.
     * @throws std::runtime_error if the credentials are not set.
     */
    explicit S3Connection(const S3Settings& settings);

    /**
     * @brief Test a connection by listing all buckets at this connection's
     * endpoint.
     * @returns True if the connection is valid, otherwise false.
     */
    bool is_connection_valid();

    /* Bucket operations */

    /**
     * @brief Check whether a bucket exists.
     * @param bucket_name The name of the bucket.
     * @returns True if the bucket exists, otherwise false.
     * @throws std::runtime_error if the bucket name is empty.
     */
    bool bucket_exists(std::string_view bucket_name);

    /* Object operations */

    /**
     * @brief Put an object with a single request.
     * @param bucket_name The name of the bucket to put the object in.
     * @param object_name The name of the object.
     * @param data The data to put in the object.
     * @param metadata Content type and user metadata of the object.
     * @param on_progress Progress callback, may be empty.
     * @param[out] error Diagnostic message on failure.
     * @returns The etag of the object, or an empty string on failure.
     * @throws std::runtime_error if the bucket name or object name is empty.
     */
    std::string put_object(std::string_view bucket_name,
                           std::string_view object_name,
                           ConstByteSpan data,
                           const ObjectMetadata& metadata,
                           const TransferCallback& on_progress,
                           std::string& error);

    /* Multipart object operations */

    /// @brief Create a multipart object.
    /// @param bucket_name The name of the bucket containing the object.
    /// @param object_name The name of the object.
    /// @param metadata Content type and user metadata of the object.
    /// @param[out] error Diagnostic message on failure.
    /// @returns The upload id of the multipart object. Empty if failed.
    /// @throws std::runtime_error if the bucket name or object name is empty.
    std::string create_multipart_object(std::string_view bucket_name,
                                        std::string_view object_name,
                                        const ObjectMetadata& metadata,
                                        std::string& error);

    /// @brief Upload a part of a multipart object.
    /// @param bucket_name The name of the bucket containing the object.
    /// @param object_name The name of the object.
    /// @param upload_id The upload id of the multipart object.
    /// @param data The data to upload.
    /// @param part_number The part number of the object.
    /// @param on_progress Progress callback, may be empty.
    /// @param[out] error Diagnostic message on failure.
    /// @returns The etag of the uploaded part. Empty if failed.
    /// @throws std::runtime_error if the bucket name is empty, the object
    /// name is empty, or the upload id is empty.
    std::string upload_multipart_object_part(
      std::string_view bucket_name,
      std::string_view object_name,
      std::string_view upload_id,
      ConstByteSpan data,
      unsigned int part_number,
      const TransferCallback& on_progress,
      std::string& error);

    /// @brief Complete a multipart object.
    /// @param bucket_name The name of the bucket containing the object.
    /// @param object_name The name of the object.
    /// @param upload_id The upload id of the multipart object.
    /// @param parts List of the parts making up the object.
    /// @param[out] error Diagnostic message on failure.
    /// @returns True if the object was successfully completed, otherwise
    /// false.
    bool complete_multipart_object(std::string_view bucket_name,
                                   std::string_view object_name,
                                   std::string_view upload_id,
                                   const std::list<minio::s3::Part>& parts,
                                   std::string& error);

    /// @brief Abort a multipart object, discarding its uploaded parts.
    /// @returns True if the upload was aborted, otherwise false.
    bool abort_multipart_object(std::string_view bucket_name,
                                std::string_view object_name,
                                std::string_view upload_id,
                                std::string& error);

  private:
    std::unique_ptr<minio::s3::Client> client_;
    std::unique_ptr<minio::creds::Provider> provider_;
    std::string region_;
};

class S3ConnectionPool
{
  public:
    S3ConnectionPool(size_t n_connections, const S3Settings& settings);
    ~S3ConnectionPool() noexcept;

    /**
     * @brief Take a connection, blocking until one is free.
     * @return A connection, or nullptr if the pool is shutting down.
     */
    std::unique_ptr<S3Connection> get_connection();
    void return_connection(std::unique_ptr<S3Connection>&& conn);

  private:
    std::vector<std::unique_ptr<S3Connection>> connections_;
    std::mutex connections_mutex_;
    std::condition_variable cv_;

    std::atomic<bool> is_accepting_connections_{ true };
};
} // namespace upload
