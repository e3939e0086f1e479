#pragma once

#include "object.store.hh"
#include "s3.connection.hh"

#include <memory>

namespace upload {
/**
 * @brief An ObjectStore that borrows a connection from an S3ConnectionPool
 * for each request.
 */
class S3ObjectStore final : public ObjectStore
{
  public:
    explicit S3ObjectStore(std::shared_ptr<S3ConnectionPool> connection_pool);

    bool bucket_exists(std::string_view bucket_name) override;

    bool create_multipart_upload(const UploadTarget& target,
                                 const ObjectMetadata& metadata,
                                 std::string& upload_id,
                                 std::string& error) override;

    bool upload_part(const UploadTarget& target,
                     std::string_view upload_id,
                     unsigned int part_number,
                     ConstByteSpan data,
                     const TransferCallback& on_progress,
                     std::string& etag,
                     std::string& error) override;

    bool complete_multipart_upload(const UploadTarget& target,
                                   std::string_view upload_id,
                                   const std::vector<UploadedPart>& parts,
                                   std::string& error) override;

    bool abort_multipart_upload(const UploadTarget& target,
                                std::string_view upload_id,
                                std::string& error) override;

    bool put_object(const UploadTarget& target,
                    const ObjectMetadata& metadata,
                    ConstByteSpan data,
                    const TransferCallback& on_progress,
                    std::string& error) override;

  private:
    std::shared_ptr<S3ConnectionPool> connection_pool_;

    /**
     * @brief Run @p fun with a connection from the pool, returning the
     * connection afterwards.
     * @return The value returned by @p fun, or false if no connection is
     * available or @p fun throws.
     */
    template<typename F>
    bool with_connection_(F&& fun, std::string& error);
};
} // namespace upload
