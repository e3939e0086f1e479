#pragma once

#include "definitions.hh"

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace upload {
/// The destination object of an upload.
struct UploadTarget
{
    std::string bucket_name;
    std::string object_key;
};

struct ObjectMetadata
{
    std::string content_type;
    std::map<std::string, std::string> user_metadata;
};

/// Completion token for one part of a multipart upload.
struct UploadedPart
{
    unsigned int number;
    std::string etag;
    size_t size;
};

/**
 * @brief Called as bytes of a request body are sent.
 * @return False to ask the store to stop the transfer.
 */
using TransferCallback =
  std::function<bool(size_t bytes_sent, size_t bytes_total)>;

/**
 * @brief An object store with multipart upload semantics.
 * @details Implementations must be safe to call from several threads at
 * once. Every operation reports failure through its return value and a
 * diagnostic message in @p error.
 */
class ObjectStore
{
  public:
    virtual ~ObjectStore() = default;

    /**
     * @brief Check whether a bucket exists.
     * @param bucket_name The name of the bucket.
     * @return True if the bucket exists, false otherwise.
     */
    [[nodiscard]] virtual bool bucket_exists(std::string_view bucket_name) = 0;

    /**
     * @brief Start a multipart upload.
     * @param target The object to upload.
     * @param metadata Metadata to store with the object.
     * @param[out] upload_id The ID of the new upload.
     * @param[out] error Diagnostic message on failure.
     * @return True if the upload was created, false otherwise.
     */
    [[nodiscard]] virtual bool create_multipart_upload(
      const UploadTarget& target,
      const ObjectMetadata& metadata,
      std::string& upload_id,
      std::string& error) = 0;

    /**
     * @brief Upload one part of a multipart upload.
     * @param target The object being uploaded.
     * @param upload_id The ID of the upload.
     * @param part_number The 1-based number of this part.
     * @param data The bytes of the part.
     * @param on_progress Progress callback, may be empty.
     * @param[out] etag The ETag of the stored part.
     * @param[out] error Diagnostic message on failure.
     * @return True if the part was stored, false otherwise.
     */
    [[nodiscard]] virtual bool upload_part(const UploadTarget& target,
                                           std::string_view upload_id,
                                           unsigned int part_number,
                                           ConstByteSpan data,
                                           const TransferCallback& on_progress,
                                           std::string& etag,
                                           std::string& error) = 0;

    /**
     * @brief Assemble the uploaded parts into the final object.
     * @param parts Completion tokens, ordered by part number.
     */
    [[nodiscard]] virtual bool complete_multipart_upload(
      const UploadTarget& target,
      std::string_view upload_id,
      const std::vector<UploadedPart>& parts,
      std::string& error) = 0;

    /**
     * @brief Discard a multipart upload and every part stored for it.
     */
    [[nodiscard]] virtual bool abort_multipart_upload(
      const UploadTarget& target,
      std::string_view upload_id,
      std::string& error) = 0;

    /**
     * @brief Store an object with a single request.
     */
    [[nodiscard]] virtual bool put_object(const UploadTarget& target,
                                          const ObjectMetadata& metadata,
                                          ConstByteSpan data,
                                          const TransferCallback& on_progress,
                                          std::string& error) = 0;
};

/**
 * @brief Parse object metadata from a JSON object.
 * @details "Content-Type" (any case) sets the content type, every other key
 * becomes user metadata. All values must be strings.
 * @param json The JSON text. Empty text yields empty metadata.
 * @param[out] metadata The parsed metadata.
 * @param[out] error Diagnostic message on failure.
 * @return True if @p json was valid, false otherwise.
 */
[[nodiscard]] bool
parse_object_metadata(std::string_view json,
                      ObjectMetadata& metadata,
                      std::string& error);
} // namespace upload
