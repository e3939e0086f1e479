#pragma once

#include "definitions.hh"
#include "fast.upload.types.h"
#include "object.store.hh"
#include "progress.sink.hh"
#include "thread.pool.hh"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <vector>

namespace upload {
/**
 * @brief One multipart upload: its upload ID, the parts submitted for it and
 * the complete/abort protocol that ends it.
 * @details Parts are numbered 1..N in submission order. Each part is
 * uploaded by a job on the thread pool; the first part to fail cancels the
 * parts that have not started yet and stops the ones in flight.
 */
class MultipartSession
{
  public:
    /**
     * @brief Initiate a multipart upload.
     * @param[out] error Diagnostic message on failure.
     * @return The new session, or nullptr if the upload could not be
     * initiated.
     */
    static std::unique_ptr<MultipartSession> open(
      std::shared_ptr<ObjectStore> store,
      std::shared_ptr<ThreadPool> thread_pool,
      const UploadTarget& target,
      const ObjectMetadata& metadata,
      std::shared_ptr<ProgressSink> progress,
      std::string& error);

    MultipartSession(std::shared_ptr<ObjectStore> store,
                     std::shared_ptr<ThreadPool> thread_pool,
                     const UploadTarget& target,
                     std::string upload_id,
                     std::shared_ptr<ProgressSink> progress);
    ~MultipartSession();

    /**
     * @brief Number @p data as the next part and queue its upload.
     * @details Returns without waiting for the upload. The bytes are owned by
     * the upload job from here on.
     * @param data The bytes of the part. Must not be empty.
     * @return The number assigned to the part.
     */
    unsigned int submit_part(ByteVector&& data);

    /**
     * @brief Block until every submitted part has settled.
     * @details If any part failed, or if a stop is requested on
     * @p stop_token while waiting, the outstanding parts are cancelled and
     * the upload is aborted.
     * @param stop_token Cooperative cancellation signal.
     * @param[out] parts Completion tokens in part number order, on success.
     * @param[out] error Diagnostic message on failure.
     * @return UploadStatusCode_Success, UploadStatusCode_PartUploadError or
     * UploadStatusCode_Interrupted.
     */
    [[nodiscard]] UploadStatusCode await_all(std::stop_token stop_token,
                                             std::vector<UploadedPart>& parts,
                                             std::string& error);

    /**
     * @brief Assemble the uploaded parts into the final object.
     * @param parts Completion tokens in part number order.
     * @param[out] error Diagnostic message on failure.
     * @return UploadStatusCode_Success or UploadStatusCode_CompletionError.
     */
    [[nodiscard]] UploadStatusCode complete(
      const std::vector<UploadedPart>& parts,
      std::string& error);

    /**
     * @brief Abort the upload, discarding any stored parts.
     * @details Best effort and at most once; failures are logged.
     */
    void abort() noexcept;

    /**
     * @brief Stop parts that have not finished uploading.
     */
    void cancel();

    const std::string& upload_id() const;
    size_t parts_submitted() const;

  private:
    struct PartRecord
    {
        unsigned int number;
        size_t size;
        std::string etag;
        bool settled{ false };
        bool succeeded{ false };
    };

    // Shared with the part jobs, which may outlive the session.
    struct State
    {
        std::mutex mutex;
        std::condition_variable_any cv;
        std::vector<PartRecord> parts;
        size_t n_settled{ 0 };
        std::string first_error;
        std::atomic<bool> cancelled{ false };
    };

    std::shared_ptr<ObjectStore> store_;
    std::shared_ptr<ThreadPool> thread_pool_;
    const UploadTarget target_;
    const std::string upload_id_;
    std::shared_ptr<ProgressSink> progress_;

    std::shared_ptr<State> state_;
    bool completed_;
    bool aborted_;
};
} // namespace upload
