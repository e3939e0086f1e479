#pragma once

#include "definitions.hh"
#include "fast.upload.types.h"
#include "multipart.session.hh"
#include "object.store.hh"
#include "progress.sink.hh"
#include "thread.pool.hh"
#include "upload.buffer.hh"

#include <cstdint>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>

namespace upload {
enum class UploadMode
{
    Undetermined,
    SingleObject,
    Multipart,
};

/// Requested sizes. Signed so that non-positive values can be reported.
struct StreamWriterConfig
{
    int64_t part_size_bytes{ DEFAULT_PART_SIZE };
    int64_t multipart_threshold_bytes{ DEFAULT_MULTIPART_THRESHOLD };
    int64_t initial_buffer_size_bytes{ DEFAULT_INITIAL_BUFFER_SIZE };
};

/// Sizes the writer actually uses.
struct BufferPolicy
{
    size_t part_size;
    size_t multipart_threshold;
    size_t initial_buffer_size;
};

/**
 * @brief Turn a requested configuration into one the writer can use.
 * @details Non-positive sizes fall back to their defaults and sizes above
 * MAX_BUFFER_SIZE are capped. The initial buffer size is clamped to the
 * multipart threshold. Every adjustment is logged as a warning.
 */
BufferPolicy
make_buffer_policy(const StreamWriterConfig& config);

/**
 * @brief Write-only stream that uploads its bytes to one object.
 * @details Bytes collect in a buffer. If the buffer fills up to the
 * multipart threshold, a multipart upload is started and from then on every
 * part_size bytes are uploaded in the background as soon as they have been
 * written. Otherwise close() stores the bytes with a single request. Upload
 * failures are reported by close().
 */
class StreamWriter
{
  public:
    StreamWriter(UploadTarget target,
                 ObjectMetadata metadata,
                 const StreamWriterConfig& config,
                 std::shared_ptr<ObjectStore> store,
                 std::shared_ptr<ThreadPool> thread_pool,
                 std::shared_ptr<ProgressSink> progress = nullptr);
    ~StreamWriter();

    /**
     * @brief Write a single byte.
     * @return UploadStatusCode_Success on success, or an error code on
     * failure.
     */
    [[nodiscard]] UploadStatusCode write(uint8_t byte);

    /**
     * @brief Write @p length bytes of @p data, starting at @p offset.
     * @return UploadStatusCode_InvalidArgument if the window does not lie
     * within @p data, UploadStatusCode_StreamClosed after close(), otherwise
     * UploadStatusCode_Success or the error of a failed multipart initiation.
     */
    [[nodiscard]] UploadStatusCode write(ConstByteSpan data,
                                         int64_t offset,
                                         int64_t length);

    /// @brief Write all of @p data.
    [[nodiscard]] UploadStatusCode write(ConstByteSpan data);

    /**
     * @brief Finish the upload, blocking until it has succeeded or failed.
     * @details Only the first call does any work. Later calls return the
     * status of the first.
     */
    [[nodiscard]] UploadStatusCode close();

    /**
     * @brief Ask a close() that is waiting on uploads to give up.
     * @details May be called from any thread.
     */
    void interrupt();

    UploadMode mode() const;
    bool is_closed() const;
    size_t bytes_written() const;
    std::string error() const;
    const BufferPolicy& policy() const;

  private:
    const UploadTarget target_;
    const ObjectMetadata metadata_;
    const BufferPolicy policy_;

    std::shared_ptr<ObjectStore> store_;
    std::shared_ptr<ThreadPool> thread_pool_;
    std::shared_ptr<ProgressSink> progress_;

    mutable std::mutex mutex_;
    UploadBuffer buffer_;
    std::unique_ptr<MultipartSession> session_;

    UploadMode mode_;
    bool closed_;
    UploadStatusCode status_; // latched failure, then the result of close()
    std::string error_;
    size_t bytes_written_;

    std::stop_source stop_source_;

    [[nodiscard]] UploadStatusCode flush_buffer_();
    [[nodiscard]] UploadStatusCode open_session_();
    [[nodiscard]] UploadStatusCode put_object_();
    [[nodiscard]] UploadStatusCode finalize_multipart_upload_();

    void set_error_(UploadStatusCode status, const std::string& msg);

    /// Latch an internal error and abort any multipart upload.
    void fail_(const std::string& msg);
};
} // namespace upload
