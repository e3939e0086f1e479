#ifndef H_FAST_UPLOAD_V0
#define H_FAST_UPLOAD_V0

#include "fast.upload.types.h"

#ifdef __cplusplus
extern "C"
{
#endif

    /**
     * @brief Get the version of the fast-upload API.
     * @return The version of the fast-upload API.
     */
    uint32_t Upload_get_api_version();

    /**
     * @brief Set the log level for the fast-upload API.
     * @param level The log level.
     * @return UploadStatusCode_Success on success, or an error code on
     * failure.
     */
    UploadStatusCode Upload_set_log_level(UploadLogLevel level);

    /**
     * @brief Get the log level for the fast-upload API.
     * @return The log level for the fast-upload API.
     */
    UploadLogLevel Upload_get_log_level();

    /**
     * @brief Get the message for the given status code.
     * @param code The status code.
     * @return A human-readable status message.
     */
    const char* Upload_get_status_message(UploadStatusCode code);

    /**
     * @brief Create an upload stream.
     * @details Validates the settings, starts the upload threads, connects to
     * the S3 endpoint and checks that the bucket exists.
     * @param settings The settings for the stream.
     * @return A pointer to the stream, or NULL on failure.
     */
    UploadStream* UploadStream_create(UploadStreamSettings* settings);

    /**
     * @brief Write a single byte to the stream.
     * @param stream The stream to write to.
     * @param byte The byte to write.
     * @return UploadStatusCode_Success on success, or an error code on
     * failure.
     */
    UploadStatusCode UploadStream_write_byte(UploadStream* stream,
                                             uint8_t byte);

    /**
     * @brief Write @p length bytes starting at @p offset of @p data.
     * @details Returns without uploading anything; full parts are uploaded in
     * the background. Upload failures are reported by UploadStream_close().
     * @param stream The stream to write to.
     * @param data The source buffer.
     * @param bytes_of_data The size of the source buffer.
     * @param offset Offset into @p data of the first byte to write.
     * @param length Number of bytes to write.
     * @return UploadStatusCode_Success on success, or an error code on
     * failure.
     */
    UploadStatusCode UploadStream_write(UploadStream* stream,
                                        const void* data,
                                        size_t bytes_of_data,
                                        int64_t offset,
                                        int64_t length);

    /**
     * @brief Finish the upload.
     * @details Blocks until the object is stored or the upload has failed.
     * Only the first call does any work; later calls return the same status.
     * @param stream The stream to close.
     * @return UploadStatusCode_Success if the object was stored, or an error
     * code on failure.
     */
    UploadStatusCode UploadStream_close(UploadStream* stream);

    /**
     * @brief Ask a waiting UploadStream_close() to give up.
     * @details Outstanding parts are cancelled and the multipart upload is
     * aborted. Safe to call from any thread.
     * @param stream The stream to interrupt.
     * @return UploadStatusCode_Success on success, or an error code on
     * failure.
     */
    UploadStatusCode UploadStream_interrupt(UploadStream* stream);

    /**
     * @brief Get the last error recorded on the stream.
     * @param stream The stream.
     * @return The error message, or an empty string if there is none. The
     * pointer is valid until the next call on @p stream.
     */
    const char* UploadStream_get_error(UploadStream* stream);

    /**
     * @brief Destroy a stream, closing it first if needed.
     * @param stream The stream to destroy.
     */
    void UploadStream_destroy(UploadStream* stream);

#ifdef __cplusplus
}
#endif

#endif // H_FAST_UPLOAD_V0
