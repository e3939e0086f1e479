#pragma once

#include "fast.upload.types.h"
#include "object.store.hh"
#include "progress.sink.hh"
#include "s3.connection.hh"
#include "stream.writer.hh"
#include "thread.pool.hh"

#include <cstddef> // size_t
#include <memory>  // unique_ptr
#include <string>

struct UploadStream_s
{
  public:
    UploadStream_s(const UploadStreamSettings* settings);
    ~UploadStream_s();

    /**
     * @brief Write a single byte to the stream.
     * @param byte The byte to write.
     * @return UploadStatusCode_Success on success, or an error code on
     * failure.
     */
    UploadStatusCode write_byte(uint8_t byte);

    /**
     * @brief Write @p length bytes of @p data, starting at @p offset.
     * @param data The source buffer.
     * @param bytes_of_data The size of the source buffer.
     * @param offset Offset of the first byte to write.
     * @param length Number of bytes to write.
     * @return UploadStatusCode_Success on success, or an error code on
     * failure.
     */
    UploadStatusCode write(const void* data,
                           size_t bytes_of_data,
                           int64_t offset,
                           int64_t length);

    /**
     * @brief Finish the upload.
     * @return UploadStatusCode_Success if the object was stored, or an error
     * code on failure.
     */
    UploadStatusCode close();

    void interrupt();

    /**
     * @brief The last error recorded on the stream.
     * @return The error message, empty if no error occurred.
     */
    const std::string& error();

  private:
    std::string error_; // error message. If nonempty, an error occurred.

    upload::S3Settings s3_settings_;
    upload::UploadTarget target_;
    upload::ObjectMetadata metadata_;

    std::shared_ptr<upload::ThreadPool> thread_pool_;
    std::shared_ptr<upload::S3ConnectionPool> s3_connection_pool_;
    std::shared_ptr<upload::ObjectStore> store_;
    std::shared_ptr<upload::ProgressSink> progress_;
    std::unique_ptr<upload::StreamWriter> writer_;

    /**
     * @brief Check that the settings are valid and copy them to the stream.
     * @note Sets the error_ member if settings are invalid.
     * @param settings Struct containing settings to validate.
     * @return true if settings are valid, false otherwise.
     */
    [[nodiscard]] bool validate_settings_(const UploadStreamSettings* settings);

    /**
     * @brief Spin up the thread pool.
     */
    void start_thread_pool_(uint32_t max_threads);

    /** @brief Connect to S3 and check that the bucket exists. */
    [[nodiscard]] bool create_store_();

    /**
     * @brief Set an error message.
     * @param msg The error message to set.
     */
    void set_error_(const std::string& msg);
};
