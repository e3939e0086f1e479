#ifndef H_FAST_UPLOAD_TYPES_V0
#define H_FAST_UPLOAD_TYPES_V0

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C"
{
#endif

    typedef enum
    {
        UploadStatusCode_Success = 0,
        UploadStatusCode_InvalidArgument,
        UploadStatusCode_InvalidSettings,
        UploadStatusCode_StreamClosed,
        UploadStatusCode_InitiationError,
        UploadStatusCode_PartUploadError,
        UploadStatusCode_CompletionError,
        UploadStatusCode_PutObjectError,
        UploadStatusCode_Interrupted,
        UploadStatusCode_InternalError,
        UploadStatusCodeCount,
    } UploadStatusCode;

    typedef enum
    {
        UploadLogLevel_Debug = 0,
        UploadLogLevel_Info,
        UploadLogLevel_Warning,
        UploadLogLevel_Error,
        UploadLogLevel_None,
        UploadLogLevelCount
    } UploadLogLevel;

    /**
     * @brief S3 settings for the upload destination.
     * @details Credentials are read from the AWS_ACCESS_KEY_ID,
     * AWS_SECRET_ACCESS_KEY and (optionally) AWS_SESSION_TOKEN environment
     * variables.
     */
    typedef struct
    {
        const char* endpoint;
        const char* bucket_name;
        const char* region;
    } UploadS3Settings;

    /**
     * @brief Callback invoked on every transfer progress tick.
     * @details @p part_number is 0 for a single-object upload. Calls are
     * serialized, but may come from any worker thread.
     */
    typedef void (*UploadProgressCallback)(uint32_t part_number,
                                           size_t bytes_sent,
                                           size_t bytes_total,
                                           void* user_data);

    /**
     * @brief Settings for an upload stream.
     * @details Non-positive sizes fall back to their defaults, sizes above
     * the maximum buffer size are capped. Both conditions are logged as
     * warnings.
     */
    typedef struct
    {
        UploadS3Settings* s3_settings; /**< Destination S3 settings */
        const char* object_key;        /**< Key of the object to write */
        const char* metadata; /**< Optional JSON object of object metadata */
        int64_t part_size_bytes; /**< Size of each part of a multipart upload */
        int64_t multipart_threshold_bytes; /**< Objects at least this large
                                                use a multipart upload */
        int64_t initial_buffer_size_bytes; /**< Initial write buffer size */
        uint32_t max_threads; /**< Upload threads. 0 uses all cores */
        UploadProgressCallback progress_callback; /**< Optional */
        void* progress_user_data; /**< Passed through to progress_callback */
    } UploadStreamSettings;

    typedef struct UploadStream_s UploadStream;

#ifdef __cplusplus
}
#endif

#endif // H_FAST_UPLOAD_TYPES_V0
