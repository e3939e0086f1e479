#include "fast.upload.h"
#include "macros.hh"
#include "upload.stream.hh"

#include <cstdint> // uint32_t

#define FAST_UPLOAD_API_VERSION 0

extern "C"
{
    uint32_t Upload_get_api_version()
    {
        return FAST_UPLOAD_API_VERSION;
    }

    UploadStatusCode Upload_set_log_level(UploadLogLevel level_)
    {
        if (level_ < UploadLogLevel_Debug || level_ >= UploadLogLevelCount) {
            return UploadStatusCode_InvalidArgument;
        }

        Logger::set_log_level(level_);
        return UploadStatusCode_Success;
    }

    UploadLogLevel Upload_get_log_level()
    {
        return Logger::get_log_level();
    }

    const char* Upload_get_status_message(UploadStatusCode code)
    {
        switch (code) {
            case UploadStatusCode_Success:
                return "Success";
            case UploadStatusCode_InvalidArgument:
                return "Invalid argument";
            case UploadStatusCode_InvalidSettings:
                return "Invalid settings";
            case UploadStatusCode_StreamClosed:
                return "Stream is closed";
            case UploadStatusCode_InitiationError:
                return "Failed to initiate multipart upload";
            case UploadStatusCode_PartUploadError:
                return "Failed to upload part";
            case UploadStatusCode_CompletionError:
                return "Failed to complete multipart upload";
            case UploadStatusCode_PutObjectError:
                return "Failed to upload object";
            case UploadStatusCode_Interrupted:
                return "Interrupted";
            case UploadStatusCode_InternalError:
                return "Internal error";
            default:
                return "Unknown error";
        }
    }

    UploadStream* UploadStream_create(UploadStreamSettings* settings)
    {
        UploadStream_s* stream = nullptr;

        try {
            stream = new UploadStream_s(settings);
        } catch (const std::bad_alloc&) {
            LOG_ERROR("Failed to allocate memory for upload stream");
        } catch (const std::exception& e) {
            LOG_ERROR("Error creating upload stream: ", e.what());
        }

        return stream;
    }

    UploadStatusCode UploadStream_write_byte(UploadStream* stream,
                                             uint8_t byte)
    {
        EXPECT_VALID_ARGUMENT(stream, "Null pointer: stream");

        try {
            return stream->write_byte(byte);
        } catch (const std::exception& e) {
            LOG_ERROR("Error writing to stream: ", e.what());
            return UploadStatusCode_InternalError;
        }
    }

    UploadStatusCode UploadStream_write(UploadStream* stream,
                                        const void* data,
                                        size_t bytes_of_data,
                                        int64_t offset,
                                        int64_t length)
    {
        EXPECT_VALID_ARGUMENT(stream, "Null pointer: stream");

        try {
            return stream->write(data, bytes_of_data, offset, length);
        } catch (const std::exception& e) {
            LOG_ERROR("Error writing to stream: ", e.what());
            return UploadStatusCode_InternalError;
        }
    }

    UploadStatusCode UploadStream_close(UploadStream* stream)
    {
        EXPECT_VALID_ARGUMENT(stream, "Null pointer: stream");

        try {
            return stream->close();
        } catch (const std::exception& e) {
            LOG_ERROR("Error closing stream: ", e.what());
            return UploadStatusCode_InternalError;
        }
    }

    UploadStatusCode UploadStream_interrupt(UploadStream* stream)
    {
        EXPECT_VALID_ARGUMENT(stream, "Null pointer: stream");

        stream->interrupt();
        return UploadStatusCode_Success;
    }

    const char* UploadStream_get_error(UploadStream* stream)
    {
        if (!stream) {
            return "";
        }

        return stream->error().c_str();
    }

    void UploadStream_destroy(UploadStream* stream)
    {
        if (stream == nullptr) {
            LOG_INFO("Stream is null. Nothing to destroy.");
            return;
        }

        // closes the stream if it is still open
        delete stream;
    }
}
