#include "macros.hh"
#include "stream.writer.hh"

#include <atomic>
#include <condition_variable>
#include <limits>
#include <string_view>

namespace {
size_t
normalize_size(int64_t requested, size_t default_value, std::string_view name)
{
    if (requested <= 0) {
        LOG_WARNING(name,
                    " should be a positive number, got ",
                    requested,
                    ". Using default value ",
                    default_value);
        return default_value;
    }

    if (static_cast<uint64_t>(requested) > upload::MAX_BUFFER_SIZE) {
        LOG_WARNING(name,
                    " capped to ",
                    upload::MAX_BUFFER_SIZE,
                    " bytes (maximum buffer size), got ",
                    requested);
        return upload::MAX_BUFFER_SIZE;
    }

    return static_cast<size_t>(requested);
}

struct PutState
{
    std::mutex mutex;
    std::condition_variable_any cv;
    bool settled{ false };
    bool succeeded{ false };
    std::string error;
    std::atomic<bool> cancelled{ false };
};
} // namespace

upload::BufferPolicy
upload::make_buffer_policy(const StreamWriterConfig& config)
{
    BufferPolicy policy{};
    policy.part_size =
      normalize_size(config.part_size_bytes, DEFAULT_PART_SIZE, "Part size");
    policy.multipart_threshold =
      normalize_size(config.multipart_threshold_bytes,
                     DEFAULT_MULTIPART_THRESHOLD,
                     "Multipart threshold");

    if (config.initial_buffer_size_bytes <= 0) {
        LOG_WARNING("Initial buffer size should be a positive number, got ",
                    config.initial_buffer_size_bytes,
                    ". Using default value ",
                    DEFAULT_INITIAL_BUFFER_SIZE);
        policy.initial_buffer_size = DEFAULT_INITIAL_BUFFER_SIZE;
    } else {
        policy.initial_buffer_size =
          static_cast<size_t>(config.initial_buffer_size_bytes);
    }

    if (policy.initial_buffer_size > policy.multipart_threshold) {
        LOG_WARNING("Adjusting initial buffer size from ",
                    policy.initial_buffer_size,
                    " to not exceed the multipart threshold of ",
                    policy.multipart_threshold,
                    " bytes");
        policy.initial_buffer_size = policy.multipart_threshold;
    }

    return policy;
}

upload::StreamWriter::StreamWriter(UploadTarget target,
                                   ObjectMetadata metadata,
                                   const StreamWriterConfig& config,
                                   std::shared_ptr<ObjectStore> store,
                                   std::shared_ptr<ThreadPool> thread_pool,
                                   std::shared_ptr<ProgressSink> progress)
  : target_(std::move(target))
  , metadata_(std::move(metadata))
  , policy_(make_buffer_policy(config))
  , store_(std::move(store))
  , thread_pool_(std::move(thread_pool))
  , progress_(std::move(progress))
  , buffer_(policy_.multipart_threshold, policy_.initial_buffer_size)
  , mode_(UploadMode::Undetermined)
  , closed_(false)
  , status_(UploadStatusCode_Success)
  , bytes_written_(0)
{
    EXPECT(!target_.bucket_name.empty(), "Bucket name must not be empty.");
    EXPECT(!target_.object_key.empty(), "Object key must not be empty.");
    EXPECT(store_, "Object store not provided.");
    EXPECT(thread_pool_, "Thread pool not provided.");

    LOG_DEBUG("Initialized stream writer for bucket '",
              target_.bucket_name,
              "' key '",
              target_.object_key,
              "'");
}

upload::StreamWriter::~StreamWriter()
{
    try {
        if (!is_closed()) {
            if (const auto status = close(); status != UploadStatusCode_Success) {
                LOG_ERROR("Failed to close stream for key '",
                          target_.object_key,
                          "': ",
                          error());
            }
        }
    } catch (const std::exception& exc) {
        LOG_ERROR("Error: ", exc.what());
    }
}

UploadStatusCode
upload::StreamWriter::write(uint8_t byte)
{
    std::unique_lock lock(mutex_);
    if (closed_) {
        LOG_ERROR("Cannot write to closed stream for key '",
                  target_.object_key,
                  "'");
        return UploadStatusCode_StreamClosed;
    }

    if (status_ != UploadStatusCode_Success) {
        return status_;
    }

    try {
        CHECK(buffer_.push_back(byte));
        ++bytes_written_;

        if (buffer_.full()) {
            return flush_buffer_();
        }
    } catch (const std::exception& exc) {
        fail_(std::string("Failed to write to stream: ") + exc.what());
        return status_;
    } catch (...) {
        fail_("Failed to write to stream: (unknown)");
        return status_;
    }

    return UploadStatusCode_Success;
}

UploadStatusCode
upload::StreamWriter::write(ConstByteSpan data, int64_t offset, int64_t length)
{
    EXPECT_VALID_ARGUMENT(offset >= 0, "Invalid offset: ", offset);
    EXPECT_VALID_ARGUMENT(length >= 0, "Invalid length: ", length);
    EXPECT_VALID_ARGUMENT(offset <= std::numeric_limits<int64_t>::max() -
                                      length,
                          "Offset ",
                          offset,
                          " plus length ",
                          length,
                          " overflows");
    EXPECT_VALID_ARGUMENT(static_cast<uint64_t>(offset + length) <=
                            data.size(),
                          "Window [",
                          offset,
                          ", ",
                          offset + length,
                          ") exceeds the ",
                          data.size(),
                          " bytes of data");

    std::unique_lock lock(mutex_);
    if (closed_) {
        LOG_ERROR("Cannot write to closed stream for key '",
                  target_.object_key,
                  "'");
        return UploadStatusCode_StreamClosed;
    }

    if (status_ != UploadStatusCode_Success) {
        return status_;
    }

    auto remaining = data.subspan(static_cast<size_t>(offset),
                                  static_cast<size_t>(length));
    try {
        while (!remaining.empty()) {
            const auto n = buffer_.append(remaining);
            bytes_written_ += n;
            remaining = remaining.subspan(n);

            if (buffer_.full()) {
                if (const auto status = flush_buffer_();
                    status != UploadStatusCode_Success) {
                    return status;
                }
            }
        }
    } catch (const std::exception& exc) {
        fail_(std::string("Failed to write to stream: ") + exc.what());
        return status_;
    } catch (...) {
        fail_("Failed to write to stream: (unknown)");
        return status_;
    }

    return UploadStatusCode_Success;
}

UploadStatusCode
upload::StreamWriter::write(ConstByteSpan data)
{
    return write(data, 0, static_cast<int64_t>(data.size()));
}

UploadStatusCode
upload::StreamWriter::close()
{
    std::unique_lock lock(mutex_);
    if (closed_) {
        return status_;
    }
    closed_ = true;

    if (status_ != UploadStatusCode_Success) {
        LOG_ERROR("Closing failed stream for key '",
                  target_.object_key,
                  "': ",
                  error_);
        buffer_.reset(1, 0);
        return status_;
    }

    // failed until the upload is known to be stored
    status_ = UploadStatusCode_InternalError;
    error_ = "Stream for key '" + target_.object_key + "' did not finish";

    UploadStatusCode status = UploadStatusCode_InternalError;
    try {
        if (session_ == nullptr) {
            status = put_object_();
            if (status == UploadStatusCode_Success) {
                mode_ = UploadMode::SingleObject;
            }
        } else {
            status = finalize_multipart_upload_();
        }
    } catch (const std::exception& exc) {
        fail_(std::string("Failed to close stream: ") + exc.what());
    } catch (...) {
        fail_("Failed to close stream: (unknown)");
    }

    buffer_.reset(1, 0); // release the buffer

    if (status == UploadStatusCode_Success) {
        status_ = UploadStatusCode_Success;
        error_.clear();
        LOG_DEBUG("Upload complete for bucket '",
                  target_.bucket_name,
                  "' key '",
                  target_.object_key,
                  "' (",
                  bytes_written_,
                  " bytes)");
    }

    return status_;
}

void
upload::StreamWriter::interrupt()
{
    LOG_INFO("Interrupt requested for key '", target_.object_key, "'");
    stop_source_.request_stop();
}

upload::UploadMode
upload::StreamWriter::mode() const
{
    std::unique_lock lock(mutex_);
    return mode_;
}

bool
upload::StreamWriter::is_closed() const
{
    std::unique_lock lock(mutex_);
    return closed_;
}

size_t
upload::StreamWriter::bytes_written() const
{
    std::unique_lock lock(mutex_);
    return bytes_written_;
}

std::string
upload::StreamWriter::error() const
{
    std::unique_lock lock(mutex_);
    return error_;
}

const upload::BufferPolicy&
upload::StreamWriter::policy() const
{
    return policy_;
}

UploadStatusCode
upload::StreamWriter::flush_buffer_()
{
    if (session_ != nullptr) {
        session_->submit_part(buffer_.take());
        return UploadStatusCode_Success;
    }

    if (const auto status = open_session_();
        status != UploadStatusCode_Success) {
        return status;
    }

    const auto part_size = policy_.part_size;
    UploadBuffer next(part_size, part_size);

    // the initial buffer may hold several parts
    const ByteVector bytes = buffer_.release();
    LOG_DEBUG("Total length of initial buffer: ", bytes.size());

    size_t offset = 0;
    while (bytes.size() - offset >= part_size) {
        LOG_DEBUG("Initial buffer: processing from byte ",
                  offset,
                  " to byte ",
                  offset + part_size - 1);
        session_->submit_part(
          ByteVector(bytes.begin() + offset, bytes.begin() + offset + part_size));
        offset += part_size;
    }

    const ConstByteSpan tail(bytes.data() + offset, bytes.size() - offset);
    CHECK(next.append(tail) == tail.size());
    buffer_ = std::move(next);

    return UploadStatusCode_Success;
}

UploadStatusCode
upload::StreamWriter::open_session_()
{
    std::string error;
    session_ = MultipartSession::open(
      store_, thread_pool_, target_, metadata_, progress_, error);

    if (session_ == nullptr) {
        set_error_(UploadStatusCode_InitiationError,
                   "Failed to initiate multipart upload for key '" +
                     target_.object_key + "': " + error);
        buffer_.reset(1, 0);
        return status_;
    }

    mode_ = UploadMode::Multipart;
    return UploadStatusCode_Success;
}

UploadStatusCode
upload::StreamWriter::put_object_()
{
    LOG_DEBUG("Executing regular upload for bucket '",
              target_.bucket_name,
              "' key '",
              target_.object_key,
              "'");

    auto bytes = std::make_shared<const ByteVector>(buffer_.release());
    auto state = std::make_shared<PutState>();

    auto job = [state,
                bytes,
                store = store_,
                progress = progress_,
                target = target_,
                metadata = metadata_](std::string& err) -> bool {
        bool success = false;
        std::string error;

        if (state->cancelled) {
            error = "Upload cancelled";
        } else {
            const TransferCallback on_progress =
              [&state, &progress](size_t sent, size_t total) {
                  if (progress) {
                      progress->tick(0, sent, total);
                  }
                  return !state->cancelled;
              };

            try {
                success =
                  store->put_object(target, metadata, *bytes, on_progress, error);
            } catch (const std::exception& exc) {
                error = exc.what();
            } catch (...) {
                error = "(unknown)";
            }
        }

        if (!success) {
            err = error;
        }

        std::unique_lock lock(state->mutex);
        state->settled = true;
        state->succeeded = success;
        state->error = std::move(error);
        state->cv.notify_all();

        return success;
    };

    if (!thread_pool_->push_job(job)) {
        if (std::string err; !job(err)) {
            LOG_ERROR(err);
        }
    }

    std::unique_lock lock(state->mutex);
    if (!state->cv.wait(lock, stop_source_.get_token(), [&state] {
            return state->settled;
        })) {
        state->cancelled = true;
        set_error_(UploadStatusCode_Interrupted,
                   "Interrupted while uploading object '" +
                     target_.object_key + "'");
        return status_;
    }

    if (!state->succeeded) {
        set_error_(UploadStatusCode_PutObjectError,
                   "Failed to upload object '" + target_.object_key +
                     "': " + state->error);
        return status_;
    }

    return UploadStatusCode_Success;
}

UploadStatusCode
upload::StreamWriter::finalize_multipart_upload_()
{
    // send last part
    if (!buffer_.empty()) {
        session_->submit_part(buffer_.release());
    }

    std::vector<UploadedPart> parts;
    std::string error;

    auto status = session_->await_all(stop_source_.get_token(), parts, error);
    if (status != UploadStatusCode_Success) {
        set_error_(status, error);
        return status;
    }

    status = session_->complete(parts, error);
    if (status != UploadStatusCode_Success) {
        set_error_(status, error);
        session_->abort();
        return status;
    }

    return UploadStatusCode_Success;
}

void
upload::StreamWriter::fail_(const std::string& msg)
{
    set_error_(UploadStatusCode_InternalError, msg);

    if (session_ != nullptr) {
        session_->cancel();
        session_->abort();
    }
}

void
upload::StreamWriter::set_error_(UploadStatusCode status, const std::string& msg)
{
    status_ = status;
    error_ = msg;
    LOG_ERROR(msg);
}
