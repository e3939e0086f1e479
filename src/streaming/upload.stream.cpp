#include "macros.hh"
#include "s3.object.store.hh"
#include "upload.stream.hh"

#include <algorithm>
#include <cctype>
#include <thread>

namespace {
std::string
trim(const char* s)
{
    if (s == nullptr) {
        return {};
    }

    std::string trimmed(s);
    const auto not_space = [](unsigned char c) { return !std::isspace(c); };

    trimmed.erase(trimmed.begin(),
                  std::find_if(trimmed.begin(), trimmed.end(), not_space));
    trimmed.erase(std::find_if(trimmed.rbegin(), trimmed.rend(), not_space)
                    .base(),
                  trimmed.end());

    return trimmed;
}

[[nodiscard]] bool
validate_s3_settings(const UploadS3Settings* settings, std::string& error)
{
    if (settings == nullptr) {
        error = "S3 settings are required";
        return false;
    }

    if (trim(settings->endpoint).empty()) {
        error = "S3 endpoint is empty";
        return false;
    }

    std::string trimmed = trim(settings->bucket_name);
    if (trimmed.length() < 3 || trimmed.length() > 63) {
        error = "Invalid length for S3 bucket name: " +
                std::to_string(trimmed.length()) +
                ". Must be between 3 and 63 characters";
        return false;
    }

    return true;
}

upload::S3Settings
make_s3_settings(const UploadS3Settings* settings)
{
    upload::S3Settings s3_settings{ .endpoint = trim(settings->endpoint),
                                    .bucket_name =
                                      trim(settings->bucket_name) };

    if (settings->region != nullptr) {
        if (auto region = trim(settings->region); !region.empty()) {
            s3_settings.region = region;
        }
    }

    return s3_settings;
}
} // namespace

/* UploadStream_s implementation */

UploadStream::UploadStream_s(const UploadStreamSettings* settings)
  : error_()
{
    EXPECT(validate_settings_(settings), error_);

    start_thread_pool_(settings->max_threads);

    // connect and check the bucket before accepting any bytes
    EXPECT(create_store_(), error_);

    if (settings->progress_callback != nullptr) {
        auto callback = settings->progress_callback;
        auto* user_data = settings->progress_user_data;
        progress_ = std::make_shared<upload::ProgressSink>(
          [callback, user_data](
            uint32_t part_number, size_t bytes_sent, size_t bytes_total) {
              callback(part_number, bytes_sent, bytes_total, user_data);
          });
    }

    upload::StreamWriterConfig config{
        .part_size_bytes = settings->part_size_bytes,
        .multipart_threshold_bytes = settings->multipart_threshold_bytes,
        .initial_buffer_size_bytes = settings->initial_buffer_size_bytes,
    };

    writer_ = std::make_unique<upload::StreamWriter>(
      target_, metadata_, config, store_, thread_pool_, progress_);
}

UploadStream_s::~UploadStream_s()
{
    // closes the stream if it is still open
    writer_.reset();

    if (thread_pool_) {
        thread_pool_->await_stop();
    }
}

UploadStatusCode
UploadStream::write_byte(uint8_t byte)
{
    const auto status = writer_->write(byte);
    if (status != UploadStatusCode_Success) {
        set_error_(writer_->error());
    }

    return status;
}

UploadStatusCode
UploadStream::write(const void* data,
                    size_t bytes_of_data,
                    int64_t offset,
                    int64_t length)
{
    EXPECT_VALID_ARGUMENT(data != nullptr || bytes_of_data == 0,
                          "Null data pointer with ",
                          bytes_of_data,
                          " bytes of data");

    const ConstByteSpan span(static_cast<const uint8_t*>(data), bytes_of_data);
    const auto status = writer_->write(span, offset, length);
    if (status == UploadStatusCode_InvalidArgument) {
        set_error_("Invalid write arguments: offset " +
                   std::to_string(offset) + ", length " +
                   std::to_string(length) + ", buffer of " +
                   std::to_string(bytes_of_data) + " bytes");
    } else if (status != UploadStatusCode_Success) {
        set_error_(writer_->error());
    }

    return status;
}

UploadStatusCode
UploadStream::close()
{
    const auto status = writer_->close();
    if (status != UploadStatusCode_Success) {
        set_error_(writer_->error());
    }

    return status;
}

void
UploadStream::interrupt()
{
    writer_->interrupt();
}

const std::string&
UploadStream::error()
{
    return error_;
}

bool
UploadStream_s::validate_settings_(const UploadStreamSettings* settings)
{
    if (!settings) {
        error_ = "Null pointer: settings";
        return false;
    }

    if (std::string err; !validate_s3_settings(settings->s3_settings, err)) {
        error_ = err;
        return false;
    }

    std::string object_key = trim(settings->object_key);
    if (object_key.empty()) {
        error_ = "Object key is empty";
        return false;
    }

    if (settings->metadata != nullptr) {
        if (std::string err;
            !upload::parse_object_metadata(settings->metadata, metadata_, err)) {
            error_ = "Invalid object metadata: " + err;
            return false;
        }
    }

    s3_settings_ = make_s3_settings(settings->s3_settings);
    target_ = { .bucket_name = s3_settings_.bucket_name,
                .object_key = object_key };

    return true;
}

void
UploadStream_s::start_thread_pool_(uint32_t max_threads)
{
    max_threads =
      max_threads == 0 ? std::thread::hardware_concurrency() : max_threads;
    if (max_threads == 0) {
        LOG_WARNING("Unable to determine hardware concurrency, using 1 thread");
        max_threads = 1;
    }

    thread_pool_ = std::make_shared<upload::ThreadPool>(
      max_threads, [](const std::string& err) { LOG_ERROR(err); });
}

bool
UploadStream_s::create_store_()
{
    try {
        s3_connection_pool_ = std::make_shared<upload::S3ConnectionPool>(
          thread_pool_->n_threads(), s3_settings_);
    } catch (const std::exception& e) {
        set_error_("Error creating S3 connection pool: " +
                   std::string(e.what()));
        return false;
    }

    store_ = std::make_shared<upload::S3ObjectStore>(s3_connection_pool_);
    if (!store_->bucket_exists(s3_settings_.bucket_name)) {
        set_error_("Bucket '" + s3_settings_.bucket_name +
                   "' does not exist");
        return false;
    }

    return true;
}

void
UploadStream_s::set_error_(const std::string& msg)
{
    error_ = msg;
}
