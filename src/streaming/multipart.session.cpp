#include "macros.hh"
#include "multipart.session.hh"

std::unique_ptr<upload::MultipartSession>
upload::MultipartSession::open(std::shared_ptr<ObjectStore> store,
                               std::shared_ptr<ThreadPool> thread_pool,
                               const UploadTarget& target,
                               const ObjectMetadata& metadata,
                               std::shared_ptr<ProgressSink> progress,
                               std::string& error)
{
    EXPECT(store, "Object store not provided.");
    EXPECT(thread_pool, "Thread pool not provided.");

    std::string upload_id;
    bool success = false;
    try {
        success =
          store->create_multipart_upload(target, metadata, upload_id, error);
    } catch (const std::exception& exc) {
        error = exc.what();
    }

    if (!success || upload_id.empty()) {
        if (error.empty()) {
            error = "No upload ID returned";
        }
        return nullptr;
    }

    LOG_DEBUG("Initiated multipart upload for bucket '",
              target.bucket_name,
              "' key '",
              target.object_key,
              "' with id '",
              upload_id,
              "'");

    return std::make_unique<MultipartSession>(std::move(store),
                                              std::move(thread_pool),
                                              target,
                                              std::move(upload_id),
                                              std::move(progress));
}

upload::MultipartSession::MultipartSession(
  std::shared_ptr<ObjectStore> store,
  std::shared_ptr<ThreadPool> thread_pool,
  const UploadTarget& target,
  std::string upload_id,
  std::shared_ptr<ProgressSink> progress)
  : store_(std::move(store))
  , thread_pool_(std::move(thread_pool))
  , target_(target)
  , upload_id_(std::move(upload_id))
  , progress_(std::move(progress))
  , state_(std::make_shared<State>())
  , completed_(false)
  , aborted_(false)
{
    EXPECT(store_, "Object store not provided.");
    EXPECT(thread_pool_, "Thread pool not provided.");
    EXPECT(!upload_id_.empty(), "Upload ID must not be empty.");
}

upload::MultipartSession::~MultipartSession()
{
    cancel();
    abort(); // no-op once completed or aborted
}

unsigned int
upload::MultipartSession::submit_part(ByteVector&& data)
{
    EXPECT(!data.empty(), "Cannot upload an empty part.");

    unsigned int part_number;
    {
        std::unique_lock lock(state_->mutex);
        part_number = static_cast<unsigned int>(state_->parts.size()) + 1;
        state_->parts.push_back({ .number = part_number, .size = data.size() });
    }

    // sealed: nothing writes to these bytes after this point
    auto bytes = std::make_shared<const ByteVector>(std::move(data));

    auto job = [state = state_,
                store = store_,
                progress = progress_,
                target = target_,
                upload_id = upload_id_,
                part_number,
                bytes](std::string& err) -> bool {
        bool success = false;
        std::string etag;

        const bool skipped = state->cancelled;
        if (skipped) {
            err = "Part " + std::to_string(part_number) +
                  " cancelled before upload";
        } else {
            LOG_DEBUG("Uploading part ",
                      part_number,
                      " (",
                      bytes->size(),
                      " bytes) for id '",
                      upload_id,
                      "'");

            const TransferCallback on_progress =
              [&state, &progress, part_number](size_t sent, size_t total) {
                  if (progress) {
                      progress->tick(part_number, sent, total);
                  }
                  return !state->cancelled;
              };

            try {
                success = store->upload_part(
                  target, upload_id, part_number, *bytes, on_progress, etag, err);
            } catch (const std::exception& exc) {
                err = exc.what();
            } catch (...) {
                err = "(unknown)";
            }

            if (!success && err.empty()) {
                err = "Failed to upload part " + std::to_string(part_number);
            }
        }

        std::unique_lock lock(state->mutex);
        auto& part = state->parts[part_number - 1];
        part.settled = true;
        part.succeeded = success;
        part.etag = std::move(etag);

        if (!success && !skipped && state->first_error.empty()) {
            state->first_error = err;
            state->cancelled = true;
        }

        ++state->n_settled;
        state->cv.notify_all();

        return success || skipped;
    };

    LOG_DEBUG("Submitting part ",
              part_number,
              " (",
              bytes->size(),
              " bytes) for id '",
              upload_id_,
              "'");

    if (!thread_pool_->push_job(job)) {
        if (std::string err; !job(err)) {
            LOG_ERROR(err);
        }
    }

    return part_number;
}

UploadStatusCode
upload::MultipartSession::await_all(std::stop_token stop_token,
                                    std::vector<UploadedPart>& parts,
                                    std::string& error)
{
    std::unique_lock lock(state_->mutex);
    const bool all_settled = state_->cv.wait(lock, stop_token, [this] {
        return state_->n_settled == state_->parts.size();
    });

    if (!all_settled) {
        const auto n_pending = state_->parts.size() - state_->n_settled;
        error = "Interrupted while waiting for " + std::to_string(n_pending) +
                " of " + std::to_string(state_->parts.size()) +
                " parts of multipart upload with id '" + upload_id_ + "'";
        lock.unlock();

        cancel();
        abort();
        return UploadStatusCode_Interrupted;
    }

    std::string failure = state_->first_error;
    if (failure.empty()) {
        for (const auto& part : state_->parts) {
            if (!part.succeeded) {
                failure = "Part " + std::to_string(part.number) +
                          " was cancelled";
                break;
            }
        }
    }

    if (!failure.empty()) {
        error = "Multipart upload with id '" + upload_id_ +
                "' failed: " + failure;
        lock.unlock();

        abort();
        return UploadStatusCode_PartUploadError;
    }

    parts.clear();
    parts.reserve(state_->parts.size());
    for (const auto& part : state_->parts) {
        parts.push_back(
          { .number = part.number, .etag = part.etag, .size = part.size });
    }

    return UploadStatusCode_Success;
}

UploadStatusCode
upload::MultipartSession::complete(const std::vector<UploadedPart>& parts,
                                   std::string& error)
{
    LOG_DEBUG("Completing multipart upload for key '",
              target_.object_key,
              "', id '",
              upload_id_,
              "' with ",
              parts.size(),
              " parts");

    bool success = false;
    std::string err;
    if (parts.empty()) {
        err = "No parts to complete";
    } else {
        try {
            success = store_->complete_multipart_upload(
              target_, upload_id_, parts, err);
        } catch (const std::exception& exc) {
            err = exc.what();
        }
    }

    if (!success) {
        error = "Failed to complete multipart upload with id '" + upload_id_ +
                "': " + err;
        return UploadStatusCode_CompletionError;
    }

    completed_ = true;
    return UploadStatusCode_Success;
}

void
upload::MultipartSession::abort() noexcept
{
    if (aborted_ || completed_) {
        return;
    }
    aborted_ = true;

    LOG_WARNING("Aborting multipart upload with id '", upload_id_, "'");

    std::string error;
    bool success = false;
    try {
        success = store_->abort_multipart_upload(target_, upload_id_, error);
    } catch (const std::exception& exc) {
        error = exc.what();
    }

    if (!success) {
        LOG_WARNING("Unable to abort multipart upload with id '",
                    upload_id_,
                    "', you may need to purge uploaded parts: ",
                    error);
    }
}

void
upload::MultipartSession::cancel()
{
    state_->cancelled = true;
}

const std::string&
upload::MultipartSession::upload_id() const
{
    return upload_id_;
}

size_t
upload::MultipartSession::parts_submitted() const
{
    std::unique_lock lock(state_->mutex);
    return state_->parts.size();
}
