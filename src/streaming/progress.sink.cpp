#include "macros.hh"
#include "progress.sink.hh"

upload::ProgressSink::ProgressSink(Callback callback)
  : callback_(std::move(callback))
  , ticks_(0)
{
}

void
upload::ProgressSink::tick(uint32_t part_number,
                           size_t bytes_sent,
                           size_t bytes_total) noexcept
{
    std::unique_lock lock(mutex_);
    ++ticks_;

    if (!callback_) {
        return;
    }

    try {
        callback_(part_number, bytes_sent, bytes_total);
    } catch (const std::exception& exc) {
        LOG_ERROR("Progress callback failed for part ",
                  part_number,
                  ": ",
                  exc.what());
    } catch (...) {
        LOG_ERROR("Progress callback failed for part ",
                  part_number,
                  ": (unknown)");
    }
}

uint64_t
upload::ProgressSink::ticks() const
{
    std::unique_lock lock(mutex_);
    return ticks_;
}
