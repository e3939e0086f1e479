#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>

namespace upload {
/**
 * @brief Forwards transfer progress ticks to a caller-supplied callback.
 * @details Ticks may arrive from several upload threads at once; the sink
 * serializes them so the callback never runs concurrently with itself. The
 * callback must not fail an upload, so anything it throws is logged and
 * dropped.
 */
class ProgressSink
{
  public:
    using Callback = std::function<
      void(uint32_t part_number, size_t bytes_sent, size_t bytes_total)>;

    explicit ProgressSink(Callback callback);

    /**
     * @brief Report progress of one transfer.
     * @param part_number The part being uploaded, or 0 for a single-object
     * upload.
     * @param bytes_sent Bytes of the request body sent so far.
     * @param bytes_total Size of the request body.
     */
    void tick(uint32_t part_number,
              size_t bytes_sent,
              size_t bytes_total) noexcept;

    /// @brief Number of ticks delivered so far, including failed callbacks.
    uint64_t ticks() const;

  private:
    Callback callback_;

    mutable std::mutex mutex_;
    uint64_t ticks_;
};
} // namespace upload
