#pragma once

#include "definitions.hh"

#include <cstddef>

namespace upload {
/**
 * @brief A byte buffer that holds at most limit() bytes.
 * @details The buffer is not synchronized: its owner serializes access.
 * Bytes leave the buffer only through take(), which hands the whole
 * allocation to the caller and starts a fresh one.
 */
class UploadBuffer
{
  public:
    /**
     * @brief Create an empty buffer.
     * @param limit Maximum number of bytes the buffer may hold.
     * @param initial_capacity Bytes to reserve up front, capped at @p limit.
     */
    UploadBuffer(size_t limit, size_t initial_capacity);

    /**
     * @brief Append as many bytes of @p data as fit below the limit.
     * @return The number of bytes appended.
     */
    size_t append(ConstByteSpan data);

    /**
     * @brief Append a single byte.
     * @return False if the buffer is full, true otherwise.
     */
    [[nodiscard]] bool push_back(uint8_t byte);

    size_t size() const;
    size_t limit() const;
    size_t remaining() const;
    bool empty() const;
    bool full() const;

    ConstByteSpan view() const;

    /**
     * @brief Move the buffered bytes out.
     * @details The buffer keeps its limit and reserves a fresh allocation,
     * so the returned bytes are never aliased by later writes. If the
     * allocation fails the buffer is left unchanged.
     * @return The bytes that were buffered.
     */
    [[nodiscard]] ByteVector take();

    /**
     * @brief Move the buffered bytes out without reserving a new allocation.
     * @details For the last bytes of a stream. The buffer keeps its limit.
     * @return The bytes that were buffered.
     */
    [[nodiscard]] ByteVector release();

    /**
     * @brief Drop any buffered bytes and change the limit.
     * @details If the allocation fails the buffer is left unchanged.
     * @param limit The new limit.
     * @param initial_capacity Bytes to reserve up front, capped at @p limit.
     */
    void reset(size_t limit, size_t initial_capacity);

  private:
    ByteVector data_;
    size_t limit_;
    size_t capacity_;
};
} // namespace upload
