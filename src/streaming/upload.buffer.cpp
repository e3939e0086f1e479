#include "macros.hh"
#include "upload.buffer.hh"

#include <algorithm>

upload::UploadBuffer::UploadBuffer(size_t limit, size_t initial_capacity)
  : limit_(0)
  , capacity_(0)
{
    reset(limit, initial_capacity);
}

size_t
upload::UploadBuffer::append(ConstByteSpan data)
{
    const auto n = std::min(data.size(), remaining());
    if (n > 0) {
        data_.insert(data_.end(), data.begin(), data.begin() + n);
    }

    return n;
}

bool
upload::UploadBuffer::push_back(uint8_t byte)
{
    if (full()) {
        return false;
    }

    data_.push_back(byte);
    return true;
}

size_t
upload::UploadBuffer::size() const
{
    return data_.size();
}

size_t
upload::UploadBuffer::limit() const
{
    return limit_;
}

size_t
upload::UploadBuffer::remaining() const
{
    return limit_ - data_.size();
}

bool
upload::UploadBuffer::empty() const
{
    return data_.empty();
}

bool
upload::UploadBuffer::full() const
{
    return data_.size() >= limit_;
}

ConstByteSpan
upload::UploadBuffer::view() const
{
    return { data_.data(), data_.size() };
}

ByteVector
upload::UploadBuffer::take()
{
    ByteVector fresh;
    fresh.reserve(capacity_);

    fresh.swap(data_);
    return fresh;
}

ByteVector
upload::UploadBuffer::release()
{
    ByteVector out;
    out.swap(data_);

    return out;
}

void
upload::UploadBuffer::reset(size_t limit, size_t initial_capacity)
{
    EXPECT(limit > 0, "Buffer limit must be positive.");

    const auto capacity = std::min(initial_capacity, limit);

    ByteVector fresh;
    fresh.reserve(capacity);

    data_.swap(fresh);
    limit_ = limit;
    capacity_ = capacity;
}
