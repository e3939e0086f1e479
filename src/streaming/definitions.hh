#pragma once

#include <cstddef> // size_t
#include <cstdint> // uint8_t
#include <span>
#include <vector>

using ByteVector = std::vector<uint8_t>;

using ByteSpan = std::span<uint8_t>;
using ConstByteSpan = std::span<const uint8_t>;

namespace upload {
constexpr size_t KiB = 1ULL << 10;
constexpr size_t MiB = 1ULL << 20;
constexpr size_t GiB = 1ULL << 30;

/// Largest buffer the writer will hold, also the largest S3 PUT or part.
constexpr size_t MAX_BUFFER_SIZE = 5 * GiB;

constexpr size_t DEFAULT_PART_SIZE = 5 * MiB;
constexpr size_t DEFAULT_MULTIPART_THRESHOLD = 5 * MiB;
constexpr size_t DEFAULT_INITIAL_BUFFER_SIZE = 1 * MiB;
} // namespace upload
