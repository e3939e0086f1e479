#include "mock.object.store.hh"
#include "stream.writer.hh"
#include "unit.test.macros.hh"

#include <random>

namespace {
const upload::UploadTarget target{ "test-bucket", TEST ".bin" };

void
err_callback(const std::string& err)
{
    LOG_ERROR(err);
}

// Write `total` bytes in random windows of a larger scratch buffer, with
// the occasional single byte, and check what the store received.
void
write_in_random_chunks(size_t total,
                       int64_t threshold,
                       int64_t part_size,
                       unsigned int seed)
{
    auto store = std::make_shared<upload::test::MockObjectStore>();
    auto thread_pool = std::make_shared<upload::ThreadPool>(3, err_callback);

    upload::StreamWriterConfig config;
    config.part_size_bytes = part_size;
    config.multipart_threshold_bytes = threshold;
    config.initial_buffer_size_bytes = 8;

    upload::StreamWriter writer(target, {}, config, store, thread_pool);

    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> byte_dist(0, 255);
    std::uniform_int_distribution<size_t> len_dist(0, 50);

    ByteVector expected;
    ByteVector scratch(64);
    while (expected.size() < total) {
        const auto len = std::min(len_dist(rng), total - expected.size());
        if (len == 1) {
            const auto byte = static_cast<uint8_t>(byte_dist(rng));
            CHECK_OK(writer.write(byte));
            expected.push_back(byte);
            continue;
        }

        for (auto& b : scratch) {
            b = static_cast<uint8_t>(byte_dist(rng));
        }
        const auto offset =
          std::uniform_int_distribution<size_t>(0, scratch.size() - len)(rng);

        CHECK_OK(writer.write(scratch,
                              static_cast<int64_t>(offset),
                              static_cast<int64_t>(len)));
        expected.insert(expected.end(),
                        scratch.begin() + offset,
                        scratch.begin() + offset + len);
    }

    EXPECT_EQ(int, writer.bytes_written(), total);
    CHECK_OK(writer.close());

    if (total < static_cast<size_t>(threshold)) {
        CHECK(writer.mode() == upload::UploadMode::SingleObject);
        EXPECT_EQ(int, store->n_initiate(), 0);

        const auto puts = store->puts();
        EXPECT_EQ(int, puts.size(), 1);
        CHECK(puts[0].data == expected);
        return;
    }

    CHECK(writer.mode() == upload::UploadMode::Multipart);
    CHECK(store->puts().empty());
    CHECK(store->assembled() == expected);

    const auto parts = store->parts();
    const auto tokens = store->completed_parts();
    EXPECT_EQ(int, tokens.size(), parts.size());

    size_t sum = 0;
    for (auto i = 0; i < tokens.size(); ++i) {
        EXPECT_EQ(int, tokens[i].number, i + 1);
        const auto size = parts.at(tokens[i].number).size();
        CHECK(size > 0);
        if (i + 1 < tokens.size()) {
            EXPECT_EQ(int, size, part_size);
        } else {
            CHECK(size <= static_cast<size_t>(part_size));
        }
        sum += size;
    }
    EXPECT_EQ(int, sum, total);
}
} // namespace

int
main()
{
    int retval = 1;

    try {
        write_in_random_chunks(1000, 64, 16, 1);
        write_in_random_chunks(1000, 10, 7, 2);
        write_in_random_chunks(777, 3, 100, 3); // threshold below part size
        write_in_random_chunks(128, 128, 32, 4); // exactly the threshold
        write_in_random_chunks(99, 100, 10, 5);  // one byte short
        retval = 0;
    } catch (const std::exception& exc) {
        LOG_ERROR("Test failed: ", exc.what());
    }

    return retval;
}
