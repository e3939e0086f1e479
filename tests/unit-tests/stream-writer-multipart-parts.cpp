#include "mock.object.store.hh"
#include "stream.writer.hh"
#include "unit.test.macros.hh"

#include <numeric>

namespace {
const upload::UploadTarget target{ "test-bucket", TEST ".bin" };

void
err_callback(const std::string& err)
{
    LOG_ERROR(err);
}
} // namespace

// threshold 10, part size 4, 15 bytes: parts of 4, 4, 4 and 3 bytes
int
main()
{
    int retval = 1;

    try {
        auto store = std::make_shared<upload::test::MockObjectStore>();
        auto thread_pool =
          std::make_shared<upload::ThreadPool>(4, err_callback);

        upload::ObjectMetadata metadata;
        metadata.content_type = "text/plain";

        upload::StreamWriterConfig config;
        config.part_size_bytes = 4;
        config.multipart_threshold_bytes = 10;

        upload::StreamWriter writer(
          target, metadata, config, store, thread_pool);

        ByteVector data(15);
        std::iota(data.begin(), data.end(), 0);

        CHECK_OK(writer.write(data));
        CHECK(writer.mode() == upload::UploadMode::Multipart);
        EXPECT_EQ(int, store->n_initiate(), 1);
        EXPECT_EQ(std::string,
                  store->initiated_metadata().content_type,
                  "text/plain");

        CHECK_OK(writer.close());

        const auto parts = store->parts();
        EXPECT_EQ(int, parts.size(), 4);
        EXPECT_EQ(int, parts.at(1).size(), 4);
        EXPECT_EQ(int, parts.at(2).size(), 4);
        EXPECT_EQ(int, parts.at(3).size(), 4);
        EXPECT_EQ(int, parts.at(4).size(), 3);
        CHECK(store->assembled() == data);

        EXPECT_EQ(int, store->n_complete(), 1);
        EXPECT_EQ(int, store->n_abort(), 0);
        CHECK(store->puts().empty());

        const auto tokens = store->completed_parts();
        EXPECT_EQ(int, tokens.size(), 4);
        for (auto i = 0; i < tokens.size(); ++i) {
            EXPECT_EQ(int, tokens[i].number, i + 1);
            EXPECT_EQ(std::string,
                      tokens[i].etag,
                      "etag-" + std::to_string(i + 1));
        }
        EXPECT_EQ(int, tokens[3].size, 3);

        retval = 0;
    } catch (const std::exception& exc) {
        LOG_ERROR("Test failed: ", exc.what());
    }

    return retval;
}
