#include "mock.object.store.hh"
#include "stream.writer.hh"
#include "unit.test.macros.hh"

namespace {
const upload::UploadTarget target{ "test-bucket", TEST ".bin" };

void
err_callback(const std::string& err)
{
    LOG_ERROR(err);
}

upload::StreamWriterConfig
make_config()
{
    upload::StreamWriterConfig config;
    config.part_size_bytes = 4;
    config.multipart_threshold_bytes = 10;
    return config;
}

// an exception while crossing the threshold fails the stream for good
void
throw_while_flushing()
{
    auto store = std::make_shared<upload::test::MockObjectStore>();
    store->throw_on_initiate = true;
    auto thread_pool = std::make_shared<upload::ThreadPool>(2, err_callback);

    upload::StreamWriter writer(target, {}, make_config(), store, thread_pool);

    const ByteVector data(10, 6);
    CHECK_STATUS(writer.write(data), UploadStatusCode_InternalError);
    CHECK(!writer.error().empty());

    const ByteVector more(5, 7);
    CHECK_STATUS(writer.write(more), UploadStatusCode_InternalError);
    CHECK_STATUS(writer.write(uint8_t{ 1 }), UploadStatusCode_InternalError);

    CHECK_STATUS(writer.close(), UploadStatusCode_InternalError);
    CHECK_STATUS(writer.close(), UploadStatusCode_InternalError);

    EXPECT_EQ(int, store->n_initiate(), 1);
    CHECK(store->puts().empty());
    EXPECT_EQ(int, store->n_complete(), 0);
}

// an exception while finalizing aborts the upload and is never success
void
throw_while_closing()
{
    auto store = std::make_shared<upload::test::MockObjectStore>();
    store->throw_on_complete = true;
    auto thread_pool = std::make_shared<upload::ThreadPool>(2, err_callback);

    {
        upload::StreamWriter writer(
          target, {}, make_config(), store, thread_pool);

        const ByteVector data(15, 6);
        CHECK_OK(writer.write(data));

        CHECK_STATUS(writer.close(), UploadStatusCode_InternalError);
        CHECK(writer.is_closed());
        CHECK(!writer.error().empty());
        EXPECT_EQ(int, store->n_abort(), 1);

        CHECK_STATUS(writer.close(), UploadStatusCode_InternalError);
        EXPECT_EQ(int, store->n_complete(), 1);
    }

    // destroying the writer does not abort again
    EXPECT_EQ(int, store->n_abort(), 1);
}
} // namespace

int
main()
{
    int retval = 1;

    try {
        throw_while_flushing();
        throw_while_closing();
        retval = 0;
    } catch (const std::exception& exc) {
        LOG_ERROR("Test failed: ", exc.what());
    }

    return retval;
}
