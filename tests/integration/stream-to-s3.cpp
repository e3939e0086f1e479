#include "test.macros.hh"

#include <miniocpp/client.h>

#include <atomic>
#include <cstring>
#include <list>
#include <numeric>
#include <vector>

#ifdef GetObject
#undef GetObject
#endif

namespace {
const std::string small_key = TEST "-small.bin";
const std::string medium_key = TEST "-medium.bin";
const std::string large_key = TEST "-large.bin";

constexpr size_t MiB = 1ULL << 20;
constexpr int64_t part_size = 5 * MiB;
constexpr size_t small_object_size = 3 * MiB + 17;
constexpr size_t medium_object_size = 7 * MiB + 5; // above the minimum part
constexpr size_t large_object_size = 12 * MiB + 1234; // 3 parts

std::string s3_endpoint, s3_bucket_name, s3_access_key_id, s3_secret_access_key,
  s3_region;
UploadS3Settings s3_settings{};

std::atomic<size_t> n_ticks{ 0 };

bool
s3_get_credentials()
{
    char* env = nullptr;
    if (!(env = std::getenv("UPLOAD_S3_ENDPOINT"))) {
        LOG_WARNING("UPLOAD_S3_ENDPOINT not set.");
        return false;
    }
    s3_endpoint = env;

    if (!(env = std::getenv("UPLOAD_S3_BUCKET_NAME"))) {
        LOG_WARNING("UPLOAD_S3_BUCKET_NAME not set.");
        return false;
    }
    s3_bucket_name = env;

    if (!(env = std::getenv("AWS_ACCESS_KEY_ID"))) {
        LOG_WARNING("AWS_ACCESS_KEY_ID not set.");
        return false;
    }
    s3_access_key_id = env;

    if (!(env = std::getenv("AWS_SECRET_ACCESS_KEY"))) {
        LOG_WARNING("AWS_SECRET_ACCESS_KEY not set.");
        return false;
    }
    s3_secret_access_key = env;

    env = std::getenv("UPLOAD_S3_REGION");
    if (env) {
        s3_region = env;
    }

    return true;
}

void
on_progress(uint32_t part_number,
            size_t bytes_sent,
            size_t bytes_total,
            void* user_data)
{
    ++n_ticks;
}

std::vector<uint8_t>
make_data(size_t size)
{
    std::vector<uint8_t> data(size);
    for (size_t i = 0; i < size; ++i) {
        data[i] = static_cast<uint8_t>((i * 31 + i / 251) & 0xff);
    }

    return data;
}

UploadStream*
setup_stream(UploadStreamSettings& settings,
             const std::string& key,
             int64_t threshold = part_size)
{
    memset(&settings, 0, sizeof(settings));

    s3_settings.endpoint = s3_endpoint.c_str();
    s3_settings.bucket_name = s3_bucket_name.c_str();
    if (!s3_region.empty()) {
        s3_settings.region = s3_region.c_str();
    }

    settings.s3_settings = &s3_settings;
    settings.object_key = key.c_str();
    settings.metadata = R"({"Content-Type": "application/octet-stream",
                            "origin": "fast-upload-integration-test"})";
    settings.part_size_bytes = part_size;
    settings.multipart_threshold_bytes = threshold;
    settings.initial_buffer_size_bytes = 1 * MiB;
    settings.max_threads = 4;
    settings.progress_callback = on_progress;

    return UploadStream_create(&settings);
}

// write in uneven chunks so that writes straddle part boundaries
void
do_stream(UploadStream* stream, const std::vector<uint8_t>& data)
{
    constexpr size_t chunk_size = 1 * MiB + 333;

    size_t offset = 0;
    while (offset < data.size()) {
        const auto length = std::min(chunk_size, data.size() - offset);
        CHECK_OK(UploadStream_write(stream,
                                    data.data(),
                                    data.size(),
                                    static_cast<int64_t>(offset),
                                    static_cast<int64_t>(length)));
        offset += length;
    }

    CHECK_OK(UploadStream_close(stream));
    CHECK_STATUS(UploadStream_write_byte(stream, 0),
                 UploadStatusCode_StreamClosed);
}

std::vector<uint8_t>
s3_get_object_contents_as_bytes(const std::string& object_name,
                                minio::s3::Client& client)
{
    std::vector<uint8_t> data;

    minio::s3::GetObjectArgs go_args;
    go_args.bucket = s3_bucket_name;
    go_args.object = object_name;
    go_args.datafunc =
      [&data](const minio::http::DataFunctionArgs& args) -> bool {
        const auto* chunk_data =
          reinterpret_cast<const uint8_t*>(args.datachunk.data());
        data.insert(
          data.end(), chunk_data, chunk_data + args.datachunk.size());
        return true;
    };

    minio::s3::GetObjectResponse resp = client.GetObject(go_args);
    EXPECT(resp,
           "Failed to get object ",
           object_name,
           ": ",
           resp.Error().String());

    return data;
}

std::string
s3_get_etag(const std::string& object_name, minio::s3::Client& client)
{
    minio::s3::StatObjectArgs args;
    args.bucket = s3_bucket_name;
    args.object = object_name;

    const minio::s3::StatObjectResponse response = client.StatObject(args);
    EXPECT(response, "Failed to stat object ", object_name);

    return response.etag;
}

bool
s3_remove_items(const std::vector<std::string>& item_keys,
                minio::s3::Client& client)
{
    std::list<minio::s3::DeleteObject> objects;
    for (const auto& key : item_keys) {
        minio::s3::DeleteObject object;
        object.name = key;
        objects.push_back(object);
    }

    minio::s3::RemoveObjectsArgs args;
    args.bucket = s3_bucket_name;

    auto it = objects.begin();

    args.func = [&objects = objects,
                 &i = it](minio::s3::DeleteObject& obj) -> bool {
        if (i == objects.end())
            return false;
        obj = *i;
        i++;
        return true;
    };

    minio::s3::RemoveObjectsResult result = client.RemoveObjects(args);
    for (; result; result++) {
        minio::s3::DeleteError err = *result;
        if (!err) {
            LOG_ERROR("Failed to delete object ",
                      err.object_name,
                      ": ",
                      err.message);
            return false;
        }
    }

    return true;
}

void
verify_object(const std::string& key,
              const std::vector<uint8_t>& expected,
              minio::s3::Client& client)
{
    const auto contents = s3_get_object_contents_as_bytes(key, client);
    EXPECT(contents.size() == expected.size(),
           "Expected ",
           expected.size(),
           " bytes in ",
           key,
           ", got ",
           contents.size());
    EXPECT(contents == expected, "Contents of ", key, " do not match");
}
} // namespace

int
main()
{
    if (!s3_get_credentials()) {
        LOG_WARNING("Failed to get credentials. Skipping test.");
        return 0;
    }

    int retval = 1;

    minio::s3::BaseUrl url(s3_endpoint);
    url.https = s3_endpoint.starts_with("https://");
    if (!s3_region.empty()) {
        url.region = s3_region;
    }

    minio::creds::StaticProvider provider(s3_access_key_id,
                                          s3_secret_access_key);
    minio::s3::Client client(url, &provider);

    try {
        UploadStreamSettings settings;

        // below the threshold: one PUT
        const auto small_data = make_data(small_object_size);
        UploadStream* stream = setup_stream(settings, small_key);
        CHECK(stream);
        do_stream(stream, small_data);
        UploadStream_destroy(stream);

        verify_object(small_key, small_data, client);

        // below a threshold larger than a minimum part: still one PUT, so
        // the ETag is not a multipart ETag ("<md5>-<n>")
        const auto medium_data = make_data(medium_object_size);
        stream = setup_stream(settings, medium_key, 2 * part_size);
        CHECK(stream);
        do_stream(stream, medium_data);
        UploadStream_destroy(stream);

        verify_object(medium_key, medium_data, client);
        const auto etag = s3_get_etag(medium_key, client);
        EXPECT(etag.find('-') == std::string::npos,
               "Expected a single-request ETag, got ",
               etag);

        // above the threshold: multipart upload
        const size_t ticks_before = n_ticks;
        const auto large_data = make_data(large_object_size);
        stream = setup_stream(settings, large_key);
        CHECK(stream);
        do_stream(stream, large_data);
        UploadStream_destroy(stream);

        verify_object(large_key, large_data, client);
        CHECK(n_ticks > ticks_before);

        retval = 0;
    } catch (const std::exception& e) {
        LOG_ERROR("Error: ", e.what());
    }

    // cleanup
    if (!s3_remove_items({ small_key, medium_key, large_key }, client)) {
        LOG_ERROR("Failed to remove test objects");
        retval = 1;
    }

    return retval;
}
