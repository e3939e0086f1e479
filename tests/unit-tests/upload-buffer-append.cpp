#include "unit.test.macros.hh"
#include "upload.buffer.hh"

#include <numeric>

namespace {
void
append_stops_at_limit()
{
    upload::UploadBuffer buffer(10, 4);
    CHECK(buffer.empty());
    EXPECT_EQ(int, buffer.limit(), 10);
    EXPECT_EQ(int, buffer.remaining(), 10);

    ByteVector data(15);
    std::iota(data.begin(), data.end(), 0);

    EXPECT_EQ(int, buffer.append(data), 10);
    CHECK(buffer.full());
    EXPECT_EQ(int, buffer.remaining(), 0);
    EXPECT_EQ(int, buffer.append(data), 0);
    CHECK(!buffer.push_back(0xff));

    const auto view = buffer.view();
    EXPECT_EQ(int, view.size(), 10);
    for (auto i = 0; i < view.size(); ++i) {
        EXPECT_EQ(int, view[i], i);
    }
}

void
take_hands_over_bytes()
{
    upload::UploadBuffer buffer(8, 8);
    for (uint8_t i = 0; i < 5; ++i) {
        CHECK(buffer.push_back(i));
    }

    ByteVector taken = buffer.take();
    EXPECT_EQ(int, taken.size(), 5);
    CHECK(buffer.empty());
    EXPECT_EQ(int, buffer.limit(), 8);

    // writes after take() must not touch the bytes that were taken
    const ByteVector more(8, 0xaa);
    EXPECT_EQ(int, buffer.append(more), 8);
    for (auto i = 0; i < taken.size(); ++i) {
        EXPECT_EQ(int, taken[i], i);
    }
}

void
reset_changes_limit()
{
    upload::UploadBuffer buffer(10, 10);
    const ByteVector data(7, 1);
    EXPECT_EQ(int, buffer.append(data), 7);

    buffer.reset(4, 100);
    CHECK(buffer.empty());
    EXPECT_EQ(int, buffer.limit(), 4);
    EXPECT_EQ(int, buffer.append(data), 4);
    CHECK(buffer.full());

    bool threw = false;
    try {
        buffer.reset(0, 0);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    CHECK(threw);
}
} // namespace

int
main()
{
    int retval = 1;

    try {
        append_stops_at_limit();
        take_hands_over_bytes();
        reset_changes_limit();
        retval = 0;
    } catch (const std::exception& exc) {
        LOG_ERROR("Test failed: ", exc.what());
    }

    return retval;
}
