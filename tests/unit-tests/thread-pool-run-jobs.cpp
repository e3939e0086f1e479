#include "thread.pool.hh"
#include "unit.test.macros.hh"

#include <atomic>

int
main()
{
    int retval = 1;

    try {
        std::atomic<int> n_errors{ 0 };
        upload::ThreadPool pool(4, [&n_errors](const std::string& err) {
            ++n_errors;
        });
        CHECK(pool.n_threads() >= 1);

        std::atomic<int> n_done{ 0 };
        constexpr int n_jobs = 100;
        for (auto i = 0; i < n_jobs; ++i) {
            CHECK(pool.push_job([&n_done, i](std::string& err) {
                ++n_done;
                if (i % 10 == 0) {
                    err = "job " + std::to_string(i) + " failed";
                    return false;
                }
                return true;
            }));
        }

        pool.await_stop();
        EXPECT_EQ(int, n_done.load(), n_jobs);
        EXPECT_EQ(int, n_errors.load(), n_jobs / 10);

        // stopped pools turn jobs away
        CHECK(!pool.push_job([](std::string&) { return true; }));

        retval = 0;
    } catch (const std::exception& exc) {
        LOG_ERROR("Test failed: ", exc.what());
    }

    return retval;
}
