#include <catch2/catch_test_macros.hpp>
#include <sig-vault/timed_io.hpp>
#include <atomic>
#include <memory>
#include <thread>

using namespace SigVault;

using namespace std::chrono_literals;

TEST_CASE("TimedIo runs calls that finish in time", "[timed_io]")
{
    TimedIo io(1000ms);
    int value = 0;

    REQUIRE(io.run([&value] { value = 1; }));
    REQUIRE(io.run([&value] { value += 41; }));
    REQUIRE(value == 42);
    REQUIRE_FALSE(io.abandoned());
}

TEST_CASE("TimedIo gives up on a call that overruns", "[timed_io]")
{
    auto released = std::make_shared<std::atomic<bool>>(false);
    auto cleaned = std::make_shared<std::atomic<bool>>(false);

    {
        TimedIo io(50ms);
        auto started = std::chrono::steady_clock::now();
        REQUIRE_FALSE(io.run(
        [released]
        {
            while (!released->load())
            {
                std::this_thread::sleep_for(5ms);
            }
        }));
        REQUIRE(std::chrono::steady_clock::now() - started < 1000ms);
        REQUIRE(io.abandoned());

        // Later calls fail at once and never run
        bool ran = false;
        REQUIRE_FALSE(io.run([&ran] { ran = true; }));
        REQUIRE_FALSE(ran);

        io.deferCleanup([cleaned] { cleaned->store(true); });
    }

    // Cleanup waits for the stuck call, even after the TimedIo is gone
    std::this_thread::sleep_for(100ms);
    REQUIRE_FALSE(cleaned->load());

    released->store(true);
    for (int i = 0; i < 200 && !cleaned->load(); ++i)
    {
        std::this_thread::sleep_for(10ms);
    }
    REQUIRE(cleaned->load());
}

TEST_CASE("TimedIo with no timeout runs inline", "[timed_io]")
{
    TimedIo io(0ms);
    std::thread::id caller = std::this_thread::get_id();
    std::thread::id ran_on;

    REQUIRE(io.run([&ran_on] { ran_on = std::this_thread::get_id(); }));
    REQUIRE(ran_on == caller);

    bool cleaned = false;
    {
        TimedIo inline_io(0ms);
        inline_io.deferCleanup([&cleaned] { cleaned = true; });
    }
    REQUIRE(cleaned);
}
