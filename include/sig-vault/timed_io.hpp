#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <thread>

namespace SigVault
{

/**
 * Runs blocking filesystem calls on a helper thread so that a hung network
 * mount costs the caller at most `timeout`.
 *
 * Calls run one at a time, in order. When a call overruns, the helper is
 * abandoned: run() returns false for it and for every later call, and the
 * helper thread exits once the stuck call returns. Anything an abandoned call
 * touches must be owned by the call itself (captured by value or shared_ptr).
 * A zero timeout runs every call inline on the caller's thread.
 */
class TimedIo
{
    public:
    explicit TimedIo(std::chrono::milliseconds timeout);
    ~TimedIo();

    TimedIo(const TimedIo &) = delete;
    TimedIo &operator=(const TimedIo &) = delete;

    bool run(std::function<void()> call);

    // Runs after the last call has returned, on whichever thread that is.
    // Used to release descriptors an abandoned call may still be using.
    void deferCleanup(std::function<void()> cleanup);

    bool abandoned() const;

    std::chrono::milliseconds timeout() const
    {
        return limit;
    }

    private:
    struct State;
    static void helperLoop(std::shared_ptr<State> state);

    std::chrono::milliseconds limit;
    std::shared_ptr<State> state;
    std::thread helper;
};

} // namespace SigVault
