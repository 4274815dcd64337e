#include <sig-vault/timed_io.hpp>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <vector>

namespace SigVault
{

struct TimedIo::State
{
    std::mutex mutex;
    std::condition_variable changed;
    std::function<void()> pending;
    uint64_t submitted = 0;
    uint64_t completed = 0;
    bool stopping = false;
    bool abandoned = false;
    std::vector<std::function<void()>> cleanups;
};

TimedIo::TimedIo(std::chrono::milliseconds timeout) : limit(timeout), state(std::make_shared<State>())
{
    if (limit.count() > 0)
    {
        helper = std::thread(&TimedIo::helperLoop, state);
    }
}

TimedIo::~TimedIo()
{
    if (!helper.joinable())
    {
        for (auto &cleanup : state->cleanups)
        {
            cleanup();
        }
        return;
    }

    bool stuck = false;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->stopping = true;
        stuck = state->abandoned;
    }
    state->changed.notify_all();

    // A stuck helper keeps the shared state alive and exits on its own
    if (stuck)
    {
        helper.detach();
    }
    else
    {
        helper.join();
    }
}

void TimedIo::helperLoop(std::shared_ptr<State> state)
{
    std::unique_lock<std::mutex> lock(state->mutex);
    while (true)
    {
        state->changed.wait(lock,
                            [&state]
                            {
                                return state->pending || state->stopping;
                            });

        if (state->pending)
        {
            std::function<void()> call = std::move(state->pending);
            state->pending = nullptr;

            lock.unlock();
            call();
            lock.lock();

            state->completed++;
            state->changed.notify_all();
            continue;
        }
        break;
    }

    std::vector<std::function<void()>> cleanups = std::move(state->cleanups);
    lock.unlock();
    for (auto &cleanup : cleanups)
    {
        cleanup();
    }
}

bool TimedIo::run(std::function<void()> call)
{
    if (!helper.joinable())
    {
        call();
        return true;
    }

    std::unique_lock<std::mutex> lock(state->mutex);
    if (state->abandoned)
    {
        return false;
    }

    state->pending = std::move(call);
    const uint64_t ticket = ++state->submitted;
    state->changed.notify_all();

    bool finished = state->changed.wait_for(lock, limit,
                                            [this, ticket]
                                            {
                                                return state->completed >= ticket;
                                            });
    if (!finished)
    {
        state->abandoned = true;
    }
    return finished;
}

void TimedIo::deferCleanup(std::function<void()> cleanup)
{
    std::lock_guard<std::mutex> lock(state->mutex);
    state->cleanups.push_back(std::move(cleanup));
}

bool TimedIo::abandoned() const
{
    std::lock_guard<std::mutex> lock(state->mutex);
    return state->abandoned;
}

} // namespace SigVault
