#if CFG_TALLY_SHARED
#ifdef _WIN32
#define CFG_TALLY_API __declspec(dllexport)
#endif
#endif

#include <tally/tally.hpp>

namespace
{
    thread_local tally::coop::EventLoop *current_loop = nullptr;
}

void tally::coop::EventLoop::RunUntilDone(std::coroutine_handle<> root)
{
    if (!root)
        HardError("Running an empty task.", HardErrorKind::user);
    if (current_loop)
        HardError("Nested event loops are not supported.", HardErrorKind::user);

    current_loop = this;
    struct Reset
    {
        ~Reset() {current_loop = nullptr;}
    } reset;

    // The root task is lazy, so this starts it.
    queue.push_back(root);

    while (!root.done())
    {
        if (queue.empty())
            HardError("The task is suspended, but there's nothing left to resume it.", HardErrorKind::user);

        std::coroutine_handle<> next = queue.front();
        queue.pop_front();
        next.resume();
    }

    queue.clear();
}

void tally::coop::EventLoop::Schedule(std::coroutine_handle<> handle)
{
    queue.push_back(handle);
}

tally::coop::EventLoop *tally::coop::EventLoop::Current()
{
    return current_loop;
}

void tally::coop::YieldAwaiter::await_suspend(std::coroutine_handle<> handle) const
{
    EventLoop *loop = EventLoop::Current();
    if (!loop)
        HardError("`coop::Yield()` was awaited outside of an event loop.", HardErrorKind::user);
    loop->Schedule(handle);
}
