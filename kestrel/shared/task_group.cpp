#include "task_group.h"
#include "logging.h"

#include <new>
#include <system_error>
#include <thread>

task_group::~task_group()
{
    wait();
}

bool task_group::spawn(std::function<void()> fn)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_active;
    }

    try
    {
        std::thread([this, fn = std::move(fn)]() mutable {
            // Captures die before the task counts as finished
            {
                std::function<void()> task;
                task.swap(fn);
                task();
            }
            finish();
        }).detach();
    }
    catch (const std::system_error& e)
    {
        LOG_ERRORF("task: could not start thread: %s", e.what());
        finish();
        return false;
    }

    return true;
}

void task_group::finish()
{
    // Nothing of *this may be touched after the unlock: wait() may return
    // and the group be destroyed right away.
    std::lock_guard<std::mutex> lock(m_mutex);
    if (--m_active == 0)
        m_idle.notify_all();
}

void task_group::wait()
{
    std::unique_lock<std::mutex> lock(m_mutex);
    m_idle.wait(lock, [this] { return m_active == 0; });
}

size_t task_group::active() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_active;
}

void run_guarded(std::string_view context, const std::function<void()>& fn)
{
    try
    {
        fn();
    }
    catch (const std::bad_alloc&)
    {
        throw;
    }
    catch (const std::exception& e)
    {
        LOG_ERRORF("task fault: %s", e.what());
        LOG_ERRORF("> %.*s", static_cast<int>(context.size()), context.data());
    }
}
