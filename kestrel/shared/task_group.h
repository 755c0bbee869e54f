#pragma once
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string_view>

// Runs every task on its own thread. Tasks are never queued behind each
// other, so a task that blocks forever only costs its own thread.
// wait() and the destructor block until all spawned tasks have returned
// and released everything they captured.
class task_group
{
public:
    task_group() = default;
    ~task_group();

    task_group(const task_group&) = delete;
    task_group& operator=(const task_group&) = delete;

    // Returns false if the thread could not be created (task not run).
    bool spawn(std::function<void()> fn);

    void wait();
    size_t active() const;

private:
    void finish();

    mutable std::mutex m_mutex;
    std::condition_variable m_idle;
    size_t m_active{0};
};

// Runs fn, logging any std::exception it throws together with context.
// std::bad_alloc and non-standard exceptions propagate, which ends the
// process when fn runs on a task thread.
void run_guarded(std::string_view context, const std::function<void()>& fn);
