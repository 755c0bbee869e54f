#pragma once
#include <cstdint>
#include <chrono>
#include <liburing.h>

// Synchronous io_uring front end for one socket. Every recv/send is linked
// to a kernel timeout, so an idle peer surfaces as -ETIME instead of a
// hung thread. One ring per direction: a blocked recv must never hold up
// a reply.
//
// A ring is driven by one thread at a time, not necessarily the same one. interrupt() is the only call
// that may come from another thread; it aborts a pending interruptible
// recv with -EINTR.
class uring_io
{
public:
    uring_io() = default;
    ~uring_io();

    uring_io(const uring_io&) = delete;
    uring_io& operator=(const uring_io&) = delete;

    bool init(uint32_t queue_depth = 8);
    bool is_initialized() const { return m_initialized; }

    // Returns bytes transferred, 0 on EOF (recv), -ETIME when the timeout
    // fires, -EINTR when interrupted, or another negative errno.
    // timeout <= 0 waits without a deadline.
    int recv(int fd, char* buf, uint32_t len, std::chrono::milliseconds timeout);
    int send(int fd, const char* buf, uint32_t len, std::chrono::milliseconds timeout);

    void interrupt();

private:
    enum op_tag : uint64_t
    {
        tag_io      = 1,
        tag_timeout = 2,
        tag_wake    = 3,
        tag_cancel  = 4
    };

    int submit_and_wait(bool is_recv, int fd, char* buf, uint32_t len,
                        std::chrono::milliseconds timeout);
    bool arm_wake();
    struct io_uring_sqe* get_sqe();

    struct io_uring m_ring{};
    bool m_initialized{false};
    int m_wake_fd{-1};
    bool m_wake_armed{false};
    bool m_interrupt_pending{false};
    uint64_t m_wake_buf{0};
    struct __kernel_timespec m_ts{};
};
