#include "uring_io.h"
#include "../shared/logging.h"

#include <cerrno>
#include <cstring>
#include <sys/eventfd.h>
#include <unistd.h>

uring_io::~uring_io()
{
    if (m_initialized)
        io_uring_queue_exit(&m_ring);
    if (m_wake_fd >= 0)
        close(m_wake_fd);
}

bool uring_io::init(uint32_t queue_depth)
{
    if (m_initialized)
        return true;

    // No SINGLE_ISSUER: the ring is set up on one thread and driven from
    // others (the read loop, handler tasks under the write lock).
    int ret = io_uring_queue_init(queue_depth, &m_ring, 0);
    if (ret < 0)
    {
        LOG_ERRORF("[io] io_uring setup failed: %s", std::strerror(-ret));
        return false;
    }
    m_initialized = true;

    m_wake_fd = eventfd(0, EFD_CLOEXEC);
    if (m_wake_fd < 0)
    {
        LOG_ERRORF("[io] eventfd failed: %s", std::strerror(errno));
        io_uring_queue_exit(&m_ring);
        m_initialized = false;
        return false;
    }

    return true;
}

// Get an SQE, flushing once if the ring is full.
struct io_uring_sqe* uring_io::get_sqe()
{
    struct io_uring_sqe* sqe = io_uring_get_sqe(&m_ring);
    if (!sqe)
    {
        io_uring_submit(&m_ring);
        sqe = io_uring_get_sqe(&m_ring);
    }
    return sqe;
}

bool uring_io::arm_wake()
{
    if (m_wake_armed)
        return true;

    struct io_uring_sqe* sqe = get_sqe();
    if (!sqe)
        return false;

    io_uring_prep_read(sqe, m_wake_fd, &m_wake_buf, sizeof(m_wake_buf), 0);
    io_uring_sqe_set_data64(sqe, tag_wake);
    m_wake_armed = true;
    return true;
}

void uring_io::interrupt()
{
    if (m_wake_fd < 0)
        return;

    uint64_t one = 1;
    if (::write(m_wake_fd, &one, sizeof(one)) < 0)
        LOG_WARNF("[io] wake write failed: %s", std::strerror(errno));
}

int uring_io::recv(int fd, char* buf, uint32_t len, std::chrono::milliseconds timeout)
{
    return submit_and_wait(true, fd, buf, len, timeout);
}

int uring_io::send(int fd, const char* buf, uint32_t len, std::chrono::milliseconds timeout)
{
    return submit_and_wait(false, fd, const_cast<char*>(buf), len, timeout);
}

int uring_io::submit_and_wait(bool is_recv, int fd, char* buf, uint32_t len,
                              std::chrono::milliseconds timeout)
{
    if (!m_initialized)
        return -EBADF;

    if (is_recv)
    {
        if (m_interrupt_pending)
        {
            m_interrupt_pending = false;
            return -EINTR;
        }
        if (!arm_wake())
            return -EBUSY;
    }

    bool linked = timeout.count() > 0;

    struct io_uring_sqe* sqe = get_sqe();
    if (!sqe)
        return -EBUSY;

    if (is_recv)
        io_uring_prep_recv(sqe, fd, buf, len, 0);
    else
        io_uring_prep_send(sqe, fd, buf, len, MSG_NOSIGNAL);
    io_uring_sqe_set_data64(sqe, tag_io);

    if (linked)
    {
        sqe->flags |= IOSQE_IO_LINK;

        m_ts.tv_sec = timeout.count() / 1000;
        m_ts.tv_nsec = (timeout.count() % 1000) * 1000000LL;

        struct io_uring_sqe* tsqe = get_sqe();
        if (!tsqe)
            return -EBUSY;
        io_uring_prep_link_timeout(tsqe, &m_ts, 0);
        io_uring_sqe_set_data64(tsqe, tag_timeout);
    }

    int ret = io_uring_submit(&m_ring);
    if (ret < 0)
        return ret;

    bool io_done = false;
    bool timeout_done = !linked;
    bool cancel_done = true;
    bool interrupted = false;
    bool timed_out = false;
    int io_res = 0;

    while (!io_done || !timeout_done || !cancel_done)
    {
        struct io_uring_cqe* cqe = nullptr;
        ret = io_uring_wait_cqe(&m_ring, &cqe);
        if (ret == -EINTR)
            continue;
        if (ret < 0)
            return ret;

        uint64_t tag = io_uring_cqe_get_data64(cqe);
        int res = cqe->res;
        io_uring_cqe_seen(&m_ring, cqe);

        switch (tag)
        {
            case tag_io:
                io_done = true;
                io_res = res;
                break;
            case tag_timeout:
                timeout_done = true;
                timed_out = (res == -ETIME);
                break;
            case tag_wake:
            {
                m_wake_armed = false;
                if (io_done || !is_recv)
                {
                    m_interrupt_pending = true;
                    break;
                }
                interrupted = true;
                struct io_uring_sqe* csqe = get_sqe();
                if (csqe)
                {
                    io_uring_prep_cancel64(csqe, tag_io, 0);
                    io_uring_sqe_set_data64(csqe, tag_cancel);
                    cancel_done = false;
                    io_uring_submit(&m_ring);
                }
                break;
            }
            case tag_cancel:
                cancel_done = true;
                break;
            default:
                break;
        }
    }

    if (io_res == -ECANCELED)
    {
        if (timed_out)
            return -ETIME;
        if (interrupted)
            return -EINTR;
    }

    // The recv won the race against the cancel; keep the wakeup for next time
    if (interrupted)
        m_interrupt_pending = true;

    return io_res;
}
