#pragma once
#include <fcntl.h>
#include <unistd.h>
#include <utility>

// Owns one descriptor. Everything this process opens is close-on-exec;
// only descriptors placed for a handed-off child are not.
class scoped_fd
{
public:
    scoped_fd() noexcept = default;
    explicit scoped_fd(int fd) noexcept : m_fd(fd) {}

    ~scoped_fd() { reset(); }

    scoped_fd(const scoped_fd&) = delete;
    scoped_fd& operator=(const scoped_fd&) = delete;

    scoped_fd(scoped_fd&& other) noexcept : m_fd(other.release()) {}

    scoped_fd& operator=(scoped_fd&& other) noexcept
    {
        if (this != &other)
            reset(other.release());
        return *this;
    }

    int get() const noexcept { return m_fd; }
    explicit operator bool() const noexcept { return m_fd >= 0; }

    int release() noexcept { return std::exchange(m_fd, -1); }

    void reset(int fd = -1) noexcept
    {
        int old = std::exchange(m_fd, fd);
        if (old >= 0)
            ::close(old);
    }

    bool set_cloexec(bool on) const noexcept { return update(F_GETFD, F_SETFD, FD_CLOEXEC, on); }
    bool set_nonblocking(bool on) const noexcept { return update(F_GETFL, F_SETFL, O_NONBLOCK, on); }

    // pipe2() into a read end and a write end. flags as for pipe2.
    static bool make_pipe(scoped_fd& read_end, scoped_fd& write_end, int flags = O_CLOEXEC) noexcept
    {
        int fds[2];
        if (::pipe2(fds, flags) < 0)
            return false;
        read_end.reset(fds[0]);
        write_end.reset(fds[1]);
        return true;
    }

private:
    bool update(int get_cmd, int set_cmd, int bit, bool on) const noexcept
    {
        if (m_fd < 0)
            return false;
        int flags = ::fcntl(m_fd, get_cmd);
        if (flags < 0)
            return false;
        flags = on ? (flags | bit) : (flags & ~bit);
        return ::fcntl(m_fd, set_cmd, flags) == 0;
    }

    int m_fd{-1};
};
