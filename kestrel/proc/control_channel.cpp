#include "control_channel.h"
#include "../shared/logging.h"

#include <cerrno>
#include <cstring>
#include <unistd.h>

const char* control_event_name(control_event ev)
{
    switch (ev)
    {
        case control_event::reload:       return "reload";
        case control_event::stop:         return "stop";
        case control_event::read_failed:  return "read failed";
        case control_event::child_exited: return "child exited";
    }
    return "unknown";
}

bool control_channel::open()
{
    // A full pipe drops the event instead of blocking a signal handler
    if (!scoped_fd::make_pipe(m_read, m_write) || !m_write.set_nonblocking(true))
    {
        LOG_ERRORF("[proc] control pipe: %s", std::strerror(errno));
        return false;
    }

    return true;
}

bool control_channel::post(control_event ev) const noexcept
{
    if (!m_write)
        return false;

    auto c = static_cast<uint8_t>(ev);
    ssize_t n;
    do
        n = ::write(m_write.get(), &c, 1);
    while (n < 0 && errno == EINTR);

    return n == 1;
}

std::optional<control_event> control_channel::wait() const
{
    while (true)
    {
        uint8_t c = 0;
        ssize_t n = ::read(m_read.get(), &c, 1);
        if (n == 1)
        {
            switch (c)
            {
                case static_cast<uint8_t>(control_event::reload):
                case static_cast<uint8_t>(control_event::stop):
                case static_cast<uint8_t>(control_event::read_failed):
                case static_cast<uint8_t>(control_event::child_exited):
                    return static_cast<control_event>(c);
                default:
                    LOG_WARNF("[proc] unknown control byte %u", static_cast<unsigned>(c));
                    continue;
            }
        }

        if (n < 0 && errno == EINTR)
            continue;

        if (n < 0)
            LOG_ERRORF("[proc] control pipe read: %s", std::strerror(errno));
        return std::nullopt;
    }
}
