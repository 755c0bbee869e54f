#pragma once
#include <cstdint>
#include <optional>

#include "../shared/scoped_fd.h"

enum class control_event : uint8_t
{
    reload       = 1,   // hand the connection to a fresh copy of this binary
    stop         = 2,   // clean shutdown
    read_failed  = 3,   // the read loop ended on a connection error
    child_exited = 4    // a spawned child process terminated
};

const char* control_event_name(control_event ev);

// Self-pipe carrying control events to the single control loop. post() is
// async-signal-safe and never blocks; events are delivered in order.
class control_channel
{
public:
    control_channel() = default;

    control_channel(const control_channel&) = delete;
    control_channel& operator=(const control_channel&) = delete;

    bool open();

    bool post(control_event ev) const noexcept;

    // Blocks for the next event. nullopt if the pipe failed.
    std::optional<control_event> wait() const;

    int write_fd() const { return m_write.get(); }

private:
    scoped_fd m_read;
    scoped_fd m_write;
};
