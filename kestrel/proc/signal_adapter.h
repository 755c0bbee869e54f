#pragma once

class control_channel;

// Routes OS signals into a control_channel:
//   SIGUSR1                  -> reload
//   SIGINT, SIGTERM, SIGHUP  -> stop
//   SIGCHLD                  -> child_exited
// SIGPIPE is ignored; broken pipes surface as -EPIPE from the rings.
// Only one adapter may be installed at a time.
class signal_adapter
{
public:
    explicit signal_adapter(const control_channel& ch);
    ~signal_adapter();

    signal_adapter(const signal_adapter&) = delete;
    signal_adapter& operator=(const signal_adapter&) = delete;

    bool installed() const { return m_installed; }

private:
    bool m_installed{false};
};
