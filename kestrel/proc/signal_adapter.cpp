#include "signal_adapter.h"
#include "control_channel.h"
#include "../shared/logging.h"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <unistd.h>

static int g_signal_write_fd = -1;

static void signal_handler(int signo)
{
    if (g_signal_write_fd < 0)
        return;

    control_event ev;
    switch (signo)
    {
        case SIGUSR1: ev = control_event::reload; break;
        case SIGCHLD: ev = control_event::child_exited; break;
        default:      ev = control_event::stop; break;
    }

    int saved = errno;
    auto c = static_cast<uint8_t>(ev);
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wunused-result"
    write(g_signal_write_fd, &c, 1);
#pragma GCC diagnostic pop
    errno = saved;
}

static const int HANDLED_SIGNALS[] = { SIGUSR1, SIGINT, SIGTERM, SIGHUP, SIGCHLD };

signal_adapter::signal_adapter(const control_channel& ch)
{
    if (g_signal_write_fd >= 0)
    {
        LOG_ERROR("[proc] signal adapter already installed");
        return;
    }

    g_signal_write_fd = ch.write_fd();

    signal(SIGPIPE, SIG_IGN);

    struct sigaction sa{};
    sa.sa_handler = signal_handler;
    sa.sa_flags = SA_RESTART;
    sigemptyset(&sa.sa_mask);

    for (int signo : HANDLED_SIGNALS)
    {
        if (sigaction(signo, &sa, nullptr) < 0)
            LOG_WARNF("[proc] sigaction(%d): %s", signo, std::strerror(errno));
    }

    m_installed = true;
}

signal_adapter::~signal_adapter()
{
    if (!m_installed)
        return;

    struct sigaction sa{};
    sa.sa_handler = SIG_DFL;
    sigemptyset(&sa.sa_mask);
    for (int signo : HANDLED_SIGNALS)
        sigaction(signo, &sa, nullptr);

    g_signal_write_fd = -1;
}
