#include "handoff.h"
#include "control_channel.h"
#include "../net/connection.h"
#include "../shared/logging.h"
#include "../shared/tls_context.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <limits.h>
#include <sys/wait.h>
#include <unistd.h>

std::vector<int> inherited_descriptors(size_t count)
{
    std::vector<int> out;
    out.reserve(count);
    for (size_t i = 0; i < count; ++i)
        out.push_back(INHERITED_FD_BASE + static_cast<int>(i));
    return out;
}

bool adopt_inherited(size_t count, const std::vector<connection*>& conns,
                     const tls_context* tls, std::string_view host)
{
    auto fds = inherited_descriptors(count);
    bool ok = count >= conns.size();
    if (!ok)
        LOG_ERRORF("[proc] expected %zu inherited descriptor(s), got %zu", conns.size(), count);

    for (size_t i = 0; i < fds.size(); ++i)
    {
        if (ok && i < conns.size())
        {
            LOG_INFOF("[proc] adopting inherited descriptor %d", fds[i]);
            if (conns[i]->adopt(fds[i], tls, host))
                continue;
            ok = false;
        }
        else if (i >= conns.size())
        {
            LOG_WARNF("[proc] closing unused inherited descriptor %d", fds[i]);
        }
        close(fds[i]);
    }
    return ok;
}

const char* handoff_state_name(handoff_state s)
{
    switch (s)
    {
        case handoff_state::running:             return "running";
        case handoff_state::handoff_in_progress: return "handoff in progress";
        case handoff_state::terminated:          return "terminated";
    }
    return "unknown";
}

pid_t exec_self(const std::vector<int>& fds, const std::vector<std::string>& args)
{
    if (fds.size() > MAX_HANDOFF_FDS)
    {
        LOG_ERRORF("[proc] cannot hand off %zu descriptors (limit %zu)", fds.size(), MAX_HANDOFF_FDS);
        return -1;
    }

    // Everything the child needs is prepared before fork(); after it only
    // async-signal-safe calls are allowed.
    char self_exe[PATH_MAX];
    ssize_t len = readlink("/proc/self/exe", self_exe, sizeof(self_exe) - 1);
    if (len <= 0)
    {
        LOG_ERRORF("[proc] readlink /proc/self/exe: %s", std::strerror(errno));
        return -1;
    }
    self_exe[len] = '\0';

    std::vector<std::string> argv_store;
    argv_store.reserve(args.size() + 3);
    argv_store.emplace_back(self_exe);
    argv_store.emplace_back("--fork");
    argv_store.emplace_back(std::to_string(fds.size()));
    argv_store.insert(argv_store.end(), args.begin(), args.end());

    std::vector<char*> argv;
    argv.reserve(argv_store.size() + 1);
    for (auto& s : argv_store)
        argv.push_back(s.data());
    argv.push_back(nullptr);

    // Reports the exec errno back; closes on a successful exec
    scoped_fd err_read, err_write;
    if (!scoped_fd::make_pipe(err_read, err_write))
    {
        LOG_ERRORF("[proc] pipe: %s", std::strerror(errno));
        return -1;
    }

    const int count = static_cast<int>(fds.size());
    const int floor = INHERITED_FD_BASE + count;

    pid_t pid = fork();
    if (pid < 0)
    {
        LOG_ERRORF("[proc] fork: %s", std::strerror(errno));
        return -1;
    }

    if (pid == 0)
    {
        err_read.reset();

        int tmp[MAX_HANDOFF_FDS];

        // Lift every source above the target slots so no dup2 clobbers one
        int err_fd = fcntl(err_write.get(), F_DUPFD_CLOEXEC, floor);
        if (err_fd < 0)
        {
            err_fd = err_write.get();
            goto fail;
        }

        for (int i = 0; i < count; ++i)
        {
            tmp[i] = fcntl(fds[static_cast<size_t>(i)], F_DUPFD_CLOEXEC, floor);
            if (tmp[i] < 0)
                goto fail;
        }

        // dup2 leaves close-on-exec cleared on the new descriptor
        for (int i = 0; i < count; ++i)
        {
            if (dup2(tmp[i], INHERITED_FD_BASE + i) < 0)
                goto fail;
        }

        execv("/proc/self/exe", argv.data());

    fail:
        {
            int e = errno;
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wunused-result"
            write(err_fd, &e, sizeof(e));
#pragma GCC diagnostic pop
            _exit(127);
        }
    }

    err_write.reset();

    int child_errno = 0;
    ssize_t n;
    do
        n = read(err_read.get(), &child_errno, sizeof(child_errno));
    while (n < 0 && errno == EINTR);

    if (n > 0)
    {
        LOG_ERRORF("[proc] exec %s: %s", self_exe, std::strerror(child_errno));
        int status;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        return -1;
    }

    return pid;
}

handoff_controller::handoff_controller(control_channel& ch, std::vector<std::string> fork_args,
                                       hooks h, spawn_fn spawner)
    : m_channel(ch),
      m_fork_args(std::move(fork_args)),
      m_hooks(std::move(h)),
      m_spawner(std::move(spawner))
{
}

bool handoff_controller::request_reload() const
{
    return m_channel.post(control_event::reload);
}

bool handoff_controller::request_stop() const
{
    return m_channel.post(control_event::stop);
}

bool handoff_controller::handle(control_event ev)
{
    switch (ev)
    {
        case control_event::reload:
            begin_handoff();
            break;
        case control_event::stop:
            terminate(0);
            break;
        case control_event::read_failed:
            terminate(1);
            break;
        case control_event::child_exited:
            child_exited();
            break;
    }

    return state() != handoff_state::terminated;
}

int handoff_controller::run()
{
    LOG_INFO("[proc] waiting for control events");

    while (state() != handoff_state::terminated)
    {
        auto ev = m_channel.wait();
        if (!ev)
        {
            terminate(1);
            break;
        }

        LOG_INFOF("[proc] received %s", control_event_name(*ev));
        handle(*ev);
    }

    return m_exit_code;
}

void handoff_controller::begin_handoff()
{
    auto expected = handoff_state::running;
    if (!m_state.compare_exchange_strong(expected, handoff_state::handoff_in_progress,
                                         std::memory_order_acq_rel))
    {
        LOG_DEBUGF("[proc] reload ignored while %s", handoff_state_name(expected));
        return;
    }

    // The child must be the only reader once it starts
    if (m_hooks.pause_reader && !m_hooks.pause_reader())
    {
        LOG_ERROR("[proc] handoff failed: read loop did not pause");
        m_state.store(handoff_state::running, std::memory_order_release);
        return;
    }

    std::vector<int> fds;
    if (m_hooks.descriptors)
        fds = m_hooks.descriptors();

    LOG_INFOF("[proc] forking process with %zu descriptor(s)", fds.size());

    pid_t pid = fds.empty() ? -1 : m_spawner(fds, m_fork_args);
    if (pid < 0)
    {
        LOG_ERROR("[proc] handoff failed, continuing in this process");
        if (m_hooks.resume_reader)
            m_hooks.resume_reader();
        m_state.store(handoff_state::running, std::memory_order_release);
        return;
    }

    m_child = pid;
    LOG_INFOF("[proc] child %d started, waiting for it to take over", static_cast<int>(pid));
}

void handoff_controller::child_exited()
{
    if (m_child <= 0)
        return;

    int status = 0;
    pid_t r;
    do
        r = waitpid(m_child, &status, WNOHANG);
    while (r < 0 && errno == EINTR);

    // Some other child, or ours is still alive
    if (r == 0)
        return;

    LOG_WARNF("[proc] child %d exited", static_cast<int>(m_child));
    m_child = -1;

    auto expected = handoff_state::handoff_in_progress;
    if (m_state.compare_exchange_strong(expected, handoff_state::running, std::memory_order_acq_rel))
    {
        LOG_WARN("[proc] child did not take over, resuming");
        if (m_hooks.resume_reader)
            m_hooks.resume_reader();
    }
}

void handoff_controller::terminate(int code)
{
    auto prev = m_state.exchange(handoff_state::terminated, std::memory_order_acq_rel);
    if (prev == handoff_state::terminated)
        return;

    m_exit_code = code;
    LOG_INFOF("[proc] terminating (%s)", code == 0 ? "stop" : "connection failure");

    if (!m_shutdown_done.exchange(true, std::memory_order_acq_rel) && m_hooks.shutdown)
        m_hooks.shutdown();
}
