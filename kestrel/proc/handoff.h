#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <sys/types.h>
#include <vector>

#include "control_channel.h"

class connection;
class tls_context;

// Inherited descriptors start at this slot in a handed-off child.
constexpr int INHERITED_FD_BASE = 3;

// Most descriptors one handoff can pass.
constexpr size_t MAX_HANDOFF_FDS = 64;

// Descriptors {3, 4, ..., 3+count-1}, as passed by the parent.
std::vector<int> inherited_descriptors(size_t count);

// Adopts slot 3+i into conns[i]. Slots past conns.size() are closed.
// Fails if fewer than conns.size() slots were passed or any adopt fails;
// slots not taken by a connection are closed either way.
bool adopt_inherited(size_t count, const std::vector<connection*>& conns,
                     const tls_context* tls = nullptr, std::string_view host = {});

enum class handoff_state : uint8_t
{
    running             = 0,
    handoff_in_progress = 1,
    terminated          = 2
};

const char* handoff_state_name(handoff_state s);

// Starts a child with fds placed at slots 3.. and the given argv tail.
// Returns the child pid, or -1 on failure.
using spawn_fn = std::function<pid_t(const std::vector<int>& fds, const std::vector<std::string>& args)>;

// Forks and execs /proc/self/exe with "--fork N" followed by args.
// Fails (returns -1) if either the fork or the exec fails, or if more
// than MAX_HANDOFF_FDS descriptors are given.
pid_t exec_self(const std::vector<int>& fds, const std::vector<std::string>& args);

// Drives the process through running -> handoff_in_progress -> terminated
// from a single control loop. Events arrive through a control_channel;
// signals reach it through a signal_adapter, code through request_*().
class handoff_controller
{
public:
    // Connection-side operations the controller needs.
    struct hooks
    {
        // Descriptors to hand to the child, in slot order.
        std::function<std::vector<int>()> descriptors;

        // Stops the read loop and waits until it no longer reads. May fail.
        std::function<bool()> pause_reader;
        std::function<void()> resume_reader;

        // Runs once on the way to terminated. Must not shut the socket
        // down: a child may still be using it.
        std::function<void()> shutdown;
    };

    handoff_controller(control_channel& ch, std::vector<std::string> fork_args,
                       hooks h, spawn_fn spawner = exec_self);

    handoff_controller(const handoff_controller&) = delete;
    handoff_controller& operator=(const handoff_controller&) = delete;

    bool request_reload() const;
    bool request_stop() const;

    // Applies one event. Returns false once terminated.
    bool handle(control_event ev);

    // Consumes events until terminated. Returns the process exit status:
    // 0 after a stop, 1 after a connection failure.
    int run();

    handoff_state state() const { return m_state.load(std::memory_order_acquire); }
    int exit_code() const { return m_exit_code; }
    pid_t child() const { return m_child; }

private:
    void begin_handoff();
    void child_exited();
    void terminate(int code);

    control_channel& m_channel;
    const std::vector<std::string> m_fork_args;
    hooks m_hooks;
    spawn_fn m_spawner;

    std::atomic<handoff_state> m_state{handoff_state::running};
    std::atomic<bool> m_shutdown_done{false};
    int m_exit_code{0};
    pid_t m_child{-1};
};
