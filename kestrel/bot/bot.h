#pragma once
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "plugin_host.h"
#include "session.h"
#include "../irc/binding_list.h"
#include "../irc/response_writer.h"
#include "../net/connection.h"
#include "../proc/control_channel.h"
#include "../proc/handoff.h"
#include "../shared/task_group.h"
#include "../shared/tls_context.h"

class profile;

// Writes go straight to the connection; protocol bindings are offered.
class connection_writer : public response_writer
{
public:
    connection_writer(connection& conn, binding_list& bindings)
        : m_conn(conn), m_bindings(bindings) {}

    bool write(std::string_view data) override;
    protocol_binder* binder() override { return &m_bindings; }

private:
    connection& m_conn;
    binding_list& m_bindings;
};

// One bot process: a connection, its read loop, the plugins and the
// handoff controller driving the process lifecycle.
class bot
{
public:
    // inherited is the --fork count: descriptors at slots 3.. to adopt.
    // spawner starts the process a reload hands the connection to.
    bot(profile& prof, size_t inherited, spawn_fn spawner = exec_self);
    ~bot();

    bot(const bot&) = delete;
    bot& operator=(const bot&) = delete;

    // Blocks until the process should exit; returns the exit status.
    int run();

private:
    bool init_tls();
    bool open();
    void bind_core_commands();

    void read_loop();
    bool pause_reader();
    void resume_reader();
    void stop_reader();

    profile& m_profile;
    const size_t m_inherited;
    spawn_fn m_spawner;

    control_channel m_control;
    std::unique_ptr<tls_context> m_tls;
    connection m_conn;
    binding_list m_bindings;
    connection_writer m_writer;
    task_group m_tasks;
    plugin_host m_plugins;
    session m_session;

    std::thread m_reader;
    std::mutex m_reader_mutex;
    std::condition_variable m_reader_cv;
    bool m_pause_requested{false};
    bool m_paused{false};
    bool m_stopping{false};
    bool m_reader_done{false};
};
