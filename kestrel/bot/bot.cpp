#include "bot.h"
#include "admin_commands.h"
#include "lua_plugin.h"
#include "profile.h"
#include "../proc/handoff.h"
#include "../proc/signal_adapter.h"
#include "../shared/logging.h"
#include "../version.h"

#include <chrono>
#include <csignal>
#include <unistd.h>

static constexpr auto PAUSE_TIMEOUT = std::chrono::seconds(5);

bool connection_writer::write(std::string_view data)
{
    io_result r = m_conn.write(data);
    if (r != io_result::ok)
    {
        LOG_WARNF("[bot] write failed: %s", io_result_name(r));
        return false;
    }
    return true;
}

// Host part of "host:port" / "[v6]:port"
static std::string host_of(const std::string& address)
{
    auto colon = address.rfind(':');
    std::string host = colon == std::string::npos ? address : address.substr(0, colon);
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']')
        host = host.substr(1, host.size() - 2);
    return host;
}

bot::bot(profile& prof, size_t inherited, spawn_fn spawner)
    : m_profile(prof),
      m_inherited(inherited),
      m_spawner(std::move(spawner)),
      m_writer(m_conn, m_bindings),
      m_plugins(m_tasks),
      m_session(prof, m_tasks, m_plugins, m_bindings)
{
}

bot::~bot()
{
    stop_reader();
    m_tasks.wait();
}

bool bot::init_tls()
{
    std::string cert = m_profile.tls_cert();
    std::string key = m_profile.tls_key();
    if (cert.empty() || key.empty())
        return true;

    m_tls = std::make_unique<tls_context>();
    if (!m_tls->init_client(cert, key, m_profile.ca_pem()))
    {
        LOG_ERROR("[bot] TLS setup failed");
        return false;
    }
    return true;
}

bool bot::open()
{
    std::string address = m_profile.address();

    if (m_inherited > 0)
    {
        LOG_INFOF("[bot] inheriting connection to %s", address.c_str());

        // Single-connection client: anything past the first slot is closed
        if (!adopt_inherited(m_inherited, {&m_conn}, m_tls.get(), host_of(address)))
            return false;

        // We own the connection now; let the parent go
        pid_t parent = getppid();
        if (parent > 1)
            kill(parent, SIGINT);
        return true;
    }

    LOG_INFOF("[bot] opening new connection to %s", address.c_str());
    if (!m_conn.dial(address, m_tls.get()))
        return false;

    return m_session.register_connection(m_writer);
}

void bot::bind_core_commands()
{
    bind_admin_commands(m_session.commands(), m_profile,
                        [this] { m_control.post(control_event::reload); });
}

int bot::run()
{
    LOG_INFOF("[bot] running %s %s", KESTREL_NAME, KESTREL_VERSION);

    if (!m_control.open())
        return 1;

    signal_adapter signals(m_control);
    if (!signals.installed())
        return 1;

    if (!init_tls())
        return 1;

    for (const auto& script : m_profile.scripts())
    {
        m_plugins.add(std::make_unique<lua_plugin>(
            script, m_tasks, m_writer.binder(),
            [this]() { m_control.post(control_event::reload); }));
    }
    m_plugins.load(m_profile);
    bind_core_commands();

    if (!open())
    {
        LOG_ERROR("[bot] could not open the connection");
        m_tasks.wait();
        m_plugins.unload(m_profile);
        return 1;
    }

    LOG_INFO("[bot] entering read loop");
    m_reader = std::thread([this] { read_loop(); });

    handoff_controller::hooks hooks;
    hooks.descriptors = [this]() -> std::vector<int> {
        // A TLS session's state lives in this process and cannot follow the socket
        if (m_conn.is_tls())
        {
            LOG_WARN("[bot] TLS connections cannot be handed off");
            return {};
        }
        return { m_conn.fd() };
    };
    hooks.pause_reader = [this] { return pause_reader(); };
    hooks.resume_reader = [this] { resume_reader(); };
    hooks.shutdown = [this] {
        stop_reader();
        m_conn.close();
    };

    handoff_controller controller(m_control, m_profile.fork_args(), std::move(hooks), m_spawner);

    // Supervisors expect the launched process to fork once
    if (m_inherited == 0)
        controller.request_reload();

    int code = controller.run();

    m_tasks.wait();
    m_plugins.unload(m_profile);

    LOG_INFO("[bot] shutting down");
    return code;
}

void bot::read_loop()
{
    std::string line;
    while (true)
    {
        io_result r = m_conn.read_line(line);
        if (r == io_result::ok)
        {
            m_session.handle_line(m_writer, line);
            continue;
        }

        std::unique_lock<std::mutex> lock(m_reader_mutex);
        if (m_stopping)
            break;

        if (r == io_result::interrupted)
        {
            if (!m_pause_requested)
                continue;

            m_paused = true;
            m_reader_cv.notify_all();
            m_reader_cv.wait(lock, [this] { return !m_pause_requested || m_stopping; });
            m_paused = false;
            if (m_stopping)
                break;
            continue;
        }

        LOG_ERRORF("[bot] read loop ended: %s", io_result_name(r));
        m_control.post(control_event::read_failed);
        break;
    }

    std::lock_guard<std::mutex> lock(m_reader_mutex);
    m_reader_done = true;
    m_reader_cv.notify_all();
}

bool bot::pause_reader()
{
    std::unique_lock<std::mutex> lock(m_reader_mutex);
    if (m_reader_done)
        return false;

    m_pause_requested = true;
    m_conn.interrupt_read();

    bool paused = m_reader_cv.wait_for(lock, PAUSE_TIMEOUT,
        [this] { return m_paused || m_reader_done; });

    if (!paused || !m_paused)
    {
        m_pause_requested = false;
        m_reader_cv.notify_all();
        return false;
    }
    return true;
}

void bot::resume_reader()
{
    std::lock_guard<std::mutex> lock(m_reader_mutex);
    m_pause_requested = false;
    m_reader_cv.notify_all();
}

void bot::stop_reader()
{
    {
        std::lock_guard<std::mutex> lock(m_reader_mutex);
        m_stopping = true;
        m_reader_cv.notify_all();
    }

    m_conn.interrupt_read();

    if (m_reader.joinable())
        m_reader.join();
}
