#include "session.h"
#include "plugin_host.h"
#include "profile.h"
#include "../irc/binding_list.h"
#include "../irc/proto.h"
#include "../irc/wire_codec.h"
#include "../shared/logging.h"
#include "../shared/string_hash.h"
#include "../shared/task_group.h"

session::session(profile& prof, task_group& tasks, plugin_host& plugins, binding_list& bindings)
    : m_profile(prof),
      m_tasks(tasks),
      m_plugins(plugins),
      m_bindings(bindings),
      m_commands(prof.command_prefix(),
                 [&prof](std::string_view mask) { return prof.is_whitelisted(mask); },
                 tasks)
{
}

bool session::register_connection(response_writer& w)
{
    std::string nick = m_profile.nickname();

    return proto::pass(w, m_profile.connection_password())
        && proto::user(w, nick, "8", nick)
        && proto::nick(w, nick, m_profile.nickserv_password());
}

void session::on_welcome(response_writer& w)
{
    LOG_INFO("[session] registered with server");

    std::string oper_pw = m_profile.oper_password();
    if (!oper_pw.empty())
        proto::oper(w, m_profile.nickname(), oper_pw);

    for (const auto& ch : m_profile.channels())
    {
        if (!proto::join(w, ch))
        {
            LOG_WARNF("[session] could not join %s", ch.name.c_str());
            break;
        }
    }
}

void session::on_nick_in_use(response_writer& w)
{
    std::string nick = m_profile.nickname();
    std::string password = m_profile.nickserv_password();

    if (!password.empty())
    {
        LOG_INFOF("[session] nickname %s in use, recovering", nick.c_str());
        if (proto::recover(w, nick, password))
            proto::nick(w, nick, password);
        return;
    }

    nick += '_';
    LOG_INFOF("[session] nickname in use, switching to %s", nick.c_str());
    m_profile.set_nickname(nick);
    proto::nick(w, nick);
}

void session::handle_line(response_writer& w, std::string_view line)
{
    auto decoded = irc::decode(line);
    if (!decoded)
        return;

    inbound_event& ev = *decoded;

    // A message to us is answered to its sender
    if (m_profile.is_nick(ev.target))
        ev.target = ev.sender_nick;

    switch (fnv1a(ev.type))
    {
        case fnv1a("PING"):
            proto::pong(w, ev.payload);
            return;

        case fnv1a("ERROR"):
            LOG_ERRORF("[session] network error: %s", ev.payload.c_str());
            return;

        case fnv1a("001"):
            on_welcome(w);
            break;

        case fnv1a("433"):
            on_nick_in_use(w);
            break;

        default:
            break;
    }

    if (m_profile.logging())
        LOG_INFOF("[>] %s", ev.to_string().c_str());

    auto handlers = m_bindings.find(ev.type);
    if (!handlers.empty())
    {
        m_tasks.spawn([handlers = std::move(handlers), &w, ev]() {
            for (const auto& fn : handlers)
                run_guarded(ev.to_string(), [&] { (*fn)(w, ev); });
        });
    }

    m_plugins.dispatch(w, ev);
    m_commands.dispatch(w, ev);
}
