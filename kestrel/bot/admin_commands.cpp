#include "admin_commands.h"
#include "profile.h"
#include "../cmd/command_set.h"
#include "../irc/proto.h"
#include "../version.h"

#include <chrono>
#include <cstdio>
#include <string>
#include <vector>

static const auto g_started = std::chrono::steady_clock::now();

static std::string join_list(const std::vector<std::string>& items)
{
    std::string out;
    for (const auto& s : items)
    {
        if (!out.empty())
            out += ", ";
        out += s;
    }
    return out;
}

void bind_admin_commands(command_set& cmds, profile& prof, std::function<void()> reload)
{
    command_fn help = [&cmds](response_writer& w, const inbound_event& ev, const param_list&) {
        std::vector<std::string> names = cmds.names();
        for (auto& n : names)
            n = cmds.prefix() + n;
        proto::privmsg(w, ev.target, ev.sender_nick + ", I know these commands: " + join_list(names));
    };
    cmds.bind("help", false, help);
    cmds.bind(prof.nickname(), false, help);

    cmds.bind("nick", true, [&prof](response_writer& w, const inbound_event&, const param_list& params) {
        std::string password = params.size() > 1 ? params.as_string(1) : std::string();
        if (!proto::nick(w, params.as_string(0), password))
            return;

        prof.set_nickname(params.as_string(0));
        if (!password.empty())
            prof.set_nickserv_password(password);
    })
        .add_param("name", true)
        .add_param("password", false);

    cmds.bind("join", true, [](response_writer& w, const inbound_event&, const param_list& params) {
        channel ch;
        ch.name = params.as_string(0);
        if (params.size() > 1)
            ch.password = params.as_string(1);
        if (params.size() > 2)
            ch.key = params.as_string(2);
        proto::join(w, ch);
    })
        .add_param("channel", true, patterns::channel())
        .add_param("password", false)
        .add_param("key", false);

    cmds.bind("part", true, [](response_writer& w, const inbound_event&, const param_list& params) {
        proto::part(w, channel{params.as_string(0), {}, {}});
    }).add_param("channel", true, patterns::channel());

    cmds.bind("authlist", true, [&prof](response_writer& w, const inbound_event& ev, const param_list&) {
        proto::privmsg(w, ev.sender_nick, "Administrators: " + join_list(prof.whitelist()));
    });

    cmds.bind("authorize", true, [&prof](response_writer& w, const inbound_event& ev, const param_list& params) {
        prof.whitelist_add(params.as_string(0));
        proto::privmsg(w, ev.sender_nick, "User \"" + params.as_string(0) + "\" was added to the administrators.");
    }).add_param("mask", true);

    cmds.bind("deauthorize", true, [&prof](response_writer& w, const inbound_event& ev, const param_list& params) {
        prof.whitelist_remove(params.as_string(0));
        proto::privmsg(w, ev.sender_nick, "User \"" + params.as_string(0) + "\" was removed from the administrators.");
    }).add_param("mask", true);

    cmds.bind("log", true, [&prof](response_writer& w, const inbound_event& ev, const param_list& params) {
        if (!params.empty())
            prof.set_logging(params.as_bool(0));
        proto::privmsg(w, ev.sender_nick, prof.logging() ? "Logging is on." : "Logging is off.");
    }).add_param("state", false, patterns::boolean());

    cmds.bind("reload", true, [reload = std::move(reload)](response_writer& w, const inbound_event& ev, const param_list&) {
        proto::privmsg(w, ev.target, "Reloading.");
        if (reload)
            reload();
    });

    cmds.bind("version", false, [](response_writer& w, const inbound_event& ev, const param_list&) {
        std::chrono::duration<double, std::ratio<3600>> up = std::chrono::steady_clock::now() - g_started;
        char hours[32];
        std::snprintf(hours, sizeof(hours), "%.3f", up.count());

        proto::privmsg(w, ev.target, ev.sender_nick + ", I am " + text::bold(KESTREL_NAME)
            + ", version " + text::bold(KESTREL_VERSION)
            + ". Last restart was " + text::bold(hours) + " hours ago.");
    });
}
