#pragma once
#include <string_view>

#include "../cmd/command_set.h"

class binding_list;
class plugin_host;
class profile;
class response_writer;
class task_group;

// Protocol housekeeping for one connection plus event routing. Runs on
// the read loop thread; everything slow happens on tasks.
class session
{
public:
    session(profile& prof, task_group& tasks, plugin_host& plugins, binding_list& bindings);

    // PASS, USER and NICK (with nickserv identify) for a fresh connection.
    bool register_connection(response_writer& w);

    // Decodes and routes one inbound line.
    void handle_line(response_writer& w, std::string_view line);

    // Commands served directly by the bot, beside those of plugins.
    command_set& commands() { return m_commands; }

private:
    void on_welcome(response_writer& w);
    void on_nick_in_use(response_writer& w);

    profile& m_profile;
    task_group& m_tasks;
    plugin_host& m_plugins;
    binding_list& m_bindings;
    command_set m_commands;
};
