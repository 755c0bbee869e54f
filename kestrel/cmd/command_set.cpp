#include "command_set.h"
#include "../irc/proto.h"
#include "../irc/response_writer.h"
#include "../shared/logging.h"
#include "../shared/string_hash.h"
#include "../shared/task_group.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <mutex>
#include <utility>

static const char* const TEXT_MISSING_PARAMETERS = "Missing parameters for command: ";
static const char* const TEXT_ACCESS_DENIED      = "Access denied. Command \"%s\" may only be run by administrators.";
static const char* const TEXT_INVALID_PARAMETER  = "Command %s: invalid value for parameter \"%s\"";

static std::string format_text(const char* fmt, const std::string& a, const std::string& b = {})
{
    char buf[512];
    std::snprintf(buf, sizeof(buf), fmt, a.c_str(), b.c_str());
    return buf;
}

const char* dispatch_result_name(dispatch_result r)
{
    switch (r)
    {
        case dispatch_result::not_command:        return "not a command";
        case dispatch_result::unknown_command:    return "unknown command";
        case dispatch_result::access_denied:      return "access denied";
        case dispatch_result::missing_parameters: return "missing parameters";
        case dispatch_result::invalid_parameter:  return "invalid parameter";
        case dispatch_result::scheduled:          return "scheduled";
    }
    return "unknown";
}

command_builder& command_builder::add_param(std::string_view name, bool required, pattern_ptr pattern)
{
    param_spec p;
    p.name = to_lower(name);
    p.required = required;
    p.pattern = pattern ? std::move(pattern) : patterns::any();

    std::unique_lock lock(m_set.m_mutex);
    m_cmd->params.push_back(std::move(p));
    return *this;
}

command_set::command_set(std::string prefix, auth_fn auth, task_group& tasks)
    : m_prefix(std::move(prefix)),
      m_auth(auth ? std::move(auth) : auth_fn([](std::string_view) { return false; })),
      m_tasks(tasks)
{
}

long command_set::index(std::string_view name) const
{
    auto it = std::lower_bound(m_data.begin(), m_data.end(), name,
        [](const std::shared_ptr<command>& c, std::string_view n) { return c->name < n; });

    if (it == m_data.end() || (*it)->name != name)
        return -1;
    return static_cast<long>(it - m_data.begin());
}

command_builder command_set::bind(std::string_view name, bool restricted, command_fn handler)
{
    auto cmd = std::make_shared<command>();
    cmd->name = to_lower(name);
    cmd->restricted = restricted;
    cmd->handler = std::move(handler);

    // A replaced handler is released after the lock; it may take its owner's
    std::shared_ptr<command> replaced;
    std::unique_lock lock(m_mutex);

    auto it = std::lower_bound(m_data.begin(), m_data.end(), cmd->name,
        [](const std::shared_ptr<command>& c, const std::string& n) { return c->name < n; });

    if (it != m_data.end() && (*it)->name == cmd->name)
    {
        LOG_DEBUGF("[cmd] replacing command '%s'", cmd->name.c_str());
        replaced = std::exchange(*it, cmd);
    }
    else
    {
        m_data.insert(it, cmd);
    }

    return command_builder(*this, std::move(cmd));
}

void command_set::unbind(std::string_view name)
{
    std::string key = to_lower(name);

    std::shared_ptr<command> removed;
    std::unique_lock lock(m_mutex);
    long idx = index(key);
    if (idx >= 0)
    {
        removed = std::move(m_data[idx]);
        m_data.erase(m_data.begin() + idx);
    }
}

bool command_set::contains(std::string_view name) const
{
    std::string key = to_lower(name);
    std::shared_lock lock(m_mutex);
    return index(key) >= 0;
}

size_t command_set::size() const
{
    std::shared_lock lock(m_mutex);
    return m_data.size();
}

std::vector<std::string> command_set::names() const
{
    std::shared_lock lock(m_mutex);
    std::vector<std::string> out;
    out.reserve(m_data.size());
    for (const auto& c : m_data)
        out.push_back(c->name);
    return out;
}

std::vector<std::string> command_set::split(std::string_view line)
{
    std::vector<std::string> out;
    std::string token;
    bool quoted = false;

    for (char c : line)
    {
        if (c == '"')
        {
            quoted = !quoted;
            continue;
        }

        if (!quoted && std::isspace(static_cast<unsigned char>(c)))
        {
            if (!token.empty())
                out.push_back(std::move(token));
            token.clear();
            continue;
        }

        token += c;
    }

    if (!token.empty())
        out.push_back(std::move(token));

    return out;
}

bool command_set::dispatch(response_writer& w, const inbound_event& ev)
{
    dispatch_result r = dispatch_ex(w, ev);
    if (r != dispatch_result::not_command)
        LOG_DEBUGF("[cmd] %s: %s", ev.sender_mask.c_str(), dispatch_result_name(r));
    return r == dispatch_result::scheduled;
}

dispatch_result command_set::dispatch_ex(response_writer& w, const inbound_event& ev)
{
    if (ev.payload.compare(0, m_prefix.size(), m_prefix) != 0)
        return dispatch_result::not_command;

    auto args = split(std::string_view(ev.payload).substr(m_prefix.size()));
    if (args.empty())
        return dispatch_result::not_command;

    std::string name = to_lower(args.front());
    args.erase(args.begin());

    std::shared_ptr<command> cmd;
    size_t required = 0;
    param_list params;
    long failed_param = -1;
    std::string failed_name;
    {
        std::shared_lock lock(m_mutex);
        long idx = index(name);
        if (idx < 0)
            return dispatch_result::unknown_command;

        cmd = m_data[static_cast<size_t>(idx)];
        required = cmd->required_count();

        for (size_t i = 0; i < args.size() && i < cmd->params.size(); ++i)
        {
            if (!cmd->params[i].validate(args[i]))
            {
                failed_param = static_cast<long>(i);
                failed_name = cmd->params[i].name;
                break;
            }
            params.push_back(args[i]);
        }
    }

    // The predicate may block (profile lock); run it outside the registry lock
    if (cmd->restricted && !m_auth(ev.sender_mask))
    {
        proto::privmsg(w, ev.sender_nick, format_text(TEXT_ACCESS_DENIED, cmd->name));
        return dispatch_result::access_denied;
    }

    if (args.size() < required)
    {
        proto::privmsg(w, ev.sender_nick, TEXT_MISSING_PARAMETERS + cmd->name);
        return dispatch_result::missing_parameters;
    }

    if (failed_param >= 0)
    {
        proto::privmsg(w, ev.sender_nick, format_text(TEXT_INVALID_PARAMETER, cmd->name, failed_name));
        return dispatch_result::invalid_parameter;
    }

    LOG_DEBUGF("[cmd] running %s (%s)", cmd->name.c_str(), params.join().c_str());

    // w must outlive the task; the owner waits on m_tasks before tearing down
    bool started = m_tasks.spawn([cmd, &w, ev, params = std::move(params)]() {
        if (cmd->handler)
            run_guarded(ev.to_string(), [&] { cmd->handler(w, ev, params); });
    });

    return started ? dispatch_result::scheduled : dispatch_result::not_command;
}
