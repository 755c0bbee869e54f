#pragma once
#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "command.h"

class task_group;
class command_set;

enum class dispatch_result : uint8_t
{
    not_command        = 0,     // no prefix, or no name after it
    unknown_command    = 1,
    access_denied      = 2,
    missing_parameters = 3,
    invalid_parameter  = 4,
    scheduled          = 5      // handler was started
};

const char* dispatch_result_name(dispatch_result r);

// Returned by command_set::bind to declare parameters in order:
//   set.bind("join", true, fn).add_param("channel", true, patterns::channel());
class command_builder
{
public:
    command_builder(command_set& set, std::shared_ptr<command> cmd)
        : m_set(set), m_cmd(std::move(cmd)) {}

    // A null pattern accepts anything.
    command_builder& add_param(std::string_view name, bool required, pattern_ptr pattern = nullptr);

private:
    command_set& m_set;
    std::shared_ptr<command> m_cmd;
};

// Commands keyed by name, sorted for binary search. Safe for concurrent
// dispatch while other threads bind and unbind.
class command_set
{
public:
    // Decides whether a sender hostmask may run restricted commands.
    using auth_fn = std::function<bool(std::string_view mask)>;

    // A null auth denies every restricted command.
    command_set(std::string prefix, auth_fn auth, task_group& tasks);

    // Binding an existing name replaces that command.
    command_builder bind(std::string_view name, bool restricted, command_fn handler);
    void unbind(std::string_view name);

    bool contains(std::string_view name) const;
    size_t size() const;
    std::vector<std::string> names() const;

    const std::string& prefix() const { return m_prefix; }

    // True only when a handler was scheduled. Rejections are answered
    // with a PRIVMSG to the sender and return false.
    bool dispatch(response_writer& w, const inbound_event& ev);
    dispatch_result dispatch_ex(response_writer& w, const inbound_event& ev);

    // Splits a command line into name and arguments. Double quotes group
    // words; an unterminated quote runs to the end. Empty tokens are dropped.
    static std::vector<std::string> split(std::string_view line);

private:
    friend class command_builder;

    // Index of name in m_data, or -1. Caller holds m_mutex.
    long index(std::string_view name) const;

    const std::string m_prefix;
    const auth_fn m_auth;
    task_group& m_tasks;

    mutable std::shared_mutex m_mutex;
    std::vector<std::shared_ptr<command>> m_data;
};
