#pragma once
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <sol/sol.hpp>

#include "plugin.h"
#include "../cmd/command_set.h"

class protocol_binder;
class task_group;

// A plugin written in Lua. The script sees these globals:
//
//   bind(name, restricted, function(ev, params) end, { {name=, required=, pattern=}, ... })
//   unbind(name)
//   on(type, function(ev) end) -> id      (only when the writer supports bindings)
//   off(type, id)
//   privmsg(target, text), notice(target, text), mode(target, flags [, arg]), raw(line)
//   log(text)
//   reload()
//
// and may define on_event(ev), on_unload(). ev is a table with nick, mask,
// type, target, payload, words (the payload split on blanks), channel (true
// when the target is a channel) and privmsg. Command parameters with an int,
// uint, float or bool pattern arrive converted; all others as strings.
// All script code runs under one lock per plugin,
// and every Lua reference is created and released under it. Handlers the
// plugin binds must not outlive it.
class lua_plugin : public plugin
{
public:
    // binder is null when the connection offers no protocol bindings.
    lua_plugin(std::string path, task_group& tasks, protocol_binder* binder,
               std::function<void()> reload);
    ~lua_plugin() override;

    const char* name() const override { return m_path.c_str(); }

    bool load(profile& prof) override;
    bool unload(profile& prof) override;
    void dispatch(response_writer& w, const inbound_event& ev) override;

    // Available after load().
    command_set* commands() { return m_commands.get(); }

private:
    // A script function shared by the handlers that call it. Released
    // under the plugin lock, whichever thread drops the last owner.
    class script_fn
    {
    public:
        script_fn(lua_plugin& owner, sol::protected_function fn)
            : m_owner(owner), m_fn(std::move(fn)) {}
        ~script_fn();

        script_fn(const script_fn&) = delete;
        script_fn& operator=(const script_fn&) = delete;

        // Caller holds the plugin lock.
        sol::protected_function& get() { return m_fn; }

    private:
        lua_plugin& m_owner;
        sol::protected_function m_fn;
    };

    void register_api();

    // Runs fn with the Lua state locked and w as the reply target.
    template <typename Fn>
    void with_writer(response_writer& w, Fn&& fn);

    sol::table event_table(const inbound_event& ev);
    bool check(const sol::protected_function_result& r, const char* what);

    // Current reply target, or null (logged) outside a callback.
    response_writer* writer();

    const std::string m_path;
    task_group& m_tasks;
    protocol_binder* const m_binder;
    std::function<void()> m_reload;

    std::recursive_mutex m_mutex;   // script API calls re-enter while a callback holds it
    response_writer* m_writer{nullptr};

    // Declared before everything holding Lua references so it dies last
    sol::state m_lua;
    sol::protected_function m_on_event;
    std::unique_ptr<command_set> m_commands;
    std::vector<std::pair<std::string, uint64_t>> m_bindings;
};
