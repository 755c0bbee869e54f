#include "lua_plugin.h"
#include "profile.h"
#include "../irc/binding_list.h"
#include "../irc/proto.h"
#include "../irc/response_writer.h"
#include "../shared/logging.h"
#include "../shared/string_hash.h"

lua_plugin::lua_plugin(std::string path, task_group& tasks, protocol_binder* binder,
                       std::function<void()> reload)
    : m_path(std::move(path)),
      m_tasks(tasks),
      m_binder(binder),
      m_reload(std::move(reload))
{
}

lua_plugin::~lua_plugin()
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    if (m_binder)
        for (const auto& [type, id] : m_bindings)
            m_binder->unbind(type, id);
    m_commands.reset();
    m_on_event = sol::protected_function();
}

lua_plugin::script_fn::~script_fn()
{
    std::lock_guard<std::recursive_mutex> lock(m_owner.m_mutex);
    m_fn = sol::protected_function();
}

bool lua_plugin::check(const sol::protected_function_result& r, const char* what)
{
    if (r.valid())
        return true;

    sol::error err = r;
    LOG_ERRORF("[lua] %s: %s: %s", m_path.c_str(), what, err.what());
    return false;
}

template <typename Fn>
void lua_plugin::with_writer(response_writer& w, Fn&& fn)
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    response_writer* prev = m_writer;
    m_writer = &w;
    fn();
    m_writer = prev;
}

response_writer* lua_plugin::writer()
{
    if (!m_writer)
        LOG_WARNF("[lua] %s: write outside of a callback dropped", m_path.c_str());
    return m_writer;
}

sol::table lua_plugin::event_table(const inbound_event& ev)
{
    sol::table words = m_lua.create_table();
    int n = 0;
    for (auto& word : ev.fields(0))
        words[++n] = std::move(word);

    return m_lua.create_table_with(
        "nick", ev.sender_nick,
        "mask", ev.sender_mask,
        "type", ev.type,
        "target", ev.target,
        "payload", ev.payload,
        "words", words,
        "channel", ev.from_channel(),
        "privmsg", ev.is_privmsg());
}

// How a validated argument is handed to the script.
enum class arg_kind : uint8_t
{
    text,
    integer,
    uinteger,
    floating,
    boolean
};

static arg_kind kind_of(std::string_view pattern)
{
    switch (fnv1a_lower(pattern))
    {
        case fnv1a("int"):   return arg_kind::integer;
        case fnv1a("uint"):  return arg_kind::uinteger;
        case fnv1a("float"): return arg_kind::floating;
        case fnv1a("bool"):  return arg_kind::boolean;
        default:             return arg_kind::text;
    }
}

void lua_plugin::register_api()
{
    m_lua.set_function("bind", [this](const std::string& cmd_name, bool restricted,
                                      sol::protected_function fn, sol::optional<sol::table> specs) {
        struct spec_entry
        {
            std::string name;
            bool required{false};
            std::string pattern;
        };

        std::vector<spec_entry> entries;
        for (size_t i = 1; specs && i <= specs->size(); ++i)
        {
            sol::object entry = (*specs)[i];
            if (entry.is<std::string>())
            {
                entries.push_back({entry.as<std::string>(), false, {}});
                continue;
            }
            if (!entry.is<sol::table>())
                continue;

            sol::table t = entry.as<sol::table>();
            entries.push_back({t.get_or<std::string>("name", ""), t.get_or("required", false),
                               t.get_or<std::string>("pattern", "")});
        }

        std::vector<arg_kind> kinds;
        for (const auto& e : entries)
            kinds.push_back(kind_of(e.pattern));

        auto script = std::make_shared<script_fn>(*this, std::move(fn));
        command_fn handler = [this, script, kinds = std::move(kinds)](response_writer& w, const inbound_event& ev,
                                                                     const param_list& params) {
            with_writer(w, [&] {
                sol::table args = m_lua.create_table(static_cast<int>(params.size()), 0);
                for (size_t i = 0; i < params.size(); ++i)
                {
                    switch (i < kinds.size() ? kinds[i] : arg_kind::text)
                    {
                        case arg_kind::integer:  args[i + 1] = params.as_int(i); break;
                        case arg_kind::uinteger: args[i + 1] = params.as_uint(i); break;
                        case arg_kind::floating: args[i + 1] = params.as_float(i); break;
                        case arg_kind::boolean:  args[i + 1] = params.as_bool(i); break;
                        case arg_kind::text:     args[i + 1] = params.as_string(i); break;
                    }
                }
                check(script->get()(event_table(ev), args), "command handler");
            });
        };

        auto builder = m_commands->bind(cmd_name, restricted, std::move(handler));
        for (const auto& e : entries)
        {
            pattern_ptr re = patterns::lookup(e.pattern);
            if (!re)
            {
                LOG_WARNF("[lua] %s: command %s: parameter %s falls back to any",
                          m_path.c_str(), cmd_name.c_str(), e.name.c_str());
            }
            builder.add_param(e.name, e.required, std::move(re));
        }
    });

    m_lua.set_function("unbind", [this](const std::string& cmd_name) {
        m_commands->unbind(cmd_name);
    });

    m_lua.set_function("privmsg", [this](const std::string& target, const std::string& text) {
        response_writer* w = writer();
        return w && proto::privmsg(*w, target, text);
    });

    m_lua.set_function("notice", [this](const std::string& target, const std::string& text) {
        response_writer* w = writer();
        return w && proto::notice(*w, target, text);
    });

    m_lua.set_function("raw", [this](const std::string& line) {
        response_writer* w = writer();
        return w && proto::raw(*w, line);
    });

    m_lua.set_function("mode", [this](const std::string& target, const std::string& flags,
                                      sol::optional<std::string> arg) {
        response_writer* w = writer();
        return w && proto::mode(*w, target, flags, arg.value_or(""));
    });

    m_lua.set_function("log", [this](const std::string& text) {
        LOG_INFOF("[lua] %s: %s", m_path.c_str(), text.c_str());
    });

    m_lua.set_function("reload", [this]() {
        if (m_reload)
            m_reload();
    });

    if (!m_binder)
        return;

    m_lua.set_function("on", [this](const std::string& type, sol::protected_function fn) {
        auto script = std::make_shared<script_fn>(*this, std::move(fn));
        request_fn handler = [this, script](response_writer& w, const inbound_event& ev) {
            with_writer(w, [&] { check(script->get()(event_table(ev)), "binding handler"); });
        };
        uint64_t id = m_binder->bind(type, std::move(handler));
        m_bindings.emplace_back(type, id);
        return id;
    });

    m_lua.set_function("off", [this](const std::string& type, uint64_t id) {
        m_binder->unbind(type, id);
        for (auto it = m_bindings.begin(); it != m_bindings.end(); ++it)
        {
            if (it->first == type && it->second == id)
            {
                m_bindings.erase(it);
                break;
            }
        }
    });
}

bool lua_plugin::load(profile& prof)
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);

    m_commands = std::make_unique<command_set>(
        prof.command_prefix(),
        [&prof](std::string_view mask) { return prof.is_whitelisted(mask); },
        m_tasks);

    m_lua.open_libraries(sol::lib::base, sol::lib::string, sol::lib::table,
                         sol::lib::math, sol::lib::os);
    register_api();

    auto result = m_lua.safe_script_file(m_path, sol::script_pass_on_error);
    if (!result.valid())
    {
        sol::error err = result;
        LOG_ERRORF("[lua] script error: %s", err.what());
        return false;
    }

    m_on_event = m_lua["on_event"];

    LOG_INFOF("[lua] %s: %zu command(s)%s", m_path.c_str(), m_commands->size(),
              m_on_event.valid() ? ", on_event" : "");
    return true;
}

bool lua_plugin::unload(profile&)
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);

    bool ok = true;
    sol::protected_function on_unload = m_lua["on_unload"];
    if (on_unload.valid())
        ok = check(on_unload(), "on_unload");

    if (m_binder)
        for (const auto& [type, id] : m_bindings)
            m_binder->unbind(type, id);
    m_bindings.clear();

    return ok;
}

void lua_plugin::dispatch(response_writer& w, const inbound_event& ev)
{
    if (m_commands)
        m_commands->dispatch(w, ev);

    with_writer(w, [&] {
        if (m_on_event.valid())
            check(m_on_event(event_table(ev)), "on_event");
    });
}
