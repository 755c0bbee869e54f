#include "profile.h"
#include "../shared/string_hash.h"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <sstream>
#include <sol/sol.hpp>

namespace fs = std::filesystem;

bool parse_log_level(std::string_view str, log_level& level)
{
    switch (fnv1a_lower(str))
    {
        case fnv1a("debug"): level = log_debug; return true;
        case fnv1a("info"):  level = log_info;  return true;
        case fnv1a("warn"):  level = log_warn;  return true;
        case fnv1a("error"): level = log_error; return true;
        default: return false;
    }
}

const char* log_level_name(log_level level)
{
    switch (level)
    {
        case log_debug: return "debug";
        case log_info:  return "info";
        case log_warn:  return "warn";
        case log_error: return "error";
    }
    return "info";
}

profile::profile(std::string root)
    : m_root(std::move(root))
{
}

std::string profile::path() const
{
    const char* env = std::getenv("KESTREL_PROFILE");
    if (env && env[0])
        return env;
    return (fs::path(m_root) / FILE_NAME).string();
}

std::vector<std::string> profile::fork_args() const
{
    return { m_root };
}

static std::string get_string(sol::table t, const char* key, const std::string& fallback)
{
    sol::optional<std::string> v = t[key];
    return v ? *v : fallback;
}

static std::vector<std::string> get_string_list(sol::table t, const char* key)
{
    std::vector<std::string> out;
    sol::optional<sol::table> list = t[key];
    if (!list)
        return out;

    for (size_t i = 1; i <= list->size(); ++i)
    {
        sol::optional<std::string> v = (*list)[i];
        if (v && !v->empty())
            out.push_back(*v);
    }
    return out;
}

bool profile::load()
{
    std::string p = path();

    std::ifstream check(p);
    if (!check.good())
    {
        LOG_ERRORF("[profile] cannot open %s", p.c_str());
        return false;
    }
    check.close();

    sol::state lua;
    lua.open_libraries(sol::lib::base, sol::lib::string, sol::lib::table);

    auto result = lua.safe_script_file(p, sol::script_pass_on_error);
    if (!result.valid())
    {
        sol::error err = result;
        LOG_ERRORF("[profile] error loading %s: %s", p.c_str(), err.what());
        return false;
    }

    if (!apply(lua, p))
        return false;

    m_loaded_from_file = true;
    return true;
}

bool profile::load_string(std::string_view source)
{
    sol::state lua;
    lua.open_libraries(sol::lib::base, sol::lib::string, sol::lib::table);

    auto result = lua.safe_script(source, sol::script_pass_on_error);
    if (!result.valid())
    {
        sol::error err = result;
        LOG_ERRORF("[profile] error loading profile: %s", err.what());
        return false;
    }

    return apply(lua, "<string>");
}

bool profile::apply(sol::state& lua, const std::string& origin)
{
    sol::optional<sol::table> cfg = lua["profile"];
    if (!cfg)
    {
        LOG_ERRORF("[profile] %s does not define a 'profile' table", origin.c_str());
        return false;
    }

    std::vector<channel> chans;
    sol::optional<sol::table> ctab = (*cfg)["channels"];
    if (ctab)
    {
        for (size_t i = 1; i <= ctab->size(); ++i)
        {
            sol::object entry = (*ctab)[i];
            channel ch;
            if (entry.is<std::string>())
            {
                ch.name = entry.as<std::string>();
            }
            else if (entry.is<sol::table>())
            {
                sol::table t = entry.as<sol::table>();
                ch.name = get_string(t, "name", "");
                ch.key = get_string(t, "key", "");
                ch.password = get_string(t, "password", "");
            }

            if (ch.name.empty())
            {
                LOG_WARNF("[profile] %s: channel entry %zu has no name", origin.c_str(), i);
                continue;
            }
            chans.push_back(std::move(ch));
        }
    }

    log_level level = log_info;
    sol::optional<std::string> ll = (*cfg)["log_level"];
    if (ll && !parse_log_level(*ll, level))
        LOG_WARNF("[profile] %s: unknown log_level '%s'", origin.c_str(), ll->c_str());

    std::string nick = get_string(*cfg, "nickname", "");
    std::string address = get_string(*cfg, "address", "");
    if (nick.empty() || address.empty())
    {
        LOG_ERRORF("[profile] %s: address and nickname are required", origin.c_str());
        return false;
    }

    std::string prefix = get_string(*cfg, "command_prefix", "!");
    if (prefix.empty())
        prefix = "!";

    sol::optional<bool> logging = (*cfg)["logging"];

    std::unique_lock lock(m_mutex);
    m_address = std::move(address);
    m_nickname = std::move(nick);
    m_tls_cert = get_string(*cfg, "tls_cert", "");
    m_tls_key = get_string(*cfg, "tls_key", "");
    m_ca_pem = get_string(*cfg, "ca_pem", "");
    m_nickserv_password = get_string(*cfg, "nickserv_password", "");
    m_oper_password = get_string(*cfg, "oper_password", "");
    m_connection_password = get_string(*cfg, "connection_password", "");
    m_command_prefix = std::move(prefix);
    m_channels = std::move(chans);
    m_whitelist = get_string_list(*cfg, "whitelist");
    m_scripts = get_string_list(*cfg, "scripts");
    m_logging = logging.value_or(false);
    m_level = level;
    return true;
}

// Lua string literal for s
static std::string quote(std::string_view s)
{
    std::string out;
    out.reserve(s.size() + 2);
    out += '"';
    for (char c : s)
    {
        switch (c)
        {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20)
                {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\%03u", static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += buf;
                }
                else
                {
                    out += c;
                }
        }
    }
    out += '"';
    return out;
}

std::string profile::serialize() const
{
    std::ostringstream out;
    std::shared_lock lock(m_mutex);

    out << "-- kestrel profile\n";
    out << "profile = {\n";
    out << "    address = " << quote(m_address) << ",\n";
    out << "    nickname = " << quote(m_nickname) << ",\n";
    out << "    nickserv_password = " << quote(m_nickserv_password) << ",\n";
    out << "    oper_password = " << quote(m_oper_password) << ",\n";
    out << "    connection_password = " << quote(m_connection_password) << ",\n";
    out << "    command_prefix = " << quote(m_command_prefix) << ",\n";
    out << "    tls_cert = " << quote(m_tls_cert) << ",\n";
    out << "    tls_key = " << quote(m_tls_key) << ",\n";
    out << "    ca_pem = " << quote(m_ca_pem) << ",\n";
    out << "    logging = " << (m_logging ? "true" : "false") << ",\n";
    out << "    log_level = " << quote(log_level_name(m_level)) << ",\n";

    out << "    channels = {\n";
    for (const auto& ch : m_channels)
    {
        out << "        { name = " << quote(ch.name)
            << ", key = " << quote(ch.key)
            << ", password = " << quote(ch.password) << " },\n";
    }
    out << "    },\n";

    out << "    whitelist = {\n";
    for (const auto& mask : m_whitelist)
        out << "        " << quote(mask) << ",\n";
    out << "    },\n";

    out << "    scripts = {\n";
    for (const auto& s : m_scripts)
        out << "        " << quote(s) << ",\n";
    out << "    },\n";

    out << "}\n";
    return out.str();
}

bool profile::save() const
{
    std::string text = serialize();

    fs::path p = path();
    fs::path tmp = p;
    tmp += ".tmp";

    std::ofstream f(tmp, std::ios::trunc);
    if (!f.is_open())
    {
        LOG_ERRORF("[profile] cannot write %s", tmp.c_str());
        return false;
    }

    f << text;
    f.close();

    if (f.fail())
    {
        std::error_code ec;
        fs::remove(tmp, ec);
        LOG_ERRORF("[profile] write to %s failed", tmp.c_str());
        return false;
    }

    std::error_code ec;
    fs::rename(tmp, p, ec);
    if (ec)
    {
        LOG_ERRORF("[profile] rename %s: %s", p.c_str(), ec.message().c_str());
        return false;
    }
    return true;
}

void profile::persist() const
{
    if (m_loaded_from_file && !save())
        LOG_WARN("[profile] changes were not saved");
}

std::string profile::address() const
{
    std::shared_lock lock(m_mutex);
    return m_address;
}

std::string profile::tls_cert() const
{
    std::shared_lock lock(m_mutex);
    return m_tls_cert;
}

std::string profile::tls_key() const
{
    std::shared_lock lock(m_mutex);
    return m_tls_key;
}

std::string profile::ca_pem() const
{
    std::shared_lock lock(m_mutex);
    return m_ca_pem;
}

std::string profile::connection_password() const
{
    std::shared_lock lock(m_mutex);
    return m_connection_password;
}

std::string profile::oper_password() const
{
    std::shared_lock lock(m_mutex);
    return m_oper_password;
}

std::string profile::command_prefix() const
{
    std::shared_lock lock(m_mutex);
    return m_command_prefix;
}

std::vector<channel> profile::channels() const
{
    std::shared_lock lock(m_mutex);
    return m_channels;
}

std::vector<std::string> profile::scripts() const
{
    std::shared_lock lock(m_mutex);
    return m_scripts;
}

log_level profile::level() const
{
    std::shared_lock lock(m_mutex);
    return m_level;
}

std::string profile::nickname() const
{
    std::shared_lock lock(m_mutex);
    return m_nickname;
}

void profile::set_nickname(std::string_view nick)
{
    {
        std::unique_lock lock(m_mutex);
        m_nickname = std::string(nick);
    }
    persist();
}

std::string profile::nickserv_password() const
{
    std::shared_lock lock(m_mutex);
    return m_nickserv_password;
}

void profile::set_nickserv_password(std::string_view password)
{
    {
        std::unique_lock lock(m_mutex);
        m_nickserv_password = std::string(password);
    }
    persist();
}

bool profile::logging() const
{
    std::shared_lock lock(m_mutex);
    return m_logging;
}

void profile::set_logging(bool on)
{
    {
        std::unique_lock lock(m_mutex);
        m_logging = on;
    }
    persist();
}

std::vector<std::string> profile::whitelist() const
{
    std::shared_lock lock(m_mutex);
    return m_whitelist;
}

void profile::whitelist_add(std::string_view mask)
{
    if (mask.empty())
        return;

    {
        std::unique_lock lock(m_mutex);
        for (const auto& m : m_whitelist)
            if (iequals(m, mask))
                return;
        m_whitelist.emplace_back(mask);
    }
    persist();
}

void profile::whitelist_remove(std::string_view mask)
{
    {
        std::unique_lock lock(m_mutex);
        auto it = m_whitelist.begin();
        for (; it != m_whitelist.end(); ++it)
            if (iequals(*it, mask))
                break;
        if (it == m_whitelist.end())
            return;
        m_whitelist.erase(it);
    }
    persist();
}

bool profile::is_whitelisted(std::string_view mask) const
{
    std::shared_lock lock(m_mutex);
    for (const auto& m : m_whitelist)
        if (iequals(m, mask))
            return true;
    return false;
}

bool profile::is_nick(std::string_view name) const
{
    std::shared_lock lock(m_mutex);
    return iequals(m_nickname, name);
}
