#pragma once
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "../irc/proto.h"
#include "../shared/logging.h"

namespace sol { class state; }

// Bot configuration, read from profile.lua in the profile directory:
//
//   profile = {
//       address = "irc.example.net:6697",
//       nickname = "kestrel",
//       channels = { { name = "#home", key = "", password = "" } },
//       whitelist = { "~admin@example.net" },
//       scripts = { "scripts/hello.lua" },
//   }
//
// All accessors are safe to call from any thread. Setters persist the
// profile when it was loaded from a file.
class profile
{
public:
    static constexpr const char* FILE_NAME = "profile.lua";

    // root is the profile directory.
    explicit profile(std::string root);

    const std::string& root() const { return m_root; }

    // <root>/profile.lua, or $KESTREL_PROFILE when set.
    std::string path() const;

    bool load();
    bool load_string(std::string_view source);
    bool save() const;

    // Argv tail for a handed-off child.
    std::vector<std::string> fork_args() const;

    std::string address() const;
    std::string tls_cert() const;
    std::string tls_key() const;
    std::string ca_pem() const;
    std::string connection_password() const;
    std::string oper_password() const;
    std::string command_prefix() const;
    std::vector<channel> channels() const;
    std::vector<std::string> scripts() const;
    log_level level() const;

    std::string nickname() const;
    void set_nickname(std::string_view nick);

    std::string nickserv_password() const;
    void set_nickserv_password(std::string_view password);

    bool logging() const;
    void set_logging(bool on);

    std::vector<std::string> whitelist() const;
    void whitelist_add(std::string_view mask);
    void whitelist_remove(std::string_view mask);

    // Hostmask comparison ignores case.
    bool is_whitelisted(std::string_view mask) const;

    // True if name is our current nickname (any case).
    bool is_nick(std::string_view name) const;

private:
    bool apply(sol::state& lua, const std::string& origin);
    std::string serialize() const;
    void persist() const;

    const std::string m_root;
    bool m_loaded_from_file{false};

    mutable std::shared_mutex m_mutex;

    std::string m_address{"irc.example.net:6667"};
    std::string m_tls_cert;
    std::string m_tls_key;
    std::string m_ca_pem;
    std::string m_nickname{"kestrel"};
    std::string m_nickserv_password;
    std::string m_oper_password;
    std::string m_connection_password;
    std::string m_command_prefix{"!"};
    std::vector<channel> m_channels{ channel{"#kestrel", "", ""} };
    std::vector<std::string> m_whitelist{ "~user@example.net" };
    std::vector<std::string> m_scripts;
    bool m_logging{false};
    log_level m_level{log_info};
};

// "debug", "info", "warn" or "error".
bool parse_log_level(std::string_view str, log_level& level);
const char* log_level_name(log_level level);
