#include "proto.h"
#include "wire_codec.h"

namespace proto {

static constexpr std::string_view NICKSERV = "nickserv";
static constexpr std::string_view CHANSERV = "chanserv";

static bool write_line(response_writer& w, const std::string& line)
{
    if (line.empty())
        return true;
    return w.write(line);
}

bool raw(response_writer& w, std::string_view line)
{
    return write_line(w, irc::format_line(line));
}

bool pass(response_writer& w, std::string_view password)
{
    if (password.empty())
        return true;
    return write_line(w, irc::encode("PASS", {password}));
}

bool user(response_writer& w, std::string_view username, std::string_view mode, std::string_view realname)
{
    return write_line(w, irc::encode("USER", {username, mode, "*", realname}));
}

bool nick(response_writer& w, std::string_view nickname, std::string_view password)
{
    if (!write_line(w, irc::encode("NICK", {nickname})))
        return false;

    if (password.empty())
        return true;

    std::string identify = "IDENTIFY ";
    identify += password;
    return privmsg(w, NICKSERV, identify);
}

bool join(response_writer& w, const channel& ch)
{
    // Lets us into invite-only channels we are registered for
    if (!write_line(w, irc::encode(CHANSERV, {"INVITE", ch.name})))
        return false;

    bool ok = ch.key.empty()
        ? write_line(w, irc::encode("JOIN", {ch.name}))
        : write_line(w, irc::encode("JOIN", {ch.name, ch.key}));
    if (!ok)
        return false;

    if (ch.password.empty())
        return true;

    std::string identify = "IDENTIFY ";
    identify += ch.name;
    identify += ' ';
    identify += ch.password;
    return privmsg(w, CHANSERV, identify);
}

bool part(response_writer& w, const channel& ch)
{
    return write_line(w, irc::encode("PART", {ch.name, ""}));
}

bool privmsg(response_writer& w, std::string_view target, std::string_view text)
{
    return write_line(w, irc::encode("PRIVMSG", {target, text}));
}

bool notice(response_writer& w, std::string_view target, std::string_view text)
{
    return write_line(w, irc::encode("NOTICE", {target, text}));
}

bool pong(response_writer& w, std::string_view payload)
{
    return write_line(w, irc::encode("PONG", {payload}));
}

bool mode(response_writer& w, std::string_view target, std::string_view flags, std::string_view arg)
{
    if (arg.empty())
        return write_line(w, irc::encode("MODE", {target, flags}));
    return write_line(w, irc::encode("MODE", {target, flags, arg}));
}

bool oper(response_writer& w, std::string_view name, std::string_view password)
{
    return write_line(w, irc::encode("OPER", {name, password}));
}

bool recover(response_writer& w, std::string_view nickname, std::string_view password)
{
    return write_line(w, irc::encode("NS", {"RECOVER", nickname, password}));
}

}

namespace text {

static std::string wrap(char code, std::string_view s)
{
    std::string out;
    out.reserve(s.size() + 2);
    out += code;
    out.append(s.data(), s.size());
    out += code;
    return out;
}

std::string bold(std::string_view s) { return wrap('\x02', s); }

}
