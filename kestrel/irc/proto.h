#pragma once
#include <string>
#include <string_view>

#include "response_writer.h"

// A channel to join or leave.
struct channel
{
    std::string name;
    std::string key;        // channel key (+k)
    std::string password;   // chanserv password
};

// Outbound protocol commands. Each call formats through irc::encode and
// writes to w; false means a write failed. Multi-line commands stop at the
// first failed write.

namespace proto {

// Sends a preformatted line. Empty lines are dropped without writing.
bool raw(response_writer& w, std::string_view line);

// Connection password; skipped when empty. Must precede NICK/USER.
bool pass(response_writer& w, std::string_view password);
bool user(response_writer& w, std::string_view username, std::string_view mode, std::string_view realname);

// NICK, followed by a nickserv IDENTIFY when a password is given.
bool nick(response_writer& w, std::string_view nickname, std::string_view password = {});

// chanserv INVITE, JOIN [key], then a separate chanserv IDENTIFY when the
// channel has a password. Each line is only sent if the one before it was.
bool join(response_writer& w, const channel& ch);
bool part(response_writer& w, const channel& ch);

bool privmsg(response_writer& w, std::string_view target, std::string_view text);
bool notice(response_writer& w, std::string_view target, std::string_view text);
bool pong(response_writer& w, std::string_view payload);
bool mode(response_writer& w, std::string_view target, std::string_view flags, std::string_view arg = {});
bool oper(response_writer& w, std::string_view name, std::string_view password);

// Regains a nickname held by a ghost session (nickserv RECOVER).
bool recover(response_writer& w, std::string_view nickname, std::string_view password);

}

// mIRC text decorations.

namespace text {

std::string bold(std::string_view s);

}
