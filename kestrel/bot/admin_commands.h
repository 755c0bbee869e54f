#pragma once
#include <functional>

class command_set;
class profile;

// Binds the bot's own commands on cmds:
//
//   help, <nickname>                 list the commands
//   nick <name> [password]           change nickname (restricted)
//   join <channel> [password] [key]  (restricted)
//   part <channel>                   (restricted)
//   authlist                         list administrators (restricted)
//   authorize <mask>, deauthorize <mask>  (restricted)
//   log [on|off]                     show or set event logging (restricted)
//   reload                           hand the connection to a new process (restricted)
//   version
//
// Changes go through prof and are persisted by it.
void bind_admin_commands(command_set& cmds, profile& prof, std::function<void()> reload);
