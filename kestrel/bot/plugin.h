#pragma once
#include "../irc/event.h"

class profile;
class response_writer;

// Extension loaded by the bot. Every inbound event reaches every loaded
// plugin, whether or not a core command handled it.
class plugin
{
public:
    virtual ~plugin() = default;

    virtual const char* name() const = 0;

    // Failure is logged by the host; the plugin then receives no events.
    virtual bool load(profile& prof) = 0;
    virtual bool unload(profile& prof) = 0;

    // Called on a task thread, possibly concurrently for successive events.
    virtual void dispatch(response_writer& w, const inbound_event& ev) = 0;
};
