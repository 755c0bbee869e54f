#pragma once
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "param.h"
#include "../irc/event.h"

class response_writer;

using command_fn = std::function<void(response_writer&, const inbound_event&, const param_list&)>;

// A named, user-callable command.
struct command
{
    std::string name;       // lower-cased, unique within a command_set
    bool restricted{false}; // whitelisted senders only
    command_fn handler;
    std::vector<param_spec> params;

    size_t required_count() const
    {
        size_t n = 0;
        for (const auto& p : params)
            if (p.required)
                ++n;
        return n;
    }
};
