#pragma once
#include <string>
#include <string_view>
#include <vector>

// One decoded inbound protocol line.
struct inbound_event
{
    std::string sender_nick;
    std::string sender_mask;
    std::string type;       // "PRIVMSG", "PING", "001", ...
    std::string target;     // channel, or our own nick until the session rewrites it
    std::string payload;

    // True if the target is a channel rather than a user or service.
    bool from_channel() const
    {
        if (target.empty())
            return false;
        char c = target[0];
        return c == '#' || c == '&' || c == '!' || c == '+';
    }

    bool is_privmsg() const { return type == "PRIVMSG"; }

    // Payload words, skipping the first n. Empty if n is out of range.
    std::vector<std::string> fields(size_t n) const;

    std::string to_string() const;
};
