#include "event.h"

std::vector<std::string> inbound_event::fields(size_t n) const
{
    std::vector<std::string> words;
    size_t i = 0;
    while (i < payload.size())
    {
        while (i < payload.size() && (payload[i] == ' ' || payload[i] == '\t'))
            ++i;
        if (i >= payload.size())
            break;

        size_t start = i;
        while (i < payload.size() && payload[i] != ' ' && payload[i] != '\t')
            ++i;
        words.emplace_back(payload, start, i - start);
    }

    if (n >= words.size())
        return {};
    words.erase(words.begin(), words.begin() + static_cast<std::ptrdiff_t>(n));
    return words;
}

std::string inbound_event::to_string() const
{
    std::string out;
    out.reserve(sender_mask.size() + sender_nick.size() + type.size()
                + target.size() + payload.size() + 4);
    out += sender_mask;
    out += ' ';
    out += sender_nick;
    out += ' ';
    out += type;
    out += ' ';
    out += target;
    out += ' ';
    out += payload;
    return out;
}
