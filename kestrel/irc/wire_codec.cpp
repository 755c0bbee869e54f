#include "wire_codec.h"

namespace irc {

std::vector<std::string_view> split_fields(std::string_view line)
{
    std::vector<std::string_view> out;
    size_t i = 0;
    while (i < line.size())
    {
        while (i < line.size() && (line[i] == ' ' || line[i] == '\t' || line[i] == '\r' || line[i] == '\n'))
            ++i;
        if (i >= line.size())
            break;

        size_t start = i;
        while (i < line.size() && line[i] != ' ' && line[i] != '\t' && line[i] != '\r' && line[i] != '\n')
            ++i;
        out.push_back(line.substr(start, i - start));
    }
    return out;
}

static std::string_view strip_colon(std::string_view sv)
{
    if (!sv.empty() && sv[0] == ':')
        sv.remove_prefix(1);
    return sv;
}

// Everything after the command word, minus the ':' marker.
static std::string_view server_notice_payload(std::string_view line, std::string_view verb)
{
    std::string_view rest = line.substr(verb.size());
    while (!rest.empty() && (rest[0] == ' ' || rest[0] == '\t'))
        rest.remove_prefix(1);
    return strip_colon(rest);
}

std::optional<inbound_event> decode(std::string_view line)
{
    auto fields = split_fields(line);
    if (fields.empty())
        return std::nullopt;

    if (line.find("QUIT") != std::string_view::npos)
        return std::nullopt;

    // PING and ERROR carry no sender prefix
    for (std::string_view verb : {std::string_view("PING"), std::string_view("ERROR")})
    {
        if (line.starts_with(verb))
        {
            inbound_event ev;
            ev.type = std::string(verb);
            ev.payload = std::string(server_notice_payload(line, verb));
            return ev;
        }
    }

    if (fields.size() < 3)
        return std::nullopt;

    for (size_t i = 0; i < 4 && i < fields.size(); ++i)
        fields[i] = strip_colon(fields[i]);

    inbound_event ev;

    std::string_view prefix = fields[0];
    auto bang = prefix.find('!');
    if (bang != std::string_view::npos)
    {
        ev.sender_nick = std::string(prefix.substr(0, bang));
        ev.sender_mask = std::string(prefix.substr(bang + 1));
    }
    else
    {
        ev.sender_nick = std::string(prefix);
        ev.sender_mask = ev.sender_nick;
    }

    ev.type = std::string(fields[1]);
    ev.target = std::string(fields[2]);

    for (size_t i = 3; i < fields.size(); ++i)
    {
        if (i > 3)
            ev.payload += ' ';
        ev.payload.append(fields[i].data(), fields[i].size());
    }

    return ev;
}

std::string format_line(std::string_view body)
{
    if (body.find_first_of(std::string_view("\r\n\0", 3)) != std::string_view::npos)
        return {};

    std::string data;
    data.reserve(body.size() + 2);
    data.append(body.data(), body.size());
    data.append("\r\n", 2);

    if (data.size() <= 2)
        return {};

    if (data.size() >= MAX_LINE)
    {
        data.resize(MAX_LINE);
        data[MAX_LINE - 2] = '\r';
        data[MAX_LINE - 1] = '\n';
    }

    return data;
}

std::string encode(std::string_view verb, const std::vector<std::string_view>& params)
{
    std::string body(verb);
    for (size_t i = 0; i < params.size(); ++i)
    {
        std::string_view p = params[i];
        body += ' ';
        bool last = (i + 1 == params.size());
        if (last && (p.empty() || p.find(' ') != std::string_view::npos || p[0] == ':'))
            body += ':';
        body.append(p.data(), p.size());
    }
    return format_line(body);
}

std::string encode(std::string_view verb, std::initializer_list<std::string_view> params)
{
    return encode(verb, std::vector<std::string_view>(params));
}

}
