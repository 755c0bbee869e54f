#include "param.h"
#include "../shared/string_hash.h"

#include <cerrno>
#include <cstdlib>
#include <regex>

bool param_spec::validate(std::string_view value) const
{
    if (!pattern)
        return true;
    return std::regex_match(value.begin(), value.end(), *pattern);
}

int64_t param::as_int() const
{
    if (value.empty())
        return 0;

    char* end = nullptr;
    errno = 0;
    long long n = std::strtoll(value.c_str(), &end, 0);
    if (errno != 0 || *end != '\0')
        return 0;
    return static_cast<int64_t>(n);
}

uint64_t param::as_uint() const
{
    // strtoull silently wraps negative input
    if (value.empty() || value[0] == '-')
        return 0;

    char* end = nullptr;
    errno = 0;
    unsigned long long n = std::strtoull(value.c_str(), &end, 0);
    if (errno != 0 || *end != '\0')
        return 0;
    return static_cast<uint64_t>(n);
}

double param::as_float() const
{
    if (value.empty())
        return 0.0;

    char* end = nullptr;
    errno = 0;
    double n = std::strtod(value.c_str(), &end);
    if (errno != 0 || *end != '\0')
        return 0.0;
    return n;
}

bool param::as_bool() const
{
    switch (fnv1a_lower(value))
    {
        case fnv1a("1"):
        case fnv1a("t"):
        case fnv1a("true"):
        case fnv1a("y"):
        case fnv1a("yes"):
        case fnv1a("on"):
            return true;
        default:
            return false;
    }
}

std::string param_list::join() const
{
    std::string out;
    for (size_t i = 0; i < m_items.size(); ++i)
    {
        if (i > 0)
            out += ' ';
        out += m_items[i].value;
    }
    return out;
}
