#pragma once
#include <cstdint>
#include <string>
#include <string_view>

// ASCII only: nicknames, hostmasks and command names are compared without
// locale rules.
constexpr char ascii_lower(char c)
{
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + ('a' - 'A')) : c;
}

// FNV-1a, usable in case labels: switch (fnv1a(s)) { case fnv1a("PING"): ... }
constexpr uint32_t fnv1a(std::string_view sv, bool fold_case = false)
{
    uint32_t hash = 2166136261u;
    for (char c : sv)
        hash = (hash ^ static_cast<uint8_t>(fold_case ? ascii_lower(c) : c)) * 16777619u;
    return hash;
}

// Same value as fnv1a() of the lower-cased string.
constexpr uint32_t fnv1a_lower(std::string_view sv)
{
    return fnv1a(sv, true);
}

constexpr bool iequals(std::string_view a, std::string_view b)
{
    if (a.size() != b.size())
        return false;
    for (size_t i = 0; i < a.size(); ++i)
        if (ascii_lower(a[i]) != ascii_lower(b[i]))
            return false;
    return true;
}

inline std::string to_lower(std::string_view s)
{
    std::string out(s);
    for (auto& c : out)
        c = ascii_lower(c);
    return out;
}
