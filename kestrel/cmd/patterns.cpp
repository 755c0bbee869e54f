#include "patterns.h"
#include "../shared/logging.h"
#include "../shared/string_hash.h"

#include <string>

namespace patterns {

static pattern_ptr compile(const char* expr)
{
    return std::make_shared<const std::regex>(expr, std::regex::ECMAScript | std::regex::optimize);
}

pattern_ptr any()
{
    static const pattern_ptr p = compile(R"(^.*$)");
    return p;
}

pattern_ptr integer()
{
    static const pattern_ptr p = compile(R"(^[+-]?\d+$)");
    return p;
}

pattern_ptr uinteger()
{
    static const pattern_ptr p = compile(R"(^[+]?\d+$)");
    return p;
}

pattern_ptr floating()
{
    static const pattern_ptr p = compile(R"(^[+-]?\d+(\.\d+([eE][+-]?\d+)?)?$)");
    return p;
}

pattern_ptr boolean()
{
    static const pattern_ptr p = compile(R"(^(1|0|t(rue)?|f(alse)?|y(es)?|no?|on|off)$)");
    return p;
}

pattern_ptr channel()
{
    static const pattern_ptr p = compile(R"(^[#&+!][^ ,:]{1,50}$)");
    return p;
}

pattern_ptr mode()
{
    static const pattern_ptr p = compile(R"(^[+-][obveI]$)");
    return p;
}

pattern_ptr url()
{
    static const pattern_ptr p = compile(R"(^https?://[a-zA-Z0-9.-]+\.[a-zA-Z]+(:[0-9]+)?(/\S*)?$)");
    return p;
}

pattern_ptr lookup(std::string_view spec)
{
    switch (fnv1a_lower(spec))
    {
        case fnv1a(""):
        case fnv1a("any"):     return any();
        case fnv1a("int"):     return integer();
        case fnv1a("uint"):    return uinteger();
        case fnv1a("float"):   return floating();
        case fnv1a("bool"):    return boolean();
        case fnv1a("channel"): return channel();
        case fnv1a("mode"):    return mode();
        case fnv1a("url"):     return url();
        default: break;
    }

    try
    {
        return std::make_shared<const std::regex>(std::string(spec), std::regex::ECMAScript);
    }
    catch (const std::regex_error& e)
    {
        LOG_WARNF("[cmd] invalid parameter pattern '%.*s': %s",
                  static_cast<int>(spec.size()), spec.data(), e.what());
        return nullptr;
    }
}

}
