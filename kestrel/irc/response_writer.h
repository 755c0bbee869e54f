#pragma once
#include <string_view>

class protocol_binder;

// Sink for outbound protocol lines. Implementations must accept calls from
// several threads; each call carries exactly one complete line.
class response_writer
{
public:
    virtual ~response_writer() = default;

    // Writes the whole buffer or fails.
    virtual bool write(std::string_view data) = 0;

    // Non-null when this writer also accepts protocol bindings.
    virtual protocol_binder* binder() { return nullptr; }
};
