#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "event.h"

class response_writer;

using request_fn = std::function<void(response_writer&, const inbound_event&)>;

// Handlers are shared, never copied: a handler may own state (a script
// function) that must only be touched under its owner's lock.
using request_handler = std::shared_ptr<const request_fn>;

// Capability: lets plugins subscribe to raw message types.
class protocol_binder
{
public:
    virtual ~protocol_binder() = default;

    // "*" binds a catch-all handler. Returns an id for unbind().
    virtual uint64_t bind(std::string_view type, request_fn fn) = 0;
    virtual void unbind(std::string_view type, uint64_t id) = 0;
    virtual void clear() = 0;
};

// Message type -> handlers, kept sorted by type for binary search.
class binding_list : public protocol_binder
{
public:
    uint64_t bind(std::string_view type, request_fn fn) override;
    void unbind(std::string_view type, uint64_t id) override;
    void clear() override;

    // Handlers bound to type, followed by the catch-all handlers.
    std::vector<request_handler> find(std::string_view type) const;

    size_t size() const;

private:
    struct handler_entry
    {
        uint64_t id;
        request_handler fn;
    };

    struct binding
    {
        std::string type;
        std::vector<handler_entry> handlers;
    };

    // Index of type in m_data, or -1. Caller holds m_mutex.
    long index(std::string_view type) const;

    mutable std::shared_mutex m_mutex;
    std::vector<binding> m_data;
    uint64_t m_next_id{1};
};
