#include "binding_list.h"

#include <algorithm>
#include <mutex>

long binding_list::index(std::string_view type) const
{
    auto it = std::lower_bound(m_data.begin(), m_data.end(), type,
        [](const binding& b, std::string_view t) { return b.type < t; });
    if (it == m_data.end() || it->type != type)
        return -1;
    return static_cast<long>(it - m_data.begin());
}

uint64_t binding_list::bind(std::string_view type, request_fn fn)
{
    auto handler = std::make_shared<const request_fn>(std::move(fn));

    std::unique_lock lock(m_mutex);

    uint64_t id = m_next_id++;
    long idx = index(type);
    if (idx >= 0)
    {
        m_data[idx].handlers.push_back({id, std::move(handler)});
        return id;
    }

    auto it = std::lower_bound(m_data.begin(), m_data.end(), type,
        [](const binding& b, std::string_view t) { return b.type < t; });
    binding b;
    b.type = std::string(type);
    b.handlers.push_back({id, std::move(handler)});
    m_data.insert(it, std::move(b));
    return id;
}

void binding_list::unbind(std::string_view type, uint64_t id)
{
    // Released after the lock: a handler's destructor may take its owner's lock
    std::vector<handler_entry> dropped;
    std::unique_lock lock(m_mutex);

    long idx = index(type);
    if (idx < 0)
        return;

    auto& handlers = m_data[idx].handlers;
    auto it = std::find_if(handlers.begin(), handlers.end(),
        [id](const handler_entry& e) { return e.id == id; });
    if (it == handlers.end())
        return;

    dropped.push_back(std::move(*it));
    handlers.erase(it);

    if (handlers.empty())
        m_data.erase(m_data.begin() + idx);
}

void binding_list::clear()
{
    std::vector<binding> dropped;
    std::unique_lock lock(m_mutex);
    dropped.swap(m_data);
}

std::vector<request_handler> binding_list::find(std::string_view type) const
{
    std::shared_lock lock(m_mutex);

    std::vector<request_handler> out;
    long idx = index(type);
    if (idx >= 0)
        for (const auto& e : m_data[idx].handlers)
            out.push_back(e.fn);

    if (type != "*")
    {
        long any = index("*");
        if (any >= 0)
            for (const auto& e : m_data[any].handlers)
                out.push_back(e.fn);
    }

    return out;
}

size_t binding_list::size() const
{
    std::shared_lock lock(m_mutex);
    return m_data.size();
}
