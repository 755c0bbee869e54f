#include "plugin_host.h"
#include "../shared/logging.h"
#include "../shared/task_group.h"

void plugin_host::add(std::unique_ptr<plugin> p)
{
    if (p)
        m_plugins.push_back(entry{std::move(p), false});
}

size_t plugin_host::load(profile& prof)
{
    size_t count = 0;
    for (auto& e : m_plugins)
    {
        if (e.loaded)
            continue;

        LOG_INFOF("[plugins] loading %s", e.instance->name());
        e.loaded = e.instance->load(prof);
        if (e.loaded)
            ++count;
        else
            LOG_ERRORF("[plugins] %s failed to load", e.instance->name());
    }
    return count;
}

void plugin_host::unload(profile& prof)
{
    for (auto it = m_plugins.rbegin(); it != m_plugins.rend(); ++it)
    {
        if (!it->loaded)
            continue;

        LOG_INFOF("[plugins] unloading %s", it->instance->name());
        if (!it->instance->unload(prof))
            LOG_WARNF("[plugins] %s did not unload cleanly", it->instance->name());
        it->loaded = false;
    }
}

void plugin_host::dispatch(response_writer& w, const inbound_event& ev)
{
    for (auto& e : m_plugins)
    {
        if (!e.loaded)
            continue;

        plugin* p = e.instance.get();
        m_tasks.spawn([p, &w, ev]() {
            run_guarded(ev.to_string(), [&] { p->dispatch(w, ev); });
        });
    }
}

size_t plugin_host::loaded() const
{
    size_t n = 0;
    for (const auto& e : m_plugins)
        if (e.loaded)
            ++n;
    return n;
}
