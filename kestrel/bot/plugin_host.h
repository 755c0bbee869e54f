#pragma once
#include <memory>
#include <vector>

#include "plugin.h"

class task_group;

// Owns the bot's plugins and fans events out to them.
class plugin_host
{
public:
    explicit plugin_host(task_group& tasks) : m_tasks(tasks) {}

    void add(std::unique_ptr<plugin> p);

    // Loads in registration order. Returns the number loaded.
    size_t load(profile& prof);

    // Unloads in reverse order. Only call once no task can still reach a
    // plugin.
    void unload(profile& prof);

    // One task per loaded plugin.
    void dispatch(response_writer& w, const inbound_event& ev);

    size_t size() const { return m_plugins.size(); }
    size_t loaded() const;

private:
    struct entry
    {
        std::unique_ptr<plugin> instance;
        bool loaded{false};
    };

    task_group& m_tasks;
    std::vector<entry> m_plugins;
};
