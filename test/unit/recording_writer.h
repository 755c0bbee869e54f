#pragma once
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "../../kestrel/irc/binding_list.h"
#include "../../kestrel/irc/response_writer.h"

// Captures written lines. fail_after = n makes every write after the
// first n fail.
class recording_writer : public response_writer
{
public:
    explicit recording_writer(binding_list* bindings = nullptr) : m_bindings(bindings) {}

    bool write(std::string_view data) override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_fail_after >= 0 && static_cast<long>(m_lines.size()) >= m_fail_after)
            return false;
        m_lines.emplace_back(data);
        return true;
    }

    protocol_binder* binder() override { return m_bindings; }

    void fail_after(long n) { m_fail_after = n; }

    std::vector<std::string> lines() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_lines;
    }

    size_t count() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_lines.size();
    }

private:
    mutable std::mutex m_mutex;
    std::vector<std::string> m_lines;
    long m_fail_after{-1};
    binding_list* m_bindings;
};
