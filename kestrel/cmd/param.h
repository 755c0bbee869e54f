#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "patterns.h"

// Declared parameter of a command.
struct param_spec
{
    std::string name;       // lower-cased
    bool required{false};
    pattern_ptr pattern;    // never null once added to a command

    bool validate(std::string_view value) const;
};

// One validated argument. Conversions yield 0/false for values that do
// not parse; base prefixes ("0x", "0") are honored for integers.
struct param
{
    std::string value;

    const std::string& as_string() const { return value; }
    int64_t as_int() const;
    uint64_t as_uint() const;
    double as_float() const;

    // True for 1, t, true, y, yes, on (any case).
    bool as_bool() const;
};

class param_list
{
public:
    param_list() = default;

    void push_back(std::string value) { m_items.push_back(param{std::move(value)}); }

    size_t size() const { return m_items.size(); }
    bool empty() const { return m_items.empty(); }

    const param& operator[](size_t n) const { return m_items[n]; }

    const std::string& as_string(size_t n) const { return m_items[n].as_string(); }
    int64_t as_int(size_t n) const { return m_items[n].as_int(); }
    uint64_t as_uint(size_t n) const { return m_items[n].as_uint(); }
    double as_float(size_t n) const { return m_items[n].as_float(); }
    bool as_bool(size_t n) const { return m_items[n].as_bool(); }

    // All values separated by single spaces.
    std::string join() const;

    auto begin() const { return m_items.begin(); }
    auto end() const { return m_items.end(); }

private:
    std::vector<param> m_items;
};
