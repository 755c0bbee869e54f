#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include "recording_writer.h"
#include "../../kestrel/irc/binding_list.h"

TEST_CASE("binding_list lookup")
{
    binding_list bindings;
    recording_writer w;
    inbound_event ev;
    ev.type = "PRIVMSG";

    std::vector<std::string> calls;
    auto record = [&calls](const char* tag) {
        return [&calls, tag](response_writer&, const inbound_event&) { calls.push_back(tag); };
    };

    SUBCASE("type handlers run before catch-all handlers")
    {
        bindings.bind("*", record("any"));
        bindings.bind("PRIVMSG", record("msg1"));
        bindings.bind("PRIVMSG", record("msg2"));
        bindings.bind("JOIN", record("join"));

        for (auto& fn : bindings.find("PRIVMSG"))
            (*fn)(w, ev);

        REQUIRE(calls.size() == 3);
        CHECK(calls[0] == "msg1");
        CHECK(calls[1] == "msg2");
        CHECK(calls[2] == "any");
        CHECK(bindings.size() == 3);
    }

    SUBCASE("unknown type only sees catch-alls")
    {
        bindings.bind("JOIN", record("join"));
        CHECK(bindings.find("PART").empty());

        bindings.bind("*", record("any"));
        CHECK(bindings.find("PART").size() == 1);
        CHECK(bindings.find("*").size() == 1);
    }

    SUBCASE("unbind removes one handler and drops empty types")
    {
        uint64_t a = bindings.bind("001", record("a"));
        uint64_t b = bindings.bind("001", record("b"));
        CHECK(a != b);

        bindings.unbind("001", a);
        for (auto& fn : bindings.find("001"))
            (*fn)(w, ev);
        REQUIRE(calls.size() == 1);
        CHECK(calls[0] == "b");

        bindings.unbind("001", b);
        CHECK(bindings.size() == 0);

        // Unknown ids and types are ignored
        bindings.unbind("001", 999);
        bindings.unbind("NOPE", 1);
    }

    SUBCASE("clear")
    {
        bindings.bind("A", record("a"));
        bindings.bind("B", record("b"));
        bindings.clear();
        CHECK(bindings.size() == 0);
        CHECK(bindings.find("A").empty());
    }
}

TEST_CASE("lookups share handlers instead of copying them")
{
    struct counted
    {
        explicit counted(int& copies) : m_copies(copies) {}
        counted(const counted& other) : m_copies(other.m_copies) { ++m_copies; }
        void operator()(response_writer&, const inbound_event&) const {}

        int& m_copies;
    };

    binding_list bindings;
    int copies = 0;
    uint64_t id = bindings.bind("PRIVMSG", counted(copies));
    int after_bind = copies;

    auto first = bindings.find("PRIVMSG");
    auto second = bindings.find("PRIVMSG");
    REQUIRE(first.size() == 1);
    REQUIRE(second.size() == 1);
    CHECK(first[0].get() == second[0].get());
    CHECK(copies == after_bind);

    // A handler found before unbind stays usable by whoever holds it
    bindings.unbind("PRIVMSG", id);
    CHECK(bindings.find("PRIVMSG").empty());
    CHECK(first[0].use_count() == 2);
}

TEST_CASE("writers expose bindings only when they have them")
{
    binding_list bindings;
    recording_writer plain;
    recording_writer capable(&bindings);

    CHECK(plain.binder() == nullptr);
    CHECK(capable.binder() == &bindings);
}
