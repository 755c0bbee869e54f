#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include "recording_writer.h"
#include "../../kestrel/bot/lua_plugin.h"
#include "../../kestrel/bot/profile.h"
#include "../../kestrel/irc/proto.h"
#include "../../kestrel/shared/task_group.h"

#include <atomic>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace {

constexpr const char* GREETER = R"lua(
early = privmsg("#nowhere", "too soon")

bind("greet", false, function(ev, args)
    privmsg(ev.target, "hello " .. (args[1] or ev.nick))
end, { { name = "who", required = false, pattern = "any" } })

bind("add", false, function(ev, args)
    privmsg(ev.target, tostring(tonumber(args[1]) + tonumber(args[2])))
end, { { name = "a", required = true, pattern = "int" },
       { name = "b", required = true, pattern = "int" } })

bind("boom", false, function(ev, args)
    error("kaboom")
end)

bind("restart", true, function(ev, args)
    reload()
end)

bind("gone", false, function(ev, args) end)
unbind("gone")

function on_event(ev)
    if ev.type == "JOIN" then
        notice(ev.nick, "welcome to " .. ev.target)
    elseif ev.type == "TOPIC" then
        privmsg(ev.target, on and "bindings" or "no bindings")
    end
end

function on_unload()
    log("unloading")
end
)lua";

constexpr const char* WATCHER = R"lua(
watch = on("PRIVMSG", function(ev)
    raw("X " .. ev.payload)
end)

bind("unwatch", false, function(ev, args)
    off("PRIVMSG", watch)
end)
)lua";

struct script_file
{
    fs::path path;

    explicit script_file(const char* body)
    {
        std::string tmpl = (fs::temp_directory_path() / "kestrel-lua-XXXXXX").string();
        REQUIRE(mkdtemp(tmpl.data()) != nullptr);
        path = fs::path(tmpl) / "plugin.lua";
        std::ofstream(path) << body;
    }

    ~script_file()
    {
        std::error_code ec;
        fs::remove_all(path.parent_path(), ec);
    }
};

inbound_event message(std::string payload, std::string mask = "~steve@host")
{
    inbound_event ev;
    ev.sender_nick = "steve";
    ev.sender_mask = std::move(mask);
    ev.type = "PRIVMSG";
    ev.target = "#chan";
    ev.payload = std::move(payload);
    return ev;
}

std::string privmsg_line(std::string_view target, std::string_view text)
{
    recording_writer w;
    proto::privmsg(w, target, text);
    return w.lines().at(0);
}

}

TEST_CASE("loading")
{
    profile prof("/tmp/none");
    task_group tasks;

    SUBCASE("missing file")
    {
        lua_plugin p("/nonexistent/plugin.lua", tasks, nullptr, nullptr);
        CHECK_FALSE(p.load(prof));
    }

    SUBCASE("syntax error")
    {
        script_file f("bind(");
        lua_plugin p(f.path.string(), tasks, nullptr, nullptr);
        CHECK_FALSE(p.load(prof));
    }

    SUBCASE("commands are registered")
    {
        script_file f(GREETER);
        lua_plugin p(f.path.string(), tasks, nullptr, nullptr);
        REQUIRE(p.load(prof));
        REQUIRE(p.commands() != nullptr);
        CHECK(p.commands()->size() == 4);
        CHECK(p.commands()->contains("greet"));
        CHECK_FALSE(p.commands()->contains("gone"));
        CHECK(p.unload(prof));
    }
}

TEST_CASE("script commands")
{
    profile prof("/tmp/none");
    REQUIRE(prof.load_string("profile = { address = 'h:1', nickname = 'kestrel', whitelist = { '~admin@host' } }"));

    task_group tasks;
    std::atomic<int> reloads{0};
    script_file f(GREETER);
    lua_plugin p(f.path.string(), tasks, nullptr, [&reloads] { ++reloads; });
    REQUIRE(p.load(prof));

    recording_writer w;
    auto run = [&](const inbound_event& ev) {
        p.dispatch(w, ev);
        tasks.wait();
    };

    SUBCASE("optional argument")
    {
        run(message("!greet"));
        run(message("!greet bob"));
        auto lines = w.lines();
        REQUIRE(lines.size() == 2);
        CHECK(lines[0] == privmsg_line("#chan", "hello steve"));
        CHECK(lines[1] == privmsg_line("#chan", "hello bob"));
    }

    SUBCASE("validated arguments")
    {
        run(message("!add 2 3"));
        REQUIRE(w.count() == 1);
        CHECK(w.lines()[0] == privmsg_line("#chan", "5"));

        // Rejection goes to the sender, the handler never runs
        run(message("!add 2 three"));
        REQUIRE(w.count() == 2);
        CHECK(w.lines()[1].rfind("PRIVMSG steve ", 0) == 0);
    }

    SUBCASE("script errors are contained")
    {
        run(message("!boom"));
        CHECK(w.count() == 0);

        run(message("!greet"));
        CHECK(w.count() == 1);
    }

    SUBCASE("restricted command")
    {
        run(message("!restart"));
        CHECK(reloads == 0);

        run(message("!restart", "~admin@host"));
        CHECK(reloads == 1);
    }

    SUBCASE("on_event")
    {
        inbound_event join;
        join.sender_nick = "amy";
        join.sender_mask = "~amy@host";
        join.type = "JOIN";
        join.target = "#chan";
        run(join);

        inbound_event topic = join;
        topic.type = "TOPIC";
        run(topic);

        auto lines = w.lines();
        REQUIRE(lines.size() == 2);

        recording_writer expected;
        proto::notice(expected, "amy", "welcome to #chan");
        CHECK(lines[0] == expected.lines().at(0));
        CHECK(lines[1] == privmsg_line("#chan", "no bindings"));
    }

    CHECK(p.unload(prof));
}

TEST_CASE("protocol bindings from scripts")
{
    profile prof("/tmp/none");
    task_group tasks;
    binding_list bindings;
    recording_writer w(&bindings);

    script_file f(WATCHER);
    auto p = std::make_unique<lua_plugin>(f.path.string(), tasks, &bindings, nullptr);
    REQUIRE(p->load(prof));

    {
        auto handlers = bindings.find("PRIVMSG");
        REQUIRE(handlers.size() == 1);
        (*handlers[0])(w, message("hi there"));
        REQUIRE(w.count() == 1);
        CHECK(w.lines()[0] == "X hi there\r\n");
    }

    SUBCASE("off removes the binding")
    {
        p->dispatch(w, message("!unwatch"));
        tasks.wait();
        CHECK(bindings.find("PRIVMSG").empty());
    }

    SUBCASE("unload removes the binding")
    {
        CHECK(p->unload(prof));
        CHECK(bindings.find("PRIVMSG").empty());
    }

    SUBCASE("destruction removes the binding")
    {
        p.reset();
        CHECK(bindings.find("PRIVMSG").empty());
    }
}

TEST_CASE("script handlers are released under the plugin lock")
{
    profile prof("/tmp/none");
    task_group tasks;
    binding_list bindings;
    recording_writer w(&bindings);

    script_file f(R"lua(
count = 0
on("PRIVMSG", function(ev) count = count + 1 end)
function on_event(ev)
    for i = 1, 20000 do count = count + 0 end
end
)lua");
    lua_plugin p(f.path.string(), tasks, &bindings, nullptr);
    REQUIRE(p.load(prof));

    // Readers look handlers up and drop them on other threads while the
    // script is busy in on_event
    std::atomic<bool> stop{false};
    std::thread busy([&] {
        while (!stop)
            p.dispatch(w, message("hi"));
    });

    std::vector<std::thread> readers;
    for (int i = 0; i < 4; ++i)
    {
        readers.emplace_back([&] {
            for (int n = 0; n < 200; ++n)
            {
                auto handlers = bindings.find("PRIVMSG");
                std::thread([handlers = std::move(handlers), &w] {
                    for (const auto& fn : handlers)
                        (*fn)(w, message("hi"));
                }).join();
            }
        });
    }

    for (auto& t : readers)
        t.join();
    stop = true;
    busy.join();
    tasks.wait();

    CHECK(p.unload(prof));
    CHECK(bindings.find("PRIVMSG").empty());
}

TEST_CASE("script arguments and event fields")
{
    profile prof("/tmp/none");
    task_group tasks;
    script_file f(R"lua(
bind("scale", false, function(ev, args)
    privmsg(ev.target, string.format("%d %d %.1f %s %s",
        args[1] + 1, args[2] * 3, args[3] * 2, tostring(args[4]), args[5]))
end, { { name = "a", required = true, pattern = "int" },
       { name = "b", required = true, pattern = "uint" },
       { name = "c", required = true, pattern = "float" },
       { name = "d", required = true, pattern = "bool" },
       "e" })

function on_event(ev)
    if ev.type == "PRIVMSG" and ev.payload:sub(1, 1) ~= "!" then
        privmsg(ev.nick, table.concat(ev.words, "|") .. " " .. tostring(ev.channel) .. " " .. tostring(ev.privmsg))
        mode(ev.target, "+v", ev.nick)
    end
end
)lua");
    lua_plugin p(f.path.string(), tasks, nullptr, nullptr);
    REQUIRE(p.load(prof));

    recording_writer w;

    SUBCASE("typed parameters")
    {
        p.dispatch(w, message("!scale 16 7 2.5 yes word"));
        tasks.wait();
        REQUIRE(w.count() == 1);
        CHECK(w.lines()[0] == privmsg_line("#chan", "17 21 5.0 true word"));
    }

    SUBCASE("event helpers and mode")
    {
        p.dispatch(w, message("a  b c"));
        tasks.wait();

        recording_writer expected;
        proto::privmsg(expected, "steve", "a|b|c true true");
        proto::mode(expected, "#chan", "+v", "steve");
        CHECK(w.lines() == expected.lines());
    }

    CHECK(p.unload(prof));
}
