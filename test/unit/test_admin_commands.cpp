#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include "recording_writer.h"
#include "../../kestrel/bot/admin_commands.h"
#include "../../kestrel/bot/profile.h"
#include "../../kestrel/cmd/command_set.h"
#include "../../kestrel/irc/proto.h"
#include "../../kestrel/shared/task_group.h"
#include "../../kestrel/version.h"

#include <atomic>
#include <memory>
#include <string>

namespace {

inbound_event message(std::string payload, std::string mask = "~admin@host")
{
    inbound_event ev;
    ev.sender_nick = "steve";
    ev.sender_mask = std::move(mask);
    ev.type = "PRIVMSG";
    ev.target = "#chan";
    ev.payload = std::move(payload);
    return ev;
}

struct admin_fixture
{
    profile prof{"/tmp/none"};
    task_group tasks;
    recording_writer w;
    std::atomic<int> reloads{0};
    std::unique_ptr<command_set> cmds;

    admin_fixture()
    {
        REQUIRE(prof.load_string("profile = { address = 'h:1', nickname = 'Wren', whitelist = { '~admin@host' } }"));
        cmds = std::make_unique<command_set>(
            "!", [this](std::string_view mask) { return prof.is_whitelisted(mask); }, tasks);
        bind_admin_commands(*cmds, prof, [this] { ++reloads; });
    }

    dispatch_result run(std::string payload, std::string mask = "~admin@host")
    {
        dispatch_result r = cmds->dispatch_ex(w, message(std::move(payload), std::move(mask)));
        tasks.wait();
        return r;
    }
};

}

TEST_CASE_FIXTURE(admin_fixture, "help and the nickname alias")
{
    CHECK(cmds->contains("wren"));

    CHECK(run("!help", "~anyone@host") == dispatch_result::scheduled);
    CHECK(run("!wren", "~anyone@host") == dispatch_result::scheduled);

    auto lines = w.lines();
    REQUIRE(lines.size() == 2);
    CHECK(lines[0] == lines[1]);
    CHECK(lines[0].find("steve, I know these commands: ") != std::string::npos);
    CHECK(lines[0].find("!authlist, !authorize") != std::string::npos);
    CHECK(lines[0].find("!version") != std::string::npos);
}

TEST_CASE_FIXTURE(admin_fixture, "nick")
{
    SUBCASE("with a password")
    {
        CHECK(run("!nick heron pw") == dispatch_result::scheduled);

        recording_writer expected;
        proto::nick(expected, "heron", "pw");
        CHECK(w.lines() == expected.lines());
        CHECK(prof.nickname() == "heron");
        CHECK(prof.nickserv_password() == "pw");
    }

    SUBCASE("a failed write changes nothing")
    {
        w.fail_after(0);
        CHECK(run("!nick heron") == dispatch_result::scheduled);
        CHECK(prof.nickname() == "Wren");
    }

    SUBCASE("administrators only")
    {
        CHECK(run("!nick heron", "~steve@host") == dispatch_result::access_denied);
        CHECK(prof.nickname() == "Wren");
        REQUIRE(w.count() == 1);
        CHECK(w.lines()[0].rfind("PRIVMSG steve ", 0) == 0);
    }
}

TEST_CASE_FIXTURE(admin_fixture, "join and part")
{
    recording_writer expected;

    SUBCASE("join with password and key")
    {
        CHECK(run("!join #home pw key") == dispatch_result::scheduled);
        proto::join(expected, channel{"#home", "key", "pw"});
        CHECK(w.lines() == expected.lines());
    }

    SUBCASE("join needs a channel name")
    {
        CHECK(run("!join") == dispatch_result::missing_parameters);
        CHECK(run("!join home") == dispatch_result::invalid_parameter);
    }

    SUBCASE("part")
    {
        CHECK(run("!part #home") == dispatch_result::scheduled);
        proto::part(expected, channel{"#home", {}, {}});
        CHECK(w.lines() == expected.lines());
    }
}

TEST_CASE_FIXTURE(admin_fixture, "whitelist management")
{
    CHECK(run("!authorize ~amy@host") == dispatch_result::scheduled);
    CHECK(prof.is_whitelisted("~AMY@host"));

    CHECK(run("!authlist") == dispatch_result::scheduled);

    CHECK(run("!deauthorize ~amy@host") == dispatch_result::scheduled);
    CHECK_FALSE(prof.is_whitelisted("~amy@host"));

    recording_writer expected;
    proto::privmsg(expected, "steve", "User \"~amy@host\" was added to the administrators.");
    proto::privmsg(expected, "steve", "Administrators: ~admin@host, ~amy@host");
    proto::privmsg(expected, "steve", "User \"~amy@host\" was removed from the administrators.");
    CHECK(w.lines() == expected.lines());
}

TEST_CASE_FIXTURE(admin_fixture, "log")
{
    CHECK_FALSE(prof.logging());
    CHECK(run("!log on") == dispatch_result::scheduled);
    CHECK(prof.logging());
    CHECK(run("!log") == dispatch_result::scheduled);
    CHECK(run("!log no") == dispatch_result::scheduled);
    CHECK_FALSE(prof.logging());
    CHECK(run("!log maybe") == dispatch_result::invalid_parameter);

    recording_writer expected;
    proto::privmsg(expected, "steve", "Logging is on.");
    proto::privmsg(expected, "steve", "Logging is on.");
    proto::privmsg(expected, "steve", "Logging is off.");
    auto lines = w.lines();
    REQUIRE(lines.size() == 4);
    lines.pop_back();
    CHECK(lines == expected.lines());
}

TEST_CASE_FIXTURE(admin_fixture, "reload and version")
{
    CHECK(run("!reload", "~steve@host") == dispatch_result::access_denied);
    CHECK(reloads == 0);

    CHECK(run("!reload") == dispatch_result::scheduled);
    CHECK(reloads == 1);

    CHECK(run("!version", "~steve@host") == dispatch_result::scheduled);
    auto lines = w.lines();
    REQUIRE(lines.size() == 3);

    recording_writer expected;
    proto::privmsg(expected, "#chan", "Reloading.");
    CHECK(lines[1] == expected.lines()[0]);
    CHECK(lines[2].find("steve, I am " + text::bold(KESTREL_NAME)) != std::string::npos);
    CHECK(lines[2].find(text::bold(KESTREL_VERSION)) != std::string::npos);
}
