#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include "../../kestrel/irc/wire_codec.h"

TEST_CASE("decode ordinary lines")
{
    SUBCASE("privmsg with hostmask")
    {
        auto ev = irc::decode(":steve!~steve@host.net PRIVMSG #chan :hello there  world");
        REQUIRE(ev.has_value());
        CHECK(ev->sender_nick == "steve");
        CHECK(ev->sender_mask == "~steve@host.net");
        CHECK(ev->type == "PRIVMSG");
        CHECK(ev->target == "#chan");
        CHECK(ev->payload == "hello there world");
        CHECK(ev->from_channel());
        CHECK(ev->is_privmsg());
    }

    SUBCASE("sender without bang")
    {
        auto ev = irc::decode(":irc.server.net 001 kestrel :Welcome to the network");
        REQUIRE(ev.has_value());
        CHECK(ev->sender_nick == "irc.server.net");
        CHECK(ev->sender_mask == "irc.server.net");
        CHECK(ev->type == "001");
        CHECK(ev->target == "kestrel");
        CHECK(ev->payload == "Welcome to the network");
        CHECK_FALSE(ev->from_channel());
    }

    SUBCASE("only the first four fields lose their colon")
    {
        auto ev = irc::decode(":a!b@c PRIVMSG #x :one :two");
        REQUIRE(ev.has_value());
        CHECK(ev->payload == "one :two");
    }

    SUBCASE("no payload")
    {
        auto ev = irc::decode(":a!b@c JOIN #x");
        REQUIRE(ev.has_value());
        CHECK(ev->type == "JOIN");
        CHECK(ev->target == "#x");
        CHECK(ev->payload.empty());
    }

    SUBCASE("payload fields")
    {
        auto ev = irc::decode(":a!b@c PRIVMSG #x :!weather new york");
        REQUIRE(ev.has_value());
        auto words = ev->fields(1);
        REQUIRE(words.size() == 2);
        CHECK(words[0] == "new");
        CHECK(words[1] == "york");
        CHECK(ev->fields(5).empty());
    }
}

TEST_CASE("decode server lines")
{
    SUBCASE("PING")
    {
        auto ev = irc::decode("PING :abc");
        REQUIRE(ev.has_value());
        CHECK(ev->type == "PING");
        CHECK(ev->payload == "abc");
        CHECK(ev->sender_nick.empty());
    }

    SUBCASE("ERROR keeps the whole message")
    {
        auto ev = irc::decode("ERROR :Closing Link: kestrel (Ping timeout)");
        REQUIRE(ev.has_value());
        CHECK(ev->type == "ERROR");
        CHECK(ev->payload == "Closing Link: kestrel (Ping timeout)");
    }
}

TEST_CASE("decode drops unusable lines")
{
    CHECK_FALSE(irc::decode("").has_value());
    CHECK_FALSE(irc::decode("   ").has_value());
    CHECK_FALSE(irc::decode(":a!b@c QUIT :bye").has_value());
    CHECK_FALSE(irc::decode(":a!b@c PRIVMSG #x :I QUIT smoking").has_value());
    CHECK_FALSE(irc::decode(":server NOTICE").has_value());
}

TEST_CASE("format_line framing")
{
    SUBCASE("appends terminator")
    {
        CHECK(irc::format_line("NICK kestrel") == "NICK kestrel\r\n");
    }

    SUBCASE("empty body is suppressed")
    {
        CHECK(irc::format_line("").empty());
    }

    SUBCASE("long lines are cut to exactly 512 bytes")
    {
        std::string body = "PRIVMSG #x :" + std::string(600, 'a');
        std::string line = irc::format_line(body);
        CHECK(line.size() == irc::MAX_LINE);
        CHECK(line.substr(510) == "\r\n");
        CHECK(line.compare(0, 12, "PRIVMSG #x :") == 0);
    }

    SUBCASE("boundary: 510 byte body fills the line")
    {
        std::string body(510, 'x');
        std::string line = irc::format_line(body);
        CHECK(line.size() == 512);
        CHECK(line[509] == 'x');
        CHECK(line.substr(510) == "\r\n");
    }

    SUBCASE("cut ignores character boundaries")
    {
        // 3-byte UTF-8 sequences straddling the cut
        std::string body;
        while (body.size() < 520)
            body += "\xE2\x82\xAC";
        std::string line = irc::format_line(body);
        CHECK(line.size() == 512);
        CHECK(line[510] == '\r');
        CHECK(line[511] == '\n');
    }
}

TEST_CASE("encode parameters")
{
    CHECK(irc::encode("NICK", {"kestrel"}) == "NICK kestrel\r\n");
    CHECK(irc::encode("PRIVMSG", {"#x", "hello world"}) == "PRIVMSG #x :hello world\r\n");
    CHECK(irc::encode("PART", {"#x", ""}) == "PART #x :\r\n");
    CHECK(irc::encode("PRIVMSG", {"#x", ":)"}) == "PRIVMSG #x ::)\r\n");
    CHECK(irc::encode("QUIT", {}) == "QUIT\r\n");
}

TEST_CASE("one command never becomes several lines")
{
    CHECK(irc::encode("PRIVMSG", {"#chan", "weather: sunny\r\nQUIT :bye"}).empty());
    CHECK(irc::encode("PRIVMSG", {"#chan", "line\nbreak"}).empty());
    CHECK(irc::encode("PRIVMSG", {"#chan", "carriage\rreturn"}).empty());
    CHECK(irc::encode("PRIVMSG", {"#chan", std::string_view("nul\0byte", 8)}).empty());
    CHECK(irc::format_line("JOIN #a\r\nJOIN #b").empty());

    // Other control characters are text decorations and pass through
    CHECK(irc::encode("PRIVMSG", {"#chan", "\x02" "bold" "\x02"}) == "PRIVMSG #chan \x02" "bold" "\x02" "\r\n");
}

TEST_CASE("encoded lines decode back")
{
    std::string line = irc::encode("PRIVMSG", {"#chan", "multi word text"});
    line = ":nick!user@host " + line.substr(0, line.size() - 2);

    auto ev = irc::decode(line);
    REQUIRE(ev.has_value());
    CHECK(ev->type == "PRIVMSG");
    CHECK(ev->target == "#chan");
    CHECK(ev->payload == "multi word text");
}
