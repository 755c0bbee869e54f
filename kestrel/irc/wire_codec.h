#pragma once
#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "event.h"

// Line codec for the IRC client protocol (RFC 1459 framing).
// Stateless; no I/O.

namespace irc {

// Hard ceiling for one protocol line, "\r\n" included.
constexpr size_t MAX_LINE = 512;

// ─── Decoding ───

// Splits a line (terminator already trimmed) into an event.
// Returns nullopt for empty or unusable lines, and for any line mentioning
// QUIT: those are not consumed by this client.
std::optional<inbound_event> decode(std::string_view line);

// Whitespace split with empty tokens dropped.
std::vector<std::string_view> split_fields(std::string_view line);

// ─── Encoding ───

// Appends "\r\n" and enforces MAX_LINE. Longer lines are cut to exactly
// MAX_LINE bytes with the last two forced to "\r\n", wherever the cut
// falls. Returns an empty string when the body is empty, or when it holds
// CR, LF or NUL and would not reach the server as one line: nothing should
// be written then.
std::string format_line(std::string_view body);

// "VERB p1 p2 ... pN\r\n". The last parameter gets a ':' marker when it
// is empty, contains a space, or itself starts with ':'.
std::string encode(std::string_view verb, std::initializer_list<std::string_view> params);
std::string encode(std::string_view verb, const std::vector<std::string_view>& params);

}
