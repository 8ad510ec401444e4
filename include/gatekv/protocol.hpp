#pragma once

#include <string>
#include <string_view>
#include <variant>
#include <stdexcept>

namespace gatekv {

class ProtocolError : public std::runtime_error {
public:
    explicit ProtocolError(const std::string& msg) : std::runtime_error(msg) {}
};

struct Get {
    std::string key;
};

struct Set {
    std::string key;
    std::string value;
};

struct Del {
    std::string key;
};

// Blank line, nothing to execute
struct NoOp {};

using Command = std::variant<NoOp, Get, Set, Del>;

/*
 * Line protocol spoken on every connection.
 *
 *   SET <key> <value>  ->  +OK
 *   GET <key>          ->  $<value>   or  _  when the key is absent
 *   DEL <key>          ->  +OK
 *
 * Command names are case-insensitive, keys and values are not.
 * The value runs to the end of the line: it may contain blanks and may be
 * empty ("SET k " followed by newline). Leading blanks before it are skipped.
 * A malformed line is answered with -ERR <reason>.
 */
class Protocol {
public:
    // Throws ProtocolError on malformed input
    static Command parse(std::string_view line);

    static std::string format_ok();
    static std::string format_error(std::string_view message);
    static std::string format_value(std::string_view value);
    static std::string format_nil();
};

} // namespace gatekv
