#include "gatekv/protocol.hpp"

#include <algorithm>
#include <cctype>

namespace gatekv {

namespace {

bool is_blank(char c) {
    return c == ' ' || c == '\t';
}

// Returns the next blank-delimited word at or after pos, empty at end of line
std::string_view next_word(std::string_view line, size_t& pos) {
    while (pos < line.size() && is_blank(line[pos]))
        ++pos;

    size_t start = pos;
    while (pos < line.size() && !is_blank(line[pos]))
        ++pos;

    return line.substr(start, pos - start);
}

bool only_blanks(std::string_view rest) {
    return std::all_of(rest.begin(), rest.end(), is_blank);
}

} // namespace

Command Protocol::parse(std::string_view line) {
    // CRLF tolerance (telnet, netcat -C)
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }

    size_t pos = 0;
    std::string_view word = next_word(line, pos);
    if (word.empty())
        return NoOp{};

    std::string cmd{word};
    std::transform(cmd.begin(), cmd.end(), cmd.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    std::string_view key = next_word(line, pos);

    if (cmd == "get") {
        if (key.empty() || !only_blanks(line.substr(pos)))
            throw ProtocolError{"GET requires exactly one argument"};
        return Get{std::string{key}};
    }

    if (cmd == "set") {
        // the value is everything after the blanks following the key,
        // so it may contain blanks or be empty ("SET k " stores "")
        if (key.empty() || pos == line.size())
            throw ProtocolError{"SET requires a key and a value"};
        while (pos < line.size() && is_blank(line[pos]))
            ++pos;
        return Set{std::string{key}, std::string{line.substr(pos)}};
    }

    if (cmd == "del" || cmd == "delete") {
        if (key.empty() || !only_blanks(line.substr(pos)))
            throw ProtocolError{"DEL requires exactly one argument"};
        return Del{std::string{key}};
    }

    throw ProtocolError{"unknown command"};
}

std::string Protocol::format_ok() {
    return "+OK\n";
}

std::string Protocol::format_error(std::string_view message) {
    return "-ERR " + std::string{message} + "\n";
}

std::string Protocol::format_value(std::string_view value) {
    return "$" + std::string{value} + "\n";
}

std::string Protocol::format_nil() {
    return "_\n";
}

} // namespace gatekv
