#pragma once

#include <algorithm>
#include <cctype>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace sweeper_cli {

struct CommandError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

enum class Action { Exit, Restart, Uncover, Flag, Question, Clear, ShowMines };

struct Command {
    Action action{Action::Exit};
    int x{-1};
    int y{-1};
};

inline std::string trim(std::string text) {
    text.erase(text.begin(), std::find_if(text.begin(), text.end(), [](unsigned char ch) {
        return !std::isspace(ch);
    }));
    text.erase(std::find_if(text.rbegin(), text.rend(), [](unsigned char ch) {
                   return !std::isspace(ch);
               }).base(),
               text.end());
    return text;
}

inline int parse_number(const std::string& text) {
    const std::string value = trim(text);
    if (value.empty()) {
        throw CommandError("Missing coordinate");
    }
    std::size_t used = 0;
    int number = 0;
    try {
        number = std::stoi(value, &used);
    } catch (const std::exception&) {
        throw CommandError("Invalid coordinate: " + value);
    }
    if (used != value.size()) {
        throw CommandError("Invalid coordinate: " + value);
    }
    return number;
}

// "(x,y)" with optional whitespace around the numbers
inline std::pair<int, int> parse_coords(const std::string& text) {
    const std::string trimmed = trim(text);
    if (trimmed.size() < 5 || trimmed.front() != '(' || trimmed.back() != ')') {
        throw CommandError("Coordinates must look like (x,y): " + trimmed);
    }
    const std::string inner = trimmed.substr(1, trimmed.size() - 2);
    const auto comma = inner.find(',');
    if (comma == std::string::npos || inner.find(',', comma + 1) != std::string::npos) {
        throw CommandError("Coordinates must look like (x,y): " + trimmed);
    }
    return {parse_number(inner.substr(0, comma)), parse_number(inner.substr(comma + 1))};
}

// Empty lines yield nullopt.
inline std::optional<Command> parse_command(const std::string& line) {
    const std::string trimmed = trim(line);
    if (trimmed.empty()) {
        return std::nullopt;
    }
    const char key = static_cast<char>(std::tolower(static_cast<unsigned char>(trimmed[0])));
    const std::string rest = trimmed.substr(1);

    Command cmd;
    switch (key) {
        case 'x': cmd.action = Action::Exit; break;
        case 'r': cmd.action = Action::Restart; break;
        case 's': cmd.action = Action::ShowMines; break;
        case 'u': cmd.action = Action::Uncover; break;
        case 'f': cmd.action = Action::Flag; break;
        case '?': cmd.action = Action::Question; break;
        case 'c': cmd.action = Action::Clear; break;
        default:
            throw CommandError("Unknown command: " + trimmed);
    }

    const bool needs_coords = cmd.action == Action::Uncover || cmd.action == Action::Flag ||
                              cmd.action == Action::Question || cmd.action == Action::Clear;
    if (!needs_coords) {
        if (!trim(rest).empty()) {
            throw CommandError("Command takes no arguments: " + trimmed);
        }
        return cmd;
    }
    auto [x, y] = parse_coords(rest);
    cmd.x = x;
    cmd.y = y;
    return cmd;
}

} // namespace sweeper_cli
