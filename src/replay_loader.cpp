#include "keystroke_analytics/replay_loader.hpp"

#include <libevdev/libevdev.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "keystroke_analytics/key_layout.hpp"

namespace ks::analytics {

namespace {

std::string trim(const std::string& input) {
    auto begin = std::find_if_not(input.begin(), input.end(), [](unsigned char ch) {
        return std::isspace(ch) != 0;
    });
    auto end = std::find_if_not(input.rbegin(), input.rend(), [](unsigned char ch) {
        return std::isspace(ch) != 0;
    }).base();
    if (begin >= end) {
        return {};
    }
    return std::string(begin, end);
}

std::string toUpper(const std::string& token) {
    std::string upper;
    upper.reserve(token.size());
    for (char ch : token) {
        upper.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(ch))));
    }
    return upper;
}

std::string toLower(const std::string& token) {
    std::string lower;
    lower.reserve(token.size());
    for (char ch : token) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    return lower;
}

std::vector<std::string> splitFields(const std::string& line) {
    std::vector<std::string> fields;
    std::istringstream line_stream(line);
    std::string token;
    while (std::getline(line_stream, token, ',')) {
        fields.push_back(trim(token));
    }
    return fields;
}

std::string lineError(std::size_t line_no, const std::string& what) {
    return "Replay line " + std::to_string(line_no) + ": " + what;
}

Millis parseTimestamp(const std::string& token, std::size_t line_no) {
    try {
        std::size_t consumed = 0;
        const double value = std::stod(token, &consumed);
        if (consumed != token.size() || !std::isfinite(value)) {
            throw std::invalid_argument(token);
        }
        return value;
    } catch (const std::exception&) {
        throw std::runtime_error(lineError(line_no, "invalid timestamp '" + token + "'"));
    }
}

std::size_t parsePosition(const std::string& token, std::size_t line_no) {
    try {
        std::size_t consumed = 0;
        const unsigned long value = std::stoul(token, &consumed);
        if (consumed != token.size() || token.front() == '-') {
            throw std::invalid_argument(token);
        }
        return static_cast<std::size_t>(value);
    } catch (const std::exception&) {
        throw std::runtime_error(lineError(line_no, "invalid position '" + token + "'"));
    }
}

bool parseCorrect(const std::string& token, std::size_t line_no) {
    const auto lower = toLower(token);
    if (lower == "1" || lower == "true" || lower == "y") return true;
    if (lower == "0" || lower == "false" || lower == "n") return false;
    throw std::runtime_error(lineError(line_no, "invalid correctness flag '" + token + "'"));
}

std::optional<std::string> codeNameForEvdev(int code) {
    if (auto physical = physicalKeyFromEvdev(code)) {
        return std::string(codeName(*physical));
    }
    return std::nullopt;
}

}  // namespace

std::string normalizeKeyCode(const std::string& raw) {
    const std::string token = trim(raw);
    if (token.empty()) {
        return {};
    }
    const std::string upper = toUpper(token);
    if (upper == "NONE") {
        return {};
    }
    if (upper.rfind("KEY_", 0) == 0) {
        const int code = libevdev_event_code_from_name(EV_KEY, upper.c_str());
        if (code < 0) {
            throw std::runtime_error("Unknown keycode name: " + token);
        }
        return codeNameForEvdev(code).value_or(token);
    }
    if (std::all_of(token.begin(), token.end(), [](unsigned char ch) { return std::isdigit(ch) != 0; })) {
        int code = 0;
        try {
            code = std::stoi(token);
        } catch (const std::exception&) {
            throw std::runtime_error("Invalid keycode token: " + token);
        }
        if (auto name = codeNameForEvdev(code)) {
            return *name;
        }
        if (const char* evdev_name = libevdev_event_code_get_name(EV_KEY, static_cast<unsigned int>(code))) {
            return evdev_name;
        }
        return token;
    }
    return token;
}

std::string decodeKeyGlyph(const std::string& token) {
    const auto lower = toLower(token);
    if (lower == "space") return " ";
    if (lower == "comma") return ",";
    if (lower == "tab") return "\t";
    return token;
}

ReplayStats ReplayLoader::replayFile(const std::filesystem::path& path, TypingSession& session) const {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Failed to open replay file: " + path.string());
    }
    auto stats = replay(in, session);
    std::cout << "[ReplayLoader] " << path.filename().string() << ": " << stats.presses << " presses, "
              << stats.releases << " releases, " << stats.recorded << " recorded";
    if (stats.dropped > 0) {
        std::cout << " (" << stats.dropped << " unmatched releases dropped)";
    }
    std::cout << '\n';
    return stats;
}

ReplayStats ReplayLoader::replay(std::istream& in, TypingSession& session) const {
    ReplayStats stats;
    std::string line;
    std::size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        ++stats.lines;

        const auto fields = splitFields(line);
        const auto command = toLower(fields.front());

        if (command == "down") {
            if (fields.size() != 4) {
                throw std::runtime_error(lineError(line_no, "expected down,<ms>,<key>,<code>"));
            }
            session.onKeyDown(decodeKeyGlyph(fields[2]), normalizeKeyCode(fields[3]),
                              parseTimestamp(fields[1], line_no));
            ++stats.presses;
        } else if (command == "up") {
            if (fields.size() < 5 || fields.size() > 7) {
                throw std::runtime_error(
                    lineError(line_no, "expected up,<ms>,<key>,<code>,<correct>[,<expected>[,<position>]]"));
            }
            const auto timestamp = parseTimestamp(fields[1], line_no);
            const auto key = decodeKeyGlyph(fields[2]);
            const auto code = normalizeKeyCode(fields[3]);
            const bool correct = parseCorrect(fields[4], line_no);
            const std::size_t before = session.events().size();

            if (fields.size() == 5) {
                session.onKeyUp(key, code, timestamp, correct);
            } else {
                std::optional<std::string> expected;
                if (toLower(fields[5]) != "none") {
                    expected = decodeKeyGlyph(fields[5]);
                }
                std::optional<std::size_t> position;
                if (fields.size() == 7) {
                    position = parsePosition(fields[6], line_no);
                }
                session.onKeyUp(key, code, timestamp, correct, std::move(expected), position);
            }

            ++stats.releases;
            if (session.events().size() > before) {
                ++stats.recorded;
            } else {
                ++stats.dropped;
            }
        } else if (command == "cursor") {
            if (fields.size() != 2) {
                throw std::runtime_error(lineError(line_no, "expected cursor,<position>"));
            }
            session.setCursor(parsePosition(fields[1], line_no));
        } else if (command == "reset") {
            session.reset();
            stats.recorded = 0;
            ++stats.resets;
        } else {
            throw std::runtime_error(lineError(line_no, "unknown command '" + fields.front() + "'"));
        }
    }
    return stats;
}

}  // namespace ks::analytics
