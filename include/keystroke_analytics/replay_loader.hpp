#pragma once

#include <cstddef>
#include <filesystem>
#include <istream>
#include <string>

#include "keystroke_analytics/typing_session.hpp"

namespace ks::analytics {

struct ReplayStats {
    std::size_t lines{0};
    std::size_t presses{0};
    std::size_t releases{0};
    std::size_t recorded{0};
    std::size_t dropped{0};
    std::size_t resets{0};
};

// Feeds a recorded capture stream into a TypingSession. One command per line:
//   down,<ms>,<key>,<code>
//   up,<ms>,<key>,<code>,<correct>[,<expected|none>[,<position>]]
//   cursor,<position>
//   reset
class ReplayLoader {
public:
    ReplayStats replayFile(const std::filesystem::path& path, TypingSession& session) const;
    ReplayStats replay(std::istream& in, TypingSession& session) const;
};

// Maps evdev names ("KEY_A") and numeric evdev codes onto DOM code names; other tokens pass through.
[[nodiscard]] std::string normalizeKeyCode(const std::string& token);

// Resolves the aliases used for glyphs the line format cannot carry ("space", "comma").
[[nodiscard]] std::string decodeKeyGlyph(const std::string& token);

}  // namespace ks::analytics
