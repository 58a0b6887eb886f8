#include "keystroke_analytics/key_layout.hpp"

#include <linux/input-event-codes.h>

#include <array>
#include <unordered_map>

namespace ks::analytics {

namespace {

struct KeyRow {
    PhysicalKey key;
    const char* code;
    int evdev;
    Finger finger;
    Hand hand;
    const char* glyphs;
};

constexpr Finger LP = Finger::LeftPinky;
constexpr Finger LR = Finger::LeftRing;
constexpr Finger LM = Finger::LeftMiddle;
constexpr Finger LI = Finger::LeftIndex;
constexpr Finger LT = Finger::LeftThumb;
constexpr Finger RI = Finger::RightIndex;
constexpr Finger RM = Finger::RightMiddle;
constexpr Finger RR = Finger::RightRing;
constexpr Finger RP = Finger::RightPinky;
constexpr Finger RT = Finger::RightThumb;

constexpr Hand L = Hand::Left;
constexpr Hand R = Hand::Right;

// Rows must stay in PhysicalKey declaration order.
constexpr std::array<KeyRow, kPhysicalKeyCount> kKeyTable{{
    {PhysicalKey::Backquote, "Backquote", KEY_GRAVE, LP, L, "`~"},
    {PhysicalKey::Digit1, "Digit1", KEY_1, LP, L, "1!"},
    {PhysicalKey::Digit2, "Digit2", KEY_2, LR, L, "2@"},
    {PhysicalKey::Digit3, "Digit3", KEY_3, LM, L, "3#"},
    {PhysicalKey::Digit4, "Digit4", KEY_4, LI, L, "4$"},
    {PhysicalKey::Digit5, "Digit5", KEY_5, LI, L, "5%"},
    {PhysicalKey::Digit6, "Digit6", KEY_6, RI, R, "6^"},
    {PhysicalKey::Digit7, "Digit7", KEY_7, RI, R, "7&"},
    {PhysicalKey::Digit8, "Digit8", KEY_8, RM, R, "8*"},
    {PhysicalKey::Digit9, "Digit9", KEY_9, RR, R, "9("},
    {PhysicalKey::Digit0, "Digit0", KEY_0, RP, R, "0)"},
    {PhysicalKey::Minus, "Minus", KEY_MINUS, RP, R, "-_"},
    {PhysicalKey::Equal, "Equal", KEY_EQUAL, RP, R, "=+"},
    {PhysicalKey::Backspace, "Backspace", KEY_BACKSPACE, RP, R, ""},
    {PhysicalKey::Tab, "Tab", KEY_TAB, LP, L, "\t"},
    {PhysicalKey::KeyQ, "KeyQ", KEY_Q, LP, L, "qQ"},
    {PhysicalKey::KeyW, "KeyW", KEY_W, LR, L, "wW"},
    {PhysicalKey::KeyE, "KeyE", KEY_E, LM, L, "eE"},
    {PhysicalKey::KeyR, "KeyR", KEY_R, LI, L, "rR"},
    {PhysicalKey::KeyT, "KeyT", KEY_T, LI, L, "tT"},
    {PhysicalKey::KeyY, "KeyY", KEY_Y, RI, R, "yY"},
    {PhysicalKey::KeyU, "KeyU", KEY_U, RI, R, "uU"},
    {PhysicalKey::KeyI, "KeyI", KEY_I, RM, R, "iI"},
    {PhysicalKey::KeyO, "KeyO", KEY_O, RR, R, "oO"},
    {PhysicalKey::KeyP, "KeyP", KEY_P, RP, R, "pP"},
    {PhysicalKey::BracketLeft, "BracketLeft", KEY_LEFTBRACE, RP, R, "[{"},
    {PhysicalKey::BracketRight, "BracketRight", KEY_RIGHTBRACE, RP, R, "]}"},
    {PhysicalKey::Backslash, "Backslash", KEY_BACKSLASH, RP, R, "\\|"},
    {PhysicalKey::CapsLock, "CapsLock", KEY_CAPSLOCK, LP, L, ""},
    {PhysicalKey::KeyA, "KeyA", KEY_A, LP, L, "aA"},
    {PhysicalKey::KeyS, "KeyS", KEY_S, LR, L, "sS"},
    {PhysicalKey::KeyD, "KeyD", KEY_D, LM, L, "dD"},
    {PhysicalKey::KeyF, "KeyF", KEY_F, LI, L, "fF"},
    {PhysicalKey::KeyG, "KeyG", KEY_G, LI, L, "gG"},
    {PhysicalKey::KeyH, "KeyH", KEY_H, RI, R, "hH"},
    {PhysicalKey::KeyJ, "KeyJ", KEY_J, RI, R, "jJ"},
    {PhysicalKey::KeyK, "KeyK", KEY_K, RM, R, "kK"},
    {PhysicalKey::KeyL, "KeyL", KEY_L, RR, R, "lL"},
    {PhysicalKey::Semicolon, "Semicolon", KEY_SEMICOLON, RP, R, ";:"},
    {PhysicalKey::Quote, "Quote", KEY_APOSTROPHE, RP, R, "'\""},
    {PhysicalKey::Enter, "Enter", KEY_ENTER, RP, R, "\n"},
    {PhysicalKey::ShiftLeft, "ShiftLeft", KEY_LEFTSHIFT, LP, L, ""},
    {PhysicalKey::KeyZ, "KeyZ", KEY_Z, LP, L, "zZ"},
    {PhysicalKey::KeyX, "KeyX", KEY_X, LR, L, "xX"},
    {PhysicalKey::KeyC, "KeyC", KEY_C, LM, L, "cC"},
    {PhysicalKey::KeyV, "KeyV", KEY_V, LI, L, "vV"},
    {PhysicalKey::KeyB, "KeyB", KEY_B, LI, L, "bB"},
    {PhysicalKey::KeyN, "KeyN", KEY_N, RI, R, "nN"},
    {PhysicalKey::KeyM, "KeyM", KEY_M, RI, R, "mM"},
    {PhysicalKey::Comma, "Comma", KEY_COMMA, RM, R, ",<"},
    {PhysicalKey::Period, "Period", KEY_DOT, RR, R, ".>"},
    {PhysicalKey::Slash, "Slash", KEY_SLASH, RP, R, "/?"},
    {PhysicalKey::ShiftRight, "ShiftRight", KEY_RIGHTSHIFT, RP, R, ""},
    {PhysicalKey::ControlLeft, "ControlLeft", KEY_LEFTCTRL, LP, L, ""},
    {PhysicalKey::MetaLeft, "MetaLeft", KEY_LEFTMETA, LT, L, ""},
    {PhysicalKey::AltLeft, "AltLeft", KEY_LEFTALT, LT, L, ""},
    {PhysicalKey::Space, "Space", KEY_SPACE, Finger::Thumbs, Hand::Both, " "},
    {PhysicalKey::AltRight, "AltRight", KEY_RIGHTALT, RT, R, ""},
    {PhysicalKey::MetaRight, "MetaRight", KEY_RIGHTMETA, RT, R, ""},
    {PhysicalKey::ControlRight, "ControlRight", KEY_RIGHTCTRL, RP, R, ""},
    {PhysicalKey::ArrowUp, "ArrowUp", KEY_UP, RI, R, ""},
    {PhysicalKey::ArrowDown, "ArrowDown", KEY_DOWN, RI, R, ""},
    {PhysicalKey::ArrowLeft, "ArrowLeft", KEY_LEFT, RI, R, ""},
    {PhysicalKey::ArrowRight, "ArrowRight", KEY_RIGHT, RI, R, ""},
    {PhysicalKey::Escape, "Escape", KEY_ESC, LP, L, ""},
}};

constexpr bool tableIsOrdered() {
    for (std::size_t i = 0; i < kKeyTable.size(); ++i) {
        if (static_cast<std::size_t>(kKeyTable[i].key) != i) {
            return false;
        }
    }
    return true;
}

static_assert(tableIsOrdered(), "kKeyTable rows out of PhysicalKey order");

struct LookupIndex {
    std::unordered_map<std::string, PhysicalKey> by_code;
    std::unordered_map<int, PhysicalKey> by_evdev;
    std::unordered_map<char, PhysicalKey> by_glyph;
};

const LookupIndex& lookupIndex() {
    static const LookupIndex index = [] {
        LookupIndex idx;
        for (const auto& row : kKeyTable) {
            idx.by_code.emplace(row.code, row.key);
            idx.by_evdev.emplace(row.evdev, row.key);
            for (const char* g = row.glyphs; *g != '\0'; ++g) {
                idx.by_glyph.emplace(*g, row.key);
            }
        }
        return idx;
    }();
    return index;
}

const KeyRow& rowFor(PhysicalKey key) noexcept {
    return kKeyTable[static_cast<std::size_t>(key)];
}

}  // namespace

FingerAssignment assignmentFor(PhysicalKey key) noexcept {
    const auto& row = rowFor(key);
    return {row.finger, row.hand};
}

const char* codeName(PhysicalKey key) noexcept {
    return rowFor(key).code;
}

std::optional<PhysicalKey> physicalKeyFromCode(const std::string& code) {
    const auto& index = lookupIndex();
    auto it = index.by_code.find(code);
    if (it == index.by_code.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<PhysicalKey> physicalKeyFromEvdev(int evdev_code) {
    const auto& index = lookupIndex();
    auto it = index.by_evdev.find(evdev_code);
    if (it == index.by_evdev.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<PhysicalKey> physicalKeyFromGlyph(const std::string& glyph) {
    if (glyph.size() != 1) {
        return std::nullopt;
    }
    const auto& index = lookupIndex();
    auto it = index.by_glyph.find(glyph.front());
    if (it == index.by_glyph.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<FingerAssignment> resolveFinger(const std::string& key, const std::string& code) {
    if (auto physical = physicalKeyFromCode(code)) {
        return assignmentFor(*physical);
    }
    if (auto physical = physicalKeyFromGlyph(key)) {
        return assignmentFor(*physical);
    }
    return std::nullopt;
}

const char* fingerName(Finger finger) noexcept {
    switch (finger) {
        case Finger::LeftPinky: return "Left Pinky";
        case Finger::LeftRing: return "Left Ring";
        case Finger::LeftMiddle: return "Left Middle";
        case Finger::LeftIndex: return "Left Index";
        case Finger::LeftThumb: return "Left Thumb";
        case Finger::RightIndex: return "Right Index";
        case Finger::RightMiddle: return "Right Middle";
        case Finger::RightRing: return "Right Ring";
        case Finger::RightPinky: return "Right Pinky";
        case Finger::RightThumb: return "Right Thumb";
        case Finger::Thumbs: return "Thumbs";
    }
    return "Unknown";
}

const char* handName(Hand hand) noexcept {
    switch (hand) {
        case Hand::Left: return "left";
        case Hand::Right: return "right";
        case Hand::Both: return "both";
    }
    return "unknown";
}

}  // namespace ks::analytics
