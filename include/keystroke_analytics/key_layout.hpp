#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace ks::analytics {

enum class Finger {
    LeftPinky,
    LeftRing,
    LeftMiddle,
    LeftIndex,
    LeftThumb,
    RightIndex,
    RightMiddle,
    RightRing,
    RightPinky,
    RightThumb,
    Thumbs,
};

enum class Hand {
    Left,
    Right,
    Both,
};

// Closed set of physical keys on an ANSI layout that carry a finger assignment.
enum class PhysicalKey {
    Backquote, Digit1, Digit2, Digit3, Digit4, Digit5,
    Digit6, Digit7, Digit8, Digit9, Digit0, Minus, Equal, Backspace,
    Tab, KeyQ, KeyW, KeyE, KeyR, KeyT,
    KeyY, KeyU, KeyI, KeyO, KeyP, BracketLeft, BracketRight, Backslash,
    CapsLock, KeyA, KeyS, KeyD, KeyF, KeyG,
    KeyH, KeyJ, KeyK, KeyL, Semicolon, Quote, Enter,
    ShiftLeft, KeyZ, KeyX, KeyC, KeyV, KeyB,
    KeyN, KeyM, Comma, Period, Slash, ShiftRight,
    ControlLeft, MetaLeft, AltLeft, Space, AltRight, MetaRight, ControlRight,
    ArrowUp, ArrowDown, ArrowLeft, ArrowRight, Escape,
};

inline constexpr std::size_t kPhysicalKeyCount = static_cast<std::size_t>(PhysicalKey::Escape) + 1;

struct FingerAssignment {
    Finger finger{Finger::Thumbs};
    Hand hand{Hand::Both};
};

inline bool operator==(const FingerAssignment& lhs, const FingerAssignment& rhs) {
    return lhs.finger == rhs.finger && lhs.hand == rhs.hand;
}

[[nodiscard]] FingerAssignment assignmentFor(PhysicalKey key) noexcept;

// DOM-style code name ("KeyA", "Digit1", "ShiftLeft").
[[nodiscard]] const char* codeName(PhysicalKey key) noexcept;

[[nodiscard]] std::optional<PhysicalKey> physicalKeyFromCode(const std::string& code);
[[nodiscard]] std::optional<PhysicalKey> physicalKeyFromEvdev(int evdev_code);

// Letters match case-insensitively, shifted symbols map to their base key.
[[nodiscard]] std::optional<PhysicalKey> physicalKeyFromGlyph(const std::string& glyph);

// Physical code first, then the produced glyph; nullopt when neither is mapped.
[[nodiscard]] std::optional<FingerAssignment> resolveFinger(const std::string& key,
                                                            const std::string& code);

[[nodiscard]] const char* fingerName(Finger finger) noexcept;
[[nodiscard]] const char* handName(Hand hand) noexcept;

}  // namespace ks::analytics
