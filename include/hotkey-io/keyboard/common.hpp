#pragma once
/**
 * @file keyboard/common.hpp
 * @brief Physical key vocabulary and text helpers for hotkey::io::keyboard.
 *
 * This header defines the closed set of physical key positions understood by
 * the library (`KeyCode`), the categories they are grouped into
 * (`KeyCodeClass`), and the pure helpers that classify, name, label and parse
 * them. None of these helpers touch mutable state, so they may be called from
 * any thread without synchronization.
 *
 * Layout-aware labels live in `<hotkey-io/keyboard/layout.hpp>`.
 */

#include <hotkey-io/core.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace hotkey {
namespace io {
namespace keyboard {

/**
 * @enum KeyCode
 * @brief Physical key positions (layout-agnostic).
 *
 * Enumerator names follow the W3C UI Events `code` values. They identify the
 * position of a key, not the character it produces: `KeyCode::KeyQ` is the
 * key right of Tab on every layout, even where it types 'A'.
 *
 * Stable, contiguous numeric values are assigned so a key can cross the C
 * boundary as a plain integer.
 */
enum class KeyCode : uint16_t {
  // Writing system keys
  Backquote = 0,
  Backslash = 1,
  Backspace = 2,
  BracketLeft = 3,
  BracketRight = 4,
  Comma = 5,
  Digit0 = 6,
  Digit1 = 7,
  Digit2 = 8,
  Digit3 = 9,
  Digit4 = 10,
  Digit5 = 11,
  Digit6 = 12,
  Digit7 = 13,
  Digit8 = 14,
  Digit9 = 15,
  Equal = 16,
  IntlBackslash = 17,
  IntlRo = 18,
  IntlYen = 19,
  KeyA = 20,
  KeyB = 21,
  KeyC = 22,
  KeyD = 23,
  KeyE = 24,
  KeyF = 25,
  KeyG = 26,
  KeyH = 27,
  KeyI = 28,
  KeyJ = 29,
  KeyK = 30,
  KeyL = 31,
  KeyM = 32,
  KeyN = 33,
  KeyO = 34,
  KeyP = 35,
  KeyQ = 36,
  KeyR = 37,
  KeyS = 38,
  KeyT = 39,
  KeyU = 40,
  KeyV = 41,
  KeyW = 42,
  KeyX = 43,
  KeyY = 44,
  KeyZ = 45,
  Minus = 46,
  Period = 47,
  Quote = 48,
  Semicolon = 49,
  Slash = 50,

  // Functional keys
  AltLeft = 51,
  AltRight = 52,
  CapsLock = 53,
  ContextMenu = 54,
  ControlLeft = 55,
  ControlRight = 56,
  Enter = 57,
  MetaLeft = 58, // Reported as "OSLeft" by older runtimes
  MetaRight = 59, // Reported as "OSRight" by older runtimes
  ShiftLeft = 60,
  ShiftRight = 61,
  Space = 62,
  Tab = 63,

  // Functional keys found on Japanese and Korean keyboards
  Convert = 64,
  KanaMode = 65,
  Lang1 = 66,
  Lang2 = 67,
  Lang3 = 68,
  Lang4 = 69,
  Lang5 = 70,
  NonConvert = 71,

  // Control pad section
  Delete = 72,
  End = 73,
  Help = 74,
  Home = 75,
  Insert = 76,
  PageDown = 77,
  PageUp = 78,

  // Arrow pad section
  ArrowDown = 79,
  ArrowLeft = 80,
  ArrowRight = 81,
  ArrowUp = 82,

  // Numpad section
  NumLock = 83,
  Numpad0 = 84,
  Numpad1 = 85,
  Numpad2 = 86,
  Numpad3 = 87,
  Numpad4 = 88,
  Numpad5 = 89,
  Numpad6 = 90,
  Numpad7 = 91,
  Numpad8 = 92,
  Numpad9 = 93,
  NumpadAdd = 94,
  NumpadBackspace = 95,
  NumpadClear = 96,
  NumpadClearEntry = 97,
  NumpadComma = 98,
  NumpadDecimal = 99,
  NumpadDivide = 100,
  NumpadEnter = 101,
  NumpadEqual = 102,
  NumpadHash = 103,
  NumpadMemoryAdd = 104,
  NumpadMemoryClear = 105,
  NumpadMemoryRecall = 106,
  NumpadMemoryStore = 107,
  NumpadMemorySubtract = 108,
  NumpadMultiply = 109,
  NumpadParenLeft = 110,
  NumpadParenRight = 111,
  NumpadStar = 112,
  NumpadSubtract = 113,

  // Function section
  Escape = 114,
  F1 = 115,
  F2 = 116,
  F3 = 117,
  F4 = 118,
  F5 = 119,
  F6 = 120,
  F7 = 121,
  F8 = 122,
  F9 = 123,
  F10 = 124,
  F11 = 125,
  F12 = 126,
  F13 = 127,
  F14 = 128,
  F15 = 129,
  F16 = 130,
  F17 = 131,
  F18 = 132,
  F19 = 133,
  F20 = 134,
  F21 = 135,
  F22 = 136,
  F23 = 137,
  F24 = 138,
  Fn = 139,
  FnLock = 140,
  PrintScreen = 141,
  ScrollLock = 142,
  Pause = 143,

  // Media keys
  BrowserBack = 144,
  BrowserFavorites = 145,
  BrowserForward = 146,
  BrowserHome = 147,
  BrowserRefresh = 148,
  BrowserSearch = 149,
  BrowserStop = 150,
  Eject = 151,
  LaunchApp1 = 152,
  LaunchApp2 = 153,
  LaunchMail = 154,
  MediaPlayPause = 155,
  MediaSelect = 156, // Reported as "LaunchMediaPlayer" by GTK / WPE runtimes
  MediaStop = 157,
  MediaTrackNext = 158,
  MediaTrackPrevious = 159,
  Power = 160,
  Sleep = 161,
  AudioVolumeDown = 162,
  AudioVolumeMute = 163,
  AudioVolumeUp = 164,
  WakeUp = 165,

  // Legacy, non-standard and special keys
  Again = 166,
  Copy = 167,
  Cut = 168,
  Find = 169,
  Open = 170,
  Paste = 171,
  Props = 172,
  Select = 173,
  Undo = 174,

  // Gamepad buttons
  Gamepad0 = 175,
  Gamepad1 = 176,
  Gamepad2 = 177,
  Gamepad3 = 178,
  Gamepad4 = 179,
  Gamepad5 = 180,
  Gamepad6 = 181,
  Gamepad7 = 182,
  Gamepad8 = 183,
  Gamepad9 = 184,
  Gamepad10 = 185,
  Gamepad11 = 186,
  Gamepad12 = 187,
  Gamepad13 = 188,
  Gamepad14 = 189,
  Gamepad15 = 190,
  Gamepad16 = 191,
  Gamepad17 = 192,
  Gamepad18 = 193,
  Gamepad19 = 194,

  // Browser / vendor specific keys
  BrightnessDown = 195,
  BrightnessUp = 196,
  DisplayToggleIntExt = 197,
  KeyboardLayoutSelect = 198,
  LaunchAssistant = 199,
  LaunchControlPanel = 200,
  LaunchScreenSaver = 201,
  MailForward = 202,
  MailReply = 203,
  MailSend = 204,
  MediaFastForward = 205,
  MediaPause = 206,
  MediaPlay = 207,
  MediaRecord = 208,
  MediaRewind = 209,
  PrivacyScreenToggle = 210,
  SelectTask = 211,
  ShowAllWindows = 212,
  ZoomToggle = 213,
};

/// Number of distinct KeyCode values.
inline constexpr std::size_t kKeyCodeCount = 214;

/**
 * @enum KeyCodeClass
 * @brief Category of a KeyCode, used to group keys for presentation.
 */
enum class KeyCodeClass : uint8_t {
  WritingSystem, ///< Keys that produce characters (letters, digits, symbols)
  Functional,    ///< Modifiers, Enter, Space, Tab and IME mode keys
  ControlPad,    ///< Insert / Delete / Home / End / Page Up / Page Down / Help
  ArrowPad,      ///< The four arrow keys
  Numpad,        ///< Numeric keypad, including Num Lock
  Function,      ///< Escape, F1-F24, Fn and the Print / Scroll / Pause block
  Media,         ///< Media transport, volume, browser and launch keys
  Legacy,        ///< Copy / Cut / Paste / Undo style keys on old keyboards
  Gamepad,       ///< Gamepad buttons 0-19
  NonStandard,   ///< Browser or vendor specific keys
};

/// Number of distinct KeyCodeClass values.
inline constexpr std::size_t kKeyCodeClassCount = 10;

/**
 * @brief Every KeyCode, once each, in declaration order.
 * @return const std::array<KeyCode, kKeyCodeCount>& Process-wide table.
 */
HOTKEY_IO_API const std::array<KeyCode, kKeyCodeCount> &allKeyCodes();

/**
 * @brief Classify a key.
 *
 * Total: every KeyCode belongs to exactly one class.
 *
 * @param key Key to classify.
 * @return KeyCodeClass The key's category.
 */
HOTKEY_IO_API KeyCodeClass classify(KeyCode key) noexcept;

/**
 * @brief Name of a KeyCodeClass (e.g., "WritingSystem").
 * @param keyClass Class to name.
 * @return const char* Statically allocated name.
 */
HOTKEY_IO_API const char *keyCodeClassToString(KeyCodeClass keyClass) noexcept;

/**
 * @brief Convert a KeyCode to its canonical textual name.
 *
 * This is the serialization form of a key: exactly one spelling per key,
 * which `stringToKeyCode` always accepts.
 *
 * @param key Key to convert.
 * @return std::string Canonical name (e.g., "KeyA", "Digit7", "ArrowUp").
 */
HOTKEY_IO_API std::string keyCodeToString(KeyCode key);

/**
 * @brief Parse a textual key name into a KeyCode.
 *
 * Accepts the canonical name plus a fixed set of aliases emitted by older or
 * non-conforming runtimes ("A".."Z", "0".."9", "OSLeft", "OSRight",
 * "VolumeUp", "VolumeDown", "VolumeMute", "LaunchMediaPlayer"). Matching is
 * exact and case-sensitive; no whitespace is trimmed.
 *
 * @param str Input string.
 * @return std::optional<KeyCode> The key, or nullopt if @p str is not a
 * recognized name.
 */
HOTKEY_IO_API std::optional<KeyCode> stringToKeyCode(const std::string &str);

/**
 * @brief The non-canonical spellings accepted by `stringToKeyCode`.
 *
 * Each alias maps to exactly one key and never collides with a canonical
 * name. Aliases are input-only; `keyCodeToString` never returns one.
 *
 * @return const std::vector<std::pair<std::string, KeyCode>>& Alias table.
 */
HOTKEY_IO_API const std::vector<std::pair<std::string, KeyCode>> &
keyCodeAliases();

/**
 * @brief Display label for a key on a US reference layout.
 *
 * Never empty. Writing system keys are labelled with the character they
 * produce on a US keyboard; keys with a common pictogram (arrows, media
 * transport, volume) use that glyph. The returned string is UTF-8.
 *
 * @param key Key to label.
 * @return std::string Display label.
 */
HOTKEY_IO_API std::string keyCodeLabel(KeyCode key);

} // namespace keyboard
} // namespace io
} // namespace hotkey
