/**
 * @file keyboard/common/key_utils.cpp
 * @brief Canonical names and name parsing for KeyCode.
 */

#include <hotkey-io/keyboard/common.hpp>
#include <hotkey-io/log.hpp>

#include <cctype>
#include <cstdio>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace hotkey {
namespace io {
namespace keyboard {

namespace {

// Escape input for debug logging so control characters (e.g., newline)
// don't break log lines. Non-printable bytes are escaped as common sequences
// (\\n, \\t) or as \\xHH.
std::string escapeForLog(const std::string &input) {
  std::string out;
  out.reserve(input.size() * 2);
  for (unsigned char c : input) {
    switch (c) {
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (std::isprint(c)) {
        out += static_cast<char>(c);
      } else {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "\\x%02X", c);
        out += buf;
      }
    }
  }
  return out;
}

const char *canonicalName(KeyCode key) {
  switch (key) {
  case KeyCode::Backquote:
    return "Backquote";
  case KeyCode::Backslash:
    return "Backslash";
  case KeyCode::Backspace:
    return "Backspace";
  case KeyCode::BracketLeft:
    return "BracketLeft";
  case KeyCode::BracketRight:
    return "BracketRight";
  case KeyCode::Comma:
    return "Comma";
  case KeyCode::Digit0:
    return "Digit0";
  case KeyCode::Digit1:
    return "Digit1";
  case KeyCode::Digit2:
    return "Digit2";
  case KeyCode::Digit3:
    return "Digit3";
  case KeyCode::Digit4:
    return "Digit4";
  case KeyCode::Digit5:
    return "Digit5";
  case KeyCode::Digit6:
    return "Digit6";
  case KeyCode::Digit7:
    return "Digit7";
  case KeyCode::Digit8:
    return "Digit8";
  case KeyCode::Digit9:
    return "Digit9";
  case KeyCode::Equal:
    return "Equal";
  case KeyCode::IntlBackslash:
    return "IntlBackslash";
  case KeyCode::IntlRo:
    return "IntlRo";
  case KeyCode::IntlYen:
    return "IntlYen";
  case KeyCode::KeyA:
    return "KeyA";
  case KeyCode::KeyB:
    return "KeyB";
  case KeyCode::KeyC:
    return "KeyC";
  case KeyCode::KeyD:
    return "KeyD";
  case KeyCode::KeyE:
    return "KeyE";
  case KeyCode::KeyF:
    return "KeyF";
  case KeyCode::KeyG:
    return "KeyG";
  case KeyCode::KeyH:
    return "KeyH";
  case KeyCode::KeyI:
    return "KeyI";
  case KeyCode::KeyJ:
    return "KeyJ";
  case KeyCode::KeyK:
    return "KeyK";
  case KeyCode::KeyL:
    return "KeyL";
  case KeyCode::KeyM:
    return "KeyM";
  case KeyCode::KeyN:
    return "KeyN";
  case KeyCode::KeyO:
    return "KeyO";
  case KeyCode::KeyP:
    return "KeyP";
  case KeyCode::KeyQ:
    return "KeyQ";
  case KeyCode::KeyR:
    return "KeyR";
  case KeyCode::KeyS:
    return "KeyS";
  case KeyCode::KeyT:
    return "KeyT";
  case KeyCode::KeyU:
    return "KeyU";
  case KeyCode::KeyV:
    return "KeyV";
  case KeyCode::KeyW:
    return "KeyW";
  case KeyCode::KeyX:
    return "KeyX";
  case KeyCode::KeyY:
    return "KeyY";
  case KeyCode::KeyZ:
    return "KeyZ";
  case KeyCode::Minus:
    return "Minus";
  case KeyCode::Period:
    return "Period";
  case KeyCode::Quote:
    return "Quote";
  case KeyCode::Semicolon:
    return "Semicolon";
  case KeyCode::Slash:
    return "Slash";
  case KeyCode::AltLeft:
    return "AltLeft";
  case KeyCode::AltRight:
    return "AltRight";
  case KeyCode::CapsLock:
    return "CapsLock";
  case KeyCode::ContextMenu:
    return "ContextMenu";
  case KeyCode::ControlLeft:
    return "ControlLeft";
  case KeyCode::ControlRight:
    return "ControlRight";
  case KeyCode::Enter:
    return "Enter";
  case KeyCode::MetaLeft:
    return "MetaLeft";
  case KeyCode::MetaRight:
    return "MetaRight";
  case KeyCode::ShiftLeft:
    return "ShiftLeft";
  case KeyCode::ShiftRight:
    return "ShiftRight";
  case KeyCode::Space:
    return "Space";
  case KeyCode::Tab:
    return "Tab";
  case KeyCode::Convert:
    return "Convert";
  case KeyCode::KanaMode:
    return "KanaMode";
  case KeyCode::Lang1:
    return "Lang1";
  case KeyCode::Lang2:
    return "Lang2";
  case KeyCode::Lang3:
    return "Lang3";
  case KeyCode::Lang4:
    return "Lang4";
  case KeyCode::Lang5:
    return "Lang5";
  case KeyCode::NonConvert:
    return "NonConvert";
  case KeyCode::Delete:
    return "Delete";
  case KeyCode::End:
    return "End";
  case KeyCode::Help:
    return "Help";
  case KeyCode::Home:
    return "Home";
  case KeyCode::Insert:
    return "Insert";
  case KeyCode::PageDown:
    return "PageDown";
  case KeyCode::PageUp:
    return "PageUp";
  case KeyCode::ArrowDown:
    return "ArrowDown";
  case KeyCode::ArrowLeft:
    return "ArrowLeft";
  case KeyCode::ArrowRight:
    return "ArrowRight";
  case KeyCode::ArrowUp:
    return "ArrowUp";
  case KeyCode::NumLock:
    return "NumLock";
  case KeyCode::Numpad0:
    return "Numpad0";
  case KeyCode::Numpad1:
    return "Numpad1";
  case KeyCode::Numpad2:
    return "Numpad2";
  case KeyCode::Numpad3:
    return "Numpad3";
  case KeyCode::Numpad4:
    return "Numpad4";
  case KeyCode::Numpad5:
    return "Numpad5";
  case KeyCode::Numpad6:
    return "Numpad6";
  case KeyCode::Numpad7:
    return "Numpad7";
  case KeyCode::Numpad8:
    return "Numpad8";
  case KeyCode::Numpad9:
    return "Numpad9";
  case KeyCode::NumpadAdd:
    return "NumpadAdd";
  case KeyCode::NumpadBackspace:
    return "NumpadBackspace";
  case KeyCode::NumpadClear:
    return "NumpadClear";
  case KeyCode::NumpadClearEntry:
    return "NumpadClearEntry";
  case KeyCode::NumpadComma:
    return "NumpadComma";
  case KeyCode::NumpadDecimal:
    return "NumpadDecimal";
  case KeyCode::NumpadDivide:
    return "NumpadDivide";
  case KeyCode::NumpadEnter:
    return "NumpadEnter";
  case KeyCode::NumpadEqual:
    return "NumpadEqual";
  case KeyCode::NumpadHash:
    return "NumpadHash";
  case KeyCode::NumpadMemoryAdd:
    return "NumpadMemoryAdd";
  case KeyCode::NumpadMemoryClear:
    return "NumpadMemoryClear";
  case KeyCode::NumpadMemoryRecall:
    return "NumpadMemoryRecall";
  case KeyCode::NumpadMemoryStore:
    return "NumpadMemoryStore";
  case KeyCode::NumpadMemorySubtract:
    return "NumpadMemorySubtract";
  case KeyCode::NumpadMultiply:
    return "NumpadMultiply";
  case KeyCode::NumpadParenLeft:
    return "NumpadParenLeft";
  case KeyCode::NumpadParenRight:
    return "NumpadParenRight";
  case KeyCode::NumpadStar:
    return "NumpadStar";
  case KeyCode::NumpadSubtract:
    return "NumpadSubtract";
  case KeyCode::Escape:
    return "Escape";
  case KeyCode::F1:
    return "F1";
  case KeyCode::F2:
    return "F2";
  case KeyCode::F3:
    return "F3";
  case KeyCode::F4:
    return "F4";
  case KeyCode::F5:
    return "F5";
  case KeyCode::F6:
    return "F6";
  case KeyCode::F7:
    return "F7";
  case KeyCode::F8:
    return "F8";
  case KeyCode::F9:
    return "F9";
  case KeyCode::F10:
    return "F10";
  case KeyCode::F11:
    return "F11";
  case KeyCode::F12:
    return "F12";
  case KeyCode::F13:
    return "F13";
  case KeyCode::F14:
    return "F14";
  case KeyCode::F15:
    return "F15";
  case KeyCode::F16:
    return "F16";
  case KeyCode::F17:
    return "F17";
  case KeyCode::F18:
    return "F18";
  case KeyCode::F19:
    return "F19";
  case KeyCode::F20:
    return "F20";
  case KeyCode::F21:
    return "F21";
  case KeyCode::F22:
    return "F22";
  case KeyCode::F23:
    return "F23";
  case KeyCode::F24:
    return "F24";
  case KeyCode::Fn:
    return "Fn";
  case KeyCode::FnLock:
    return "FnLock";
  case KeyCode::PrintScreen:
    return "PrintScreen";
  case KeyCode::ScrollLock:
    return "ScrollLock";
  case KeyCode::Pause:
    return "Pause";
  case KeyCode::BrowserBack:
    return "BrowserBack";
  case KeyCode::BrowserFavorites:
    return "BrowserFavorites";
  case KeyCode::BrowserForward:
    return "BrowserForward";
  case KeyCode::BrowserHome:
    return "BrowserHome";
  case KeyCode::BrowserRefresh:
    return "BrowserRefresh";
  case KeyCode::BrowserSearch:
    return "BrowserSearch";
  case KeyCode::BrowserStop:
    return "BrowserStop";
  case KeyCode::Eject:
    return "Eject";
  case KeyCode::LaunchApp1:
    return "LaunchApp1";
  case KeyCode::LaunchApp2:
    return "LaunchApp2";
  case KeyCode::LaunchMail:
    return "LaunchMail";
  case KeyCode::MediaPlayPause:
    return "MediaPlayPause";
  case KeyCode::MediaSelect:
    return "MediaSelect";
  case KeyCode::MediaStop:
    return "MediaStop";
  case KeyCode::MediaTrackNext:
    return "MediaTrackNext";
  case KeyCode::MediaTrackPrevious:
    return "MediaTrackPrevious";
  case KeyCode::Power:
    return "Power";
  case KeyCode::Sleep:
    return "Sleep";
  case KeyCode::AudioVolumeDown:
    return "AudioVolumeDown";
  case KeyCode::AudioVolumeMute:
    return "AudioVolumeMute";
  case KeyCode::AudioVolumeUp:
    return "AudioVolumeUp";
  case KeyCode::WakeUp:
    return "WakeUp";
  case KeyCode::Again:
    return "Again";
  case KeyCode::Copy:
    return "Copy";
  case KeyCode::Cut:
    return "Cut";
  case KeyCode::Find:
    return "Find";
  case KeyCode::Open:
    return "Open";
  case KeyCode::Paste:
    return "Paste";
  case KeyCode::Props:
    return "Props";
  case KeyCode::Select:
    return "Select";
  case KeyCode::Undo:
    return "Undo";
  case KeyCode::Gamepad0:
    return "Gamepad0";
  case KeyCode::Gamepad1:
    return "Gamepad1";
  case KeyCode::Gamepad2:
    return "Gamepad2";
  case KeyCode::Gamepad3:
    return "Gamepad3";
  case KeyCode::Gamepad4:
    return "Gamepad4";
  case KeyCode::Gamepad5:
    return "Gamepad5";
  case KeyCode::Gamepad6:
    return "Gamepad6";
  case KeyCode::Gamepad7:
    return "Gamepad7";
  case KeyCode::Gamepad8:
    return "Gamepad8";
  case KeyCode::Gamepad9:
    return "Gamepad9";
  case KeyCode::Gamepad10:
    return "Gamepad10";
  case KeyCode::Gamepad11:
    return "Gamepad11";
  case KeyCode::Gamepad12:
    return "Gamepad12";
  case KeyCode::Gamepad13:
    return "Gamepad13";
  case KeyCode::Gamepad14:
    return "Gamepad14";
  case KeyCode::Gamepad15:
    return "Gamepad15";
  case KeyCode::Gamepad16:
    return "Gamepad16";
  case KeyCode::Gamepad17:
    return "Gamepad17";
  case KeyCode::Gamepad18:
    return "Gamepad18";
  case KeyCode::Gamepad19:
    return "Gamepad19";
  case KeyCode::BrightnessDown:
    return "BrightnessDown";
  case KeyCode::BrightnessUp:
    return "BrightnessUp";
  case KeyCode::DisplayToggleIntExt:
    return "DisplayToggleIntExt";
  case KeyCode::KeyboardLayoutSelect:
    return "KeyboardLayoutSelect";
  case KeyCode::LaunchAssistant:
    return "LaunchAssistant";
  case KeyCode::LaunchControlPanel:
    return "LaunchControlPanel";
  case KeyCode::LaunchScreenSaver:
    return "LaunchScreenSaver";
  case KeyCode::MailForward:
    return "MailForward";
  case KeyCode::MailReply:
    return "MailReply";
  case KeyCode::MailSend:
    return "MailSend";
  case KeyCode::MediaFastForward:
    return "MediaFastForward";
  case KeyCode::MediaPause:
    return "MediaPause";
  case KeyCode::MediaPlay:
    return "MediaPlay";
  case KeyCode::MediaRecord:
    return "MediaRecord";
  case KeyCode::MediaRewind:
    return "MediaRewind";
  case KeyCode::PrivacyScreenToggle:
    return "PrivacyScreenToggle";
  case KeyCode::SelectTask:
    return "SelectTask";
  case KeyCode::ShowAllWindows:
    return "ShowAllWindows";
  case KeyCode::ZoomToggle:
    return "ZoomToggle";
  }
  HOTKEY_IO_LOG_ERROR("keyCodeToString: KeyCode %u is out of range",
                      static_cast<unsigned>(key));
  return "Unknown";
}

// Reverse lookup seeded with every canonical name followed by the aliases.
// Built once; read-only afterwards.
std::unordered_map<std::string, KeyCode> buildReverseMap() {
  std::unordered_map<std::string, KeyCode> rev;
  rev.reserve(kKeyCodeCount + keyCodeAliases().size());
  for (KeyCode key : allKeyCodes()) {
    rev.emplace(canonicalName(key), key);
  }
  for (const auto &[alias, key] : keyCodeAliases()) {
    auto [it, inserted] = rev.emplace(alias, key);
    if (!inserted) {
      HOTKEY_IO_LOG_ERROR("alias '%s' collides with '%s'; keeping the first",
                          alias.c_str(), canonicalName(it->second));
    }
  }
  HOTKEY_IO_LOG_DEBUG("Seeded reverse key map with %zu canonical and %zu "
                      "alias entries",
                      kKeyCodeCount, keyCodeAliases().size());
  return rev;
}

} // namespace

HOTKEY_IO_API const std::vector<std::pair<std::string, KeyCode>> &
keyCodeAliases() {
  static const std::vector<std::pair<std::string, KeyCode>> aliases = {
      // Single character shorthand for digits and letters
      {"0", KeyCode::Digit0},
      {"1", KeyCode::Digit1},
      {"2", KeyCode::Digit2},
      {"3", KeyCode::Digit3},
      {"4", KeyCode::Digit4},
      {"5", KeyCode::Digit5},
      {"6", KeyCode::Digit6},
      {"7", KeyCode::Digit7},
      {"8", KeyCode::Digit8},
      {"9", KeyCode::Digit9},
      {"A", KeyCode::KeyA},
      {"B", KeyCode::KeyB},
      {"C", KeyCode::KeyC},
      {"D", KeyCode::KeyD},
      {"E", KeyCode::KeyE},
      {"F", KeyCode::KeyF},
      {"G", KeyCode::KeyG},
      {"H", KeyCode::KeyH},
      {"I", KeyCode::KeyI},
      {"J", KeyCode::KeyJ},
      {"K", KeyCode::KeyK},
      {"L", KeyCode::KeyL},
      {"M", KeyCode::KeyM},
      {"N", KeyCode::KeyN},
      {"O", KeyCode::KeyO},
      {"P", KeyCode::KeyP},
      {"Q", KeyCode::KeyQ},
      {"R", KeyCode::KeyR},
      {"S", KeyCode::KeyS},
      {"T", KeyCode::KeyT},
      {"U", KeyCode::KeyU},
      {"V", KeyCode::KeyV},
      {"W", KeyCode::KeyW},
      {"X", KeyCode::KeyX},
      {"Y", KeyCode::KeyY},
      {"Z", KeyCode::KeyZ},
      // Firefox, Chrome < 52 and WebKit GTK / WPE report the meta keys as OS*
      {"OSLeft", KeyCode::MetaLeft},
      {"OSRight", KeyCode::MetaRight},
      // Pre-standard volume key names, still emitted by some runtimes
      {"VolumeDown", KeyCode::AudioVolumeDown},
      {"VolumeMute", KeyCode::AudioVolumeMute},
      {"VolumeUp", KeyCode::AudioVolumeUp},
      // WebKit GTK / WPE
      {"LaunchMediaPlayer", KeyCode::MediaSelect},
  };
  return aliases;
}

HOTKEY_IO_API std::string keyCodeToString(KeyCode key) {
  return canonicalName(key);
}

HOTKEY_IO_API std::optional<KeyCode> stringToKeyCode(const std::string &input) {
  static const std::unordered_map<std::string, KeyCode> rev =
      buildReverseMap();

  auto it = rev.find(input);
  if (it != rev.end()) {
    return it->second;
  }

  HOTKEY_IO_LOG_DEBUG("stringToKeyCode: unknown input='%s'",
                      escapeForLog(input).c_str());
  return std::nullopt;
}

} // namespace keyboard
} // namespace io
} // namespace hotkey
