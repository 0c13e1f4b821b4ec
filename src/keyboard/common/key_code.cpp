/**
 * @file keyboard/common/key_code.cpp
 * @brief Classification and US reference labels for KeyCode.
 *
 * Both tables are exhaustive switches without a default case so the compiler
 * (-Wswitch) flags any KeyCode that is added without a class or label.
 */

#include <hotkey-io/keyboard/common.hpp>
#include <hotkey-io/log.hpp>

namespace hotkey {
namespace io {
namespace keyboard {

static_assert(static_cast<std::size_t>(KeyCode::ZoomToggle) + 1 ==
                  kKeyCodeCount,
              "kKeyCodeCount must match the KeyCode enumeration");
static_assert(static_cast<std::size_t>(KeyCodeClass::NonStandard) + 1 ==
                  kKeyCodeClassCount,
              "kKeyCodeClassCount must match the KeyCodeClass enumeration");

HOTKEY_IO_API const std::array<KeyCode, kKeyCodeCount> &allKeyCodes() {
  static const std::array<KeyCode, kKeyCodeCount> keys = [] {
    std::array<KeyCode, kKeyCodeCount> out{};
    for (std::size_t i = 0; i < kKeyCodeCount; ++i) {
      out[i] = static_cast<KeyCode>(i);
    }
    return out;
  }();
  return keys;
}

HOTKEY_IO_API KeyCodeClass classify(KeyCode key) noexcept {
  switch (key) {
  case KeyCode::Backquote:
  case KeyCode::Backslash:
  case KeyCode::Backspace:
  case KeyCode::BracketLeft:
  case KeyCode::BracketRight:
  case KeyCode::Comma:
  case KeyCode::Digit0:
  case KeyCode::Digit1:
  case KeyCode::Digit2:
  case KeyCode::Digit3:
  case KeyCode::Digit4:
  case KeyCode::Digit5:
  case KeyCode::Digit6:
  case KeyCode::Digit7:
  case KeyCode::Digit8:
  case KeyCode::Digit9:
  case KeyCode::Equal:
  case KeyCode::IntlBackslash:
  case KeyCode::IntlRo:
  case KeyCode::IntlYen:
  case KeyCode::KeyA:
  case KeyCode::KeyB:
  case KeyCode::KeyC:
  case KeyCode::KeyD:
  case KeyCode::KeyE:
  case KeyCode::KeyF:
  case KeyCode::KeyG:
  case KeyCode::KeyH:
  case KeyCode::KeyI:
  case KeyCode::KeyJ:
  case KeyCode::KeyK:
  case KeyCode::KeyL:
  case KeyCode::KeyM:
  case KeyCode::KeyN:
  case KeyCode::KeyO:
  case KeyCode::KeyP:
  case KeyCode::KeyQ:
  case KeyCode::KeyR:
  case KeyCode::KeyS:
  case KeyCode::KeyT:
  case KeyCode::KeyU:
  case KeyCode::KeyV:
  case KeyCode::KeyW:
  case KeyCode::KeyX:
  case KeyCode::KeyY:
  case KeyCode::KeyZ:
  case KeyCode::Minus:
  case KeyCode::Period:
  case KeyCode::Quote:
  case KeyCode::Semicolon:
  case KeyCode::Slash:
    return KeyCodeClass::WritingSystem;

  case KeyCode::AltLeft:
  case KeyCode::AltRight:
  case KeyCode::CapsLock:
  case KeyCode::ContextMenu:
  case KeyCode::ControlLeft:
  case KeyCode::ControlRight:
  case KeyCode::Enter:
  case KeyCode::MetaLeft:
  case KeyCode::MetaRight:
  case KeyCode::ShiftLeft:
  case KeyCode::ShiftRight:
  case KeyCode::Space:
  case KeyCode::Tab:
  case KeyCode::Convert:
  case KeyCode::KanaMode:
  case KeyCode::Lang1:
  case KeyCode::Lang2:
  case KeyCode::Lang3:
  case KeyCode::Lang4:
  case KeyCode::Lang5:
  case KeyCode::NonConvert:
    return KeyCodeClass::Functional;

  case KeyCode::Delete:
  case KeyCode::End:
  case KeyCode::Help:
  case KeyCode::Home:
  case KeyCode::Insert:
  case KeyCode::PageDown:
  case KeyCode::PageUp:
    return KeyCodeClass::ControlPad;

  case KeyCode::ArrowDown:
  case KeyCode::ArrowLeft:
  case KeyCode::ArrowRight:
  case KeyCode::ArrowUp:
    return KeyCodeClass::ArrowPad;

  case KeyCode::NumLock:
  case KeyCode::Numpad0:
  case KeyCode::Numpad1:
  case KeyCode::Numpad2:
  case KeyCode::Numpad3:
  case KeyCode::Numpad4:
  case KeyCode::Numpad5:
  case KeyCode::Numpad6:
  case KeyCode::Numpad7:
  case KeyCode::Numpad8:
  case KeyCode::Numpad9:
  case KeyCode::NumpadAdd:
  case KeyCode::NumpadBackspace:
  case KeyCode::NumpadClear:
  case KeyCode::NumpadClearEntry:
  case KeyCode::NumpadComma:
  case KeyCode::NumpadDecimal:
  case KeyCode::NumpadDivide:
  case KeyCode::NumpadEnter:
  case KeyCode::NumpadEqual:
  case KeyCode::NumpadHash:
  case KeyCode::NumpadMemoryAdd:
  case KeyCode::NumpadMemoryClear:
  case KeyCode::NumpadMemoryRecall:
  case KeyCode::NumpadMemoryStore:
  case KeyCode::NumpadMemorySubtract:
  case KeyCode::NumpadMultiply:
  case KeyCode::NumpadParenLeft:
  case KeyCode::NumpadParenRight:
  case KeyCode::NumpadStar:
  case KeyCode::NumpadSubtract:
    return KeyCodeClass::Numpad;

  case KeyCode::Escape:
  case KeyCode::F1:
  case KeyCode::F2:
  case KeyCode::F3:
  case KeyCode::F4:
  case KeyCode::F5:
  case KeyCode::F6:
  case KeyCode::F7:
  case KeyCode::F8:
  case KeyCode::F9:
  case KeyCode::F10:
  case KeyCode::F11:
  case KeyCode::F12:
  case KeyCode::F13:
  case KeyCode::F14:
  case KeyCode::F15:
  case KeyCode::F16:
  case KeyCode::F17:
  case KeyCode::F18:
  case KeyCode::F19:
  case KeyCode::F20:
  case KeyCode::F21:
  case KeyCode::F22:
  case KeyCode::F23:
  case KeyCode::F24:
  case KeyCode::Fn:
  case KeyCode::FnLock:
  case KeyCode::PrintScreen:
  case KeyCode::ScrollLock:
  case KeyCode::Pause:
    return KeyCodeClass::Function;

  case KeyCode::BrowserBack:
  case KeyCode::BrowserFavorites:
  case KeyCode::BrowserForward:
  case KeyCode::BrowserHome:
  case KeyCode::BrowserRefresh:
  case KeyCode::BrowserSearch:
  case KeyCode::BrowserStop:
  case KeyCode::Eject:
  case KeyCode::LaunchApp1:
  case KeyCode::LaunchApp2:
  case KeyCode::LaunchMail:
  case KeyCode::MediaPlayPause:
  case KeyCode::MediaSelect:
  case KeyCode::MediaStop:
  case KeyCode::MediaTrackNext:
  case KeyCode::MediaTrackPrevious:
  case KeyCode::Power:
  case KeyCode::Sleep:
  case KeyCode::AudioVolumeDown:
  case KeyCode::AudioVolumeMute:
  case KeyCode::AudioVolumeUp:
  case KeyCode::WakeUp:
    return KeyCodeClass::Media;

  case KeyCode::Again:
  case KeyCode::Copy:
  case KeyCode::Cut:
  case KeyCode::Find:
  case KeyCode::Open:
  case KeyCode::Paste:
  case KeyCode::Props:
  case KeyCode::Select:
  case KeyCode::Undo:
    return KeyCodeClass::Legacy;

  case KeyCode::Gamepad0:
  case KeyCode::Gamepad1:
  case KeyCode::Gamepad2:
  case KeyCode::Gamepad3:
  case KeyCode::Gamepad4:
  case KeyCode::Gamepad5:
  case KeyCode::Gamepad6:
  case KeyCode::Gamepad7:
  case KeyCode::Gamepad8:
  case KeyCode::Gamepad9:
  case KeyCode::Gamepad10:
  case KeyCode::Gamepad11:
  case KeyCode::Gamepad12:
  case KeyCode::Gamepad13:
  case KeyCode::Gamepad14:
  case KeyCode::Gamepad15:
  case KeyCode::Gamepad16:
  case KeyCode::Gamepad17:
  case KeyCode::Gamepad18:
  case KeyCode::Gamepad19:
    return KeyCodeClass::Gamepad;

  case KeyCode::BrightnessDown:
  case KeyCode::BrightnessUp:
  case KeyCode::DisplayToggleIntExt:
  case KeyCode::KeyboardLayoutSelect:
  case KeyCode::LaunchAssistant:
  case KeyCode::LaunchControlPanel:
  case KeyCode::LaunchScreenSaver:
  case KeyCode::MailForward:
  case KeyCode::MailReply:
  case KeyCode::MailSend:
  case KeyCode::MediaFastForward:
  case KeyCode::MediaPause:
  case KeyCode::MediaPlay:
  case KeyCode::MediaRecord:
  case KeyCode::MediaRewind:
  case KeyCode::PrivacyScreenToggle:
  case KeyCode::SelectTask:
  case KeyCode::ShowAllWindows:
  case KeyCode::ZoomToggle:
    return KeyCodeClass::NonStandard;
  }
  // Only reachable for integers cast into KeyCode outside its range.
  HOTKEY_IO_LOG_ERROR("classify: KeyCode %u is out of range",
                      static_cast<unsigned>(key));
  return KeyCodeClass::NonStandard;
}

HOTKEY_IO_API const char *keyCodeClassToString(KeyCodeClass keyClass) noexcept {
  switch (keyClass) {
  case KeyCodeClass::WritingSystem:
    return "WritingSystem";
  case KeyCodeClass::Functional:
    return "Functional";
  case KeyCodeClass::ControlPad:
    return "ControlPad";
  case KeyCodeClass::ArrowPad:
    return "ArrowPad";
  case KeyCodeClass::Numpad:
    return "Numpad";
  case KeyCodeClass::Function:
    return "Function";
  case KeyCodeClass::Media:
    return "Media";
  case KeyCodeClass::Legacy:
    return "Legacy";
  case KeyCodeClass::Gamepad:
    return "Gamepad";
  case KeyCodeClass::NonStandard:
    return "NonStandard";
  }
  return "Unknown";
}

namespace {

const char *labelFor(KeyCode key) {
  switch (key) {
  case KeyCode::Backquote:
    return "`";
  case KeyCode::Backslash:
    return "\\";
  case KeyCode::Backspace:
    return "⌫";
  case KeyCode::BracketLeft:
    return "[";
  case KeyCode::BracketRight:
    return "]";
  case KeyCode::Comma:
    return ",";
  case KeyCode::Digit0:
    return "0";
  case KeyCode::Digit1:
    return "1";
  case KeyCode::Digit2:
    return "2";
  case KeyCode::Digit3:
    return "3";
  case KeyCode::Digit4:
    return "4";
  case KeyCode::Digit5:
    return "5";
  case KeyCode::Digit6:
    return "6";
  case KeyCode::Digit7:
    return "7";
  case KeyCode::Digit8:
    return "8";
  case KeyCode::Digit9:
    return "9";
  case KeyCode::Equal:
    return "=";
  case KeyCode::IntlBackslash:
    return "International Backslash";
  case KeyCode::IntlRo:
    return "ろ";
  case KeyCode::IntlYen:
    return "¥";
  case KeyCode::KeyA:
    return "A";
  case KeyCode::KeyB:
    return "B";
  case KeyCode::KeyC:
    return "C";
  case KeyCode::KeyD:
    return "D";
  case KeyCode::KeyE:
    return "E";
  case KeyCode::KeyF:
    return "F";
  case KeyCode::KeyG:
    return "G";
  case KeyCode::KeyH:
    return "H";
  case KeyCode::KeyI:
    return "I";
  case KeyCode::KeyJ:
    return "J";
  case KeyCode::KeyK:
    return "K";
  case KeyCode::KeyL:
    return "L";
  case KeyCode::KeyM:
    return "M";
  case KeyCode::KeyN:
    return "N";
  case KeyCode::KeyO:
    return "O";
  case KeyCode::KeyP:
    return "P";
  case KeyCode::KeyQ:
    return "Q";
  case KeyCode::KeyR:
    return "R";
  case KeyCode::KeyS:
    return "S";
  case KeyCode::KeyT:
    return "T";
  case KeyCode::KeyU:
    return "U";
  case KeyCode::KeyV:
    return "V";
  case KeyCode::KeyW:
    return "W";
  case KeyCode::KeyX:
    return "X";
  case KeyCode::KeyY:
    return "Y";
  case KeyCode::KeyZ:
    return "Z";
  case KeyCode::Minus:
    return "-";
  case KeyCode::Period:
    return ".";
  case KeyCode::Quote:
    return "'";
  case KeyCode::Semicolon:
    return ";";
  case KeyCode::Slash:
    return "/";
  case KeyCode::AltLeft:
    return "Alt Left";
  case KeyCode::AltRight:
    return "Alt Right";
  case KeyCode::CapsLock:
    return "⇪";
  case KeyCode::ContextMenu:
    return "Context Menu";
  case KeyCode::ControlLeft:
    return "Control Left";
  case KeyCode::ControlRight:
    return "Control Right";
  case KeyCode::Enter:
    return "↵";
  case KeyCode::MetaLeft:
    return "⌘ Left";
  case KeyCode::MetaRight:
    return "⌘ Right";
  case KeyCode::ShiftLeft:
    return "⇧ Left";
  case KeyCode::ShiftRight:
    return "⇧ Right";
  case KeyCode::Space:
    return "Space";
  case KeyCode::Tab:
    return "⇥";
  case KeyCode::Convert:
    return "変換";
  case KeyCode::KanaMode:
    return "カタカナ/ひらがな/ローマ字";
  case KeyCode::Lang1:
    return "한/영 かな";
  case KeyCode::Lang2:
    return "한자 英数";
  case KeyCode::Lang3:
    return "カタカナ";
  case KeyCode::Lang4:
    return "ひらがな";
  case KeyCode::Lang5:
    return "半角/全角/漢字";
  case KeyCode::NonConvert:
    return "無変換";
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
    return "Page Down";
  case KeyCode::PageUp:
    return "Page Up";
  case KeyCode::ArrowDown:
    return "↓";
  case KeyCode::ArrowLeft:
    return "←";
  case KeyCode::ArrowRight:
    return "→";
  case KeyCode::ArrowUp:
    return "↑";
  case KeyCode::NumLock:
    return "Num Lock";
  case KeyCode::Numpad0:
    return "Numpad 0";
  case KeyCode::Numpad1:
    return "Numpad 1";
  case KeyCode::Numpad2:
    return "Numpad 2";
  case KeyCode::Numpad3:
    return "Numpad 3";
  case KeyCode::Numpad4:
    return "Numpad 4";
  case KeyCode::Numpad5:
    return "Numpad 5";
  case KeyCode::Numpad6:
    return "Numpad 6";
  case KeyCode::Numpad7:
    return "Numpad 7";
  case KeyCode::Numpad8:
    return "Numpad 8";
  case KeyCode::Numpad9:
    return "Numpad 9";
  case KeyCode::NumpadAdd:
    return "Numpad +";
  case KeyCode::NumpadBackspace:
    return "Numpad ⌫";
  case KeyCode::NumpadClear:
    return "Numpad C";
  case KeyCode::NumpadClearEntry:
    return "Numpad CE";
  case KeyCode::NumpadComma:
    return "Numpad ,";
  case KeyCode::NumpadDecimal:
    return "Numpad .";
  case KeyCode::NumpadDivide:
    return "Numpad /";
  case KeyCode::NumpadEnter:
    return "Numpad ↵";
  case KeyCode::NumpadEqual:
    return "Numpad =";
  case KeyCode::NumpadHash:
    return "Numpad #";
  case KeyCode::NumpadMemoryAdd:
    return "Numpad M+";
  case KeyCode::NumpadMemoryClear:
    return "Numpad MC";
  case KeyCode::NumpadMemoryRecall:
    return "Numpad MR";
  case KeyCode::NumpadMemoryStore:
    return "Numpad MS";
  case KeyCode::NumpadMemorySubtract:
    return "Numpad M-";
  case KeyCode::NumpadMultiply:
    return "Numpad *";
  case KeyCode::NumpadParenLeft:
    return "Numpad (";
  case KeyCode::NumpadParenRight:
    return "Numpad )";
  case KeyCode::NumpadStar:
    return "Numpad * (Star)";
  case KeyCode::NumpadSubtract:
    return "Numpad -";
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
    return "Print Screen";
  case KeyCode::ScrollLock:
    return "Scroll Lock";
  case KeyCode::Pause:
    return "Pause Break";
  case KeyCode::BrowserBack:
    return "Browser ⏮";
  case KeyCode::BrowserFavorites:
    return "Browser Favorites";
  case KeyCode::BrowserForward:
    return "Browser ⏭";
  case KeyCode::BrowserHome:
    return "Browser 🏠";
  case KeyCode::BrowserRefresh:
    return "Browser Refresh";
  case KeyCode::BrowserSearch:
    return "Browser Search";
  case KeyCode::BrowserStop:
    return "Browser Stop";
  case KeyCode::Eject:
    return "⏏";
  case KeyCode::LaunchApp1:
    return "Launch App 1";
  case KeyCode::LaunchApp2:
    return "Launch App 2";
  case KeyCode::LaunchMail:
    return "Launch Mail";
  case KeyCode::MediaPlayPause:
    return "⏯";
  case KeyCode::MediaSelect:
    return "Media Select";
  case KeyCode::MediaStop:
    return "◼";
  case KeyCode::MediaTrackNext:
    return "⏭";
  case KeyCode::MediaTrackPrevious:
    return "⏮";
  case KeyCode::Power:
    return "Power";
  case KeyCode::Sleep:
    return "Sleep";
  case KeyCode::AudioVolumeDown:
    return "🔉";
  case KeyCode::AudioVolumeMute:
    return "🔇";
  case KeyCode::AudioVolumeUp:
    return "🔊";
  case KeyCode::WakeUp:
    return "Wake Up";
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
    return "Gamepad 0";
  case KeyCode::Gamepad1:
    return "Gamepad 1";
  case KeyCode::Gamepad2:
    return "Gamepad 2";
  case KeyCode::Gamepad3:
    return "Gamepad 3";
  case KeyCode::Gamepad4:
    return "Gamepad 4";
  case KeyCode::Gamepad5:
    return "Gamepad 5";
  case KeyCode::Gamepad6:
    return "Gamepad 6";
  case KeyCode::Gamepad7:
    return "Gamepad 7";
  case KeyCode::Gamepad8:
    return "Gamepad 8";
  case KeyCode::Gamepad9:
    return "Gamepad 9";
  case KeyCode::Gamepad10:
    return "Gamepad 10";
  case KeyCode::Gamepad11:
    return "Gamepad 11";
  case KeyCode::Gamepad12:
    return "Gamepad 12";
  case KeyCode::Gamepad13:
    return "Gamepad 13";
  case KeyCode::Gamepad14:
    return "Gamepad 14";
  case KeyCode::Gamepad15:
    return "Gamepad 15";
  case KeyCode::Gamepad16:
    return "Gamepad 16";
  case KeyCode::Gamepad17:
    return "Gamepad 17";
  case KeyCode::Gamepad18:
    return "Gamepad 18";
  case KeyCode::Gamepad19:
    return "Gamepad 19";
  case KeyCode::BrightnessDown:
    return "Brightness Down";
  case KeyCode::BrightnessUp:
    return "Brightness Up";
  case KeyCode::DisplayToggleIntExt:
    return "Display Toggle Intern / Extern";
  case KeyCode::KeyboardLayoutSelect:
    return "Keyboard Layout Select";
  case KeyCode::LaunchAssistant:
    return "Launch Assistant";
  case KeyCode::LaunchControlPanel:
    return "Launch Control Panel";
  case KeyCode::LaunchScreenSaver:
    return "Launch Screen Saver";
  case KeyCode::MailForward:
    return "Mail Forward";
  case KeyCode::MailReply:
    return "Mail Reply";
  case KeyCode::MailSend:
    return "Mail Send";
  case KeyCode::MediaFastForward:
    return "⏩";
  case KeyCode::MediaPause:
    return "⏸";
  case KeyCode::MediaPlay:
    return "▶";
  case KeyCode::MediaRecord:
    return "⏺";
  case KeyCode::MediaRewind:
    return "⏪";
  case KeyCode::PrivacyScreenToggle:
    return "Privacy Screen Toggle";
  case KeyCode::SelectTask:
    return "Select Task";
  case KeyCode::ShowAllWindows:
    return "Show All Windows";
  case KeyCode::ZoomToggle:
    return "Zoom Toggle";
  }
  HOTKEY_IO_LOG_ERROR("keyCodeLabel: KeyCode %u is out of range",
                      static_cast<unsigned>(key));
  return "Unknown";
}

} // namespace

HOTKEY_IO_API std::string keyCodeLabel(KeyCode key) { return labelFor(key); }

} // namespace keyboard
} // namespace io
} // namespace hotkey
