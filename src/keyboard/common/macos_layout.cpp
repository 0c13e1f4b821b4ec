/**
 * @file keyboard/common/macos_layout.cpp
 * @brief macOS keyboard layout queries via Text Input Sources.
 */

#ifdef __APPLE__

#include "keyboard/common/macos_layout.hpp"

#include <hotkey-io/log.hpp>

namespace hotkey::io::keyboard::detail {

CGKeyCode macKeyCodeForKey(KeyCode key) {
  switch (key) {
  case KeyCode::Backquote:
    return kVK_ANSI_Grave;
  case KeyCode::Backslash:
    return kVK_ANSI_Backslash;
  case KeyCode::Backspace:
    return kVK_Delete;
  case KeyCode::BracketLeft:
    return kVK_ANSI_LeftBracket;
  case KeyCode::BracketRight:
    return kVK_ANSI_RightBracket;
  case KeyCode::Comma:
    return kVK_ANSI_Comma;
  case KeyCode::Digit0:
    return kVK_ANSI_0;
  case KeyCode::Digit1:
    return kVK_ANSI_1;
  case KeyCode::Digit2:
    return kVK_ANSI_2;
  case KeyCode::Digit3:
    return kVK_ANSI_3;
  case KeyCode::Digit4:
    return kVK_ANSI_4;
  case KeyCode::Digit5:
    return kVK_ANSI_5;
  case KeyCode::Digit6:
    return kVK_ANSI_6;
  case KeyCode::Digit7:
    return kVK_ANSI_7;
  case KeyCode::Digit8:
    return kVK_ANSI_8;
  case KeyCode::Digit9:
    return kVK_ANSI_9;
  case KeyCode::Equal:
    return kVK_ANSI_Equal;
  case KeyCode::IntlBackslash:
    return kVK_ISO_Section;
  case KeyCode::IntlRo:
    return kVK_JIS_Underscore;
  case KeyCode::IntlYen:
    return kVK_JIS_Yen;
  case KeyCode::KeyA:
    return kVK_ANSI_A;
  case KeyCode::KeyB:
    return kVK_ANSI_B;
  case KeyCode::KeyC:
    return kVK_ANSI_C;
  case KeyCode::KeyD:
    return kVK_ANSI_D;
  case KeyCode::KeyE:
    return kVK_ANSI_E;
  case KeyCode::KeyF:
    return kVK_ANSI_F;
  case KeyCode::KeyG:
    return kVK_ANSI_G;
  case KeyCode::KeyH:
    return kVK_ANSI_H;
  case KeyCode::KeyI:
    return kVK_ANSI_I;
  case KeyCode::KeyJ:
    return kVK_ANSI_J;
  case KeyCode::KeyK:
    return kVK_ANSI_K;
  case KeyCode::KeyL:
    return kVK_ANSI_L;
  case KeyCode::KeyM:
    return kVK_ANSI_M;
  case KeyCode::KeyN:
    return kVK_ANSI_N;
  case KeyCode::KeyO:
    return kVK_ANSI_O;
  case KeyCode::KeyP:
    return kVK_ANSI_P;
  case KeyCode::KeyQ:
    return kVK_ANSI_Q;
  case KeyCode::KeyR:
    return kVK_ANSI_R;
  case KeyCode::KeyS:
    return kVK_ANSI_S;
  case KeyCode::KeyT:
    return kVK_ANSI_T;
  case KeyCode::KeyU:
    return kVK_ANSI_U;
  case KeyCode::KeyV:
    return kVK_ANSI_V;
  case KeyCode::KeyW:
    return kVK_ANSI_W;
  case KeyCode::KeyX:
    return kVK_ANSI_X;
  case KeyCode::KeyY:
    return kVK_ANSI_Y;
  case KeyCode::KeyZ:
    return kVK_ANSI_Z;
  case KeyCode::Minus:
    return kVK_ANSI_Minus;
  case KeyCode::Period:
    return kVK_ANSI_Period;
  case KeyCode::Quote:
    return kVK_ANSI_Quote;
  case KeyCode::Semicolon:
    return kVK_ANSI_Semicolon;
  case KeyCode::Slash:
    return kVK_ANSI_Slash;
  default:
    return kMacOSInvalidKeyCode;
  }
}

std::optional<std::string> glyphForKeyMacOS(KeyCode key) {
  CGKeyCode code = macKeyCodeForKey(key);
  if (code == kMacOSInvalidKeyCode)
    return std::nullopt;

  TISInputSourceRef source = TISCopyCurrentKeyboardLayoutInputSource();
  if (!source) {
    HOTKEY_IO_LOG_DEBUG("KeyboardLayout (macOS): no current input source");
    return std::nullopt;
  }
  CFDataRef layoutData = static_cast<CFDataRef>(
      TISGetInputSourceProperty(source, kTISPropertyUnicodeKeyLayoutData));
  if (!layoutData) {
    CFRelease(source);
    return std::nullopt;
  }
  const UCKeyboardLayout *layout =
      reinterpret_cast<const UCKeyboardLayout *>(CFDataGetBytePtr(layoutData));

  UInt32 deadKeyState = 0;
  UniChar chars[8];
  UniCharCount len = 0;
  OSStatus status = UCKeyTranslate(
      layout, code, kUCKeyActionDisplay, 0, LMGetKbdType(),
      kUCKeyTranslateNoDeadKeysMask, &deadKeyState,
      sizeof(chars) / sizeof(chars[0]), &len, chars);
  CFRelease(source);

  if (status != noErr || len == 0)
    return std::nullopt;
  if (chars[0] < 0x20 || chars[0] == 0x7F)
    return std::nullopt;

  CFStringRef str =
      CFStringCreateWithCharacters(kCFAllocatorDefault, chars, len);
  if (!str)
    return std::nullopt;
  char buf[64];
  bool ok = CFStringGetCString(str, buf, sizeof(buf), kCFStringEncodingUTF8);
  CFRelease(str);
  if (!ok)
    return std::nullopt;
  return std::string(buf);
}

} // namespace hotkey::io::keyboard::detail

#endif // __APPLE__
