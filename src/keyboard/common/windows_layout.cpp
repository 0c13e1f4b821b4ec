/**
 * @file keyboard/common/windows_layout.cpp
 * @brief Windows keyboard layout queries.
 */

#ifdef _WIN32

#include "keyboard/common/windows_layout.hpp"

#include <hotkey-io/log.hpp>

#include <iterator>

namespace hotkey::io::keyboard::detail {

namespace {

// ToUnicodeEx flag (Windows 10 1607+): do not change keyboard state, so dead
// keys queried here do not leak into the next real keystroke.
constexpr UINT kToUnicodeNoStateChange = 0x4;

std::optional<std::string> wideToUtf8(const wchar_t *text, int len) {
  int size =
      WideCharToMultiByte(CP_UTF8, 0, text, len, nullptr, 0, nullptr, nullptr);
  if (size <= 0)
    return std::nullopt;
  std::string out(static_cast<size_t>(size), '\0');
  if (WideCharToMultiByte(CP_UTF8, 0, text, len, out.data(), size, nullptr,
                          nullptr) != size)
    return std::nullopt;
  return out;
}

} // namespace

UINT scanCodeForKey(KeyCode key) {
  switch (key) {
  case KeyCode::Backquote:
    return 0x29;
  case KeyCode::Backslash:
    return 0x2B;
  case KeyCode::Backspace:
    return 0x0E;
  case KeyCode::BracketLeft:
    return 0x1A;
  case KeyCode::BracketRight:
    return 0x1B;
  case KeyCode::Comma:
    return 0x33;
  case KeyCode::Digit0:
    return 0x0B;
  case KeyCode::Digit1:
    return 0x02;
  case KeyCode::Digit2:
    return 0x03;
  case KeyCode::Digit3:
    return 0x04;
  case KeyCode::Digit4:
    return 0x05;
  case KeyCode::Digit5:
    return 0x06;
  case KeyCode::Digit6:
    return 0x07;
  case KeyCode::Digit7:
    return 0x08;
  case KeyCode::Digit8:
    return 0x09;
  case KeyCode::Digit9:
    return 0x0A;
  case KeyCode::Equal:
    return 0x0D;
  case KeyCode::IntlBackslash:
    return 0x56;
  case KeyCode::IntlRo:
    return 0x73;
  case KeyCode::IntlYen:
    return 0x7D;
  case KeyCode::KeyA:
    return 0x1E;
  case KeyCode::KeyB:
    return 0x30;
  case KeyCode::KeyC:
    return 0x2E;
  case KeyCode::KeyD:
    return 0x20;
  case KeyCode::KeyE:
    return 0x12;
  case KeyCode::KeyF:
    return 0x21;
  case KeyCode::KeyG:
    return 0x22;
  case KeyCode::KeyH:
    return 0x23;
  case KeyCode::KeyI:
    return 0x17;
  case KeyCode::KeyJ:
    return 0x24;
  case KeyCode::KeyK:
    return 0x25;
  case KeyCode::KeyL:
    return 0x26;
  case KeyCode::KeyM:
    return 0x32;
  case KeyCode::KeyN:
    return 0x31;
  case KeyCode::KeyO:
    return 0x18;
  case KeyCode::KeyP:
    return 0x19;
  case KeyCode::KeyQ:
    return 0x10;
  case KeyCode::KeyR:
    return 0x13;
  case KeyCode::KeyS:
    return 0x1F;
  case KeyCode::KeyT:
    return 0x14;
  case KeyCode::KeyU:
    return 0x16;
  case KeyCode::KeyV:
    return 0x2F;
  case KeyCode::KeyW:
    return 0x11;
  case KeyCode::KeyX:
    return 0x2D;
  case KeyCode::KeyY:
    return 0x15;
  case KeyCode::KeyZ:
    return 0x2C;
  case KeyCode::Minus:
    return 0x0C;
  case KeyCode::Period:
    return 0x34;
  case KeyCode::Quote:
    return 0x28;
  case KeyCode::Semicolon:
    return 0x27;
  case KeyCode::Slash:
    return 0x35;
  default:
    return 0;
  }
}

std::optional<std::string> glyphForKeyWindows(KeyCode key, HKL layout) {
  UINT sc = scanCodeForKey(key);
  if (sc == 0)
    return std::nullopt;
  if (layout == nullptr)
    layout = GetKeyboardLayout(0);

  UINT vk = MapVirtualKeyExW(sc, MAPVK_VSC_TO_VK_EX, layout);
  if (vk == 0) {
    HOTKEY_IO_LOG_DEBUG("KeyboardLayout (Windows): no VK for scan code 0x%02X",
                        sc);
    return std::nullopt;
  }

  BYTE keyState[256] = {};
  wchar_t buf[8] = {};
  int ret = ToUnicodeEx(vk, sc, keyState, buf, static_cast<int>(std::size(buf)),
                        kToUnicodeNoStateChange, layout);
  // ret < 0 is a dead key; 0 means the key produces nothing
  if (ret <= 0)
    return std::nullopt;
  if (buf[0] < 0x20 || buf[0] == 0x7F)
    return std::nullopt;
  return wideToUtf8(buf, ret);
}

} // namespace hotkey::io::keyboard::detail

#endif // _WIN32
