/**
 * @file keyboard/common/linux_layout.cpp
 * @brief XKB keyboard layout queries for Linux.
 */

#if defined(__linux__)

#include "keyboard/common/linux_layout.hpp"

#include <hotkey-io/log.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <linux/input-event-codes.h>

namespace hotkey::io::keyboard::detail {

namespace {

void trim(std::string &s) {
  const char *ws = " \t\r\n";
  size_t a = s.find_first_not_of(ws);
  if (a == std::string::npos) {
    s.clear();
    return;
  }
  size_t b = s.find_last_not_of(ws);
  s = s.substr(a, b - a + 1);
}

void fillFromEnv(XkbNames &names) {
  if (const char *env = std::getenv("XKB_DEFAULT_RULES"))
    names.rules = env;
  if (const char *env = std::getenv("XKB_DEFAULT_MODEL"))
    names.model = env;
  if (const char *env = std::getenv("XKB_DEFAULT_LAYOUT"))
    names.layout = env;
  if (const char *env = std::getenv("XKB_DEFAULT_VARIANT"))
    names.variant = env;
  if (const char *env = std::getenv("XKB_DEFAULT_OPTIONS"))
    names.options = env;
}

} // namespace

void readKeyboardFile(XkbNames &names, const std::string &path) {
  std::ifstream f(path);
  if (!f)
    return;
  std::string line;
  while (std::getline(f, line)) {
    size_t comment = line.find('#');
    if (comment != std::string::npos)
      line.resize(comment);
    trim(line);
    if (line.empty())
      continue;
    size_t eq = line.find('=');
    if (eq == std::string::npos)
      continue;
    std::string key = line.substr(0, eq);
    std::string val = line.substr(eq + 1);
    trim(key);
    trim(val);
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\'')))
      val = val.substr(1, val.size() - 2);
    std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) {
      return static_cast<char>(std::toupper(c));
    });

    std::string *target = nullptr;
    if (key == "XKBRULES" || key == "XKB_DEFAULT_RULES")
      target = &names.rules;
    else if (key == "XKBMODEL" || key == "XKB_DEFAULT_MODEL")
      target = &names.model;
    else if (key == "XKBLAYOUT" || key == "XKB_DEFAULT_LAYOUT")
      target = &names.layout;
    else if (key == "XKBVARIANT" || key == "XKB_DEFAULT_VARIANT")
      target = &names.variant;
    else if (key == "XKBOPTIONS" || key == "XKB_DEFAULT_OPTIONS")
      target = &names.options;
    if (target && target->empty())
      *target = val;
  }
}

std::string layoutFromLocale(const std::string &localeIn) {
  std::string locale = localeIn;
  size_t dot = locale.find('.');
  if (dot != std::string::npos)
    locale.resize(dot);
  size_t at = locale.find('@');
  if (at != std::string::npos)
    locale.resize(at);

  std::string lang = locale;
  std::string region;
  size_t us = locale.find('_');
  if (us != std::string::npos) {
    lang = locale.substr(0, us);
    region = locale.substr(us + 1);
  }
  std::transform(lang.begin(), lang.end(), lang.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  std::transform(region.begin(), region.end(), region.begin(),
                 [](unsigned char c) {
                   return static_cast<char>(std::toupper(c));
                 });

  if (lang.empty() || lang == "c" || lang == "posix")
    return {};
  if (lang == "en")
    return (region == "GB" || region == "UK") ? "gb" : "us";
  if (lang == "pt" && region == "BR")
    return "br";
  if (lang == "de" && region == "CH")
    return "ch";
  if (lang == "da")
    return "dk";
  if (lang == "sv")
    return "se";
  if (lang == "ja")
    return "jp";
  if (lang == "ko")
    return "kr";
  // fr, de, es, it, ... share the language code with their xkb layout
  return lang;
}

XkbNames discoverXkbNames() {
  return discoverXkbNames("/etc/default/keyboard");
}

XkbNames discoverXkbNames(const std::string &keyboardFile) {
  XkbNames names;
  fillFromEnv(names);

  if (names.rules.empty() || names.model.empty() || names.layout.empty() ||
      names.variant.empty() || names.options.empty()) {
    readKeyboardFile(names, keyboardFile);
  }

  if (names.layout.empty()) {
    const char *localeEnv = std::getenv("LC_ALL");
    if (!localeEnv)
      localeEnv = std::getenv("LC_MESSAGES");
    if (!localeEnv)
      localeEnv = std::getenv("LANG");
    if (localeEnv) {
      names.layout = layoutFromLocale(localeEnv);
      HOTKEY_IO_LOG_DEBUG("KeyboardLayout (xkb): guessed layout '%s' from "
                          "locale '%s'",
                          names.layout.c_str(), localeEnv);
    }
  }
  return names;
}

int evdevCodeForKey(KeyCode key) {
  switch (key) {
  case KeyCode::Backquote:
    return KEY_GRAVE;
  case KeyCode::Backslash:
    return KEY_BACKSLASH;
  case KeyCode::Backspace:
    return KEY_BACKSPACE;
  case KeyCode::BracketLeft:
    return KEY_LEFTBRACE;
  case KeyCode::BracketRight:
    return KEY_RIGHTBRACE;
  case KeyCode::Comma:
    return KEY_COMMA;
  case KeyCode::Digit0:
    return KEY_0;
  case KeyCode::Digit1:
    return KEY_1;
  case KeyCode::Digit2:
    return KEY_2;
  case KeyCode::Digit3:
    return KEY_3;
  case KeyCode::Digit4:
    return KEY_4;
  case KeyCode::Digit5:
    return KEY_5;
  case KeyCode::Digit6:
    return KEY_6;
  case KeyCode::Digit7:
    return KEY_7;
  case KeyCode::Digit8:
    return KEY_8;
  case KeyCode::Digit9:
    return KEY_9;
  case KeyCode::Equal:
    return KEY_EQUAL;
  case KeyCode::IntlBackslash:
    return KEY_102ND;
  case KeyCode::IntlRo:
    return KEY_RO;
  case KeyCode::IntlYen:
    return KEY_YEN;
  case KeyCode::KeyA:
    return KEY_A;
  case KeyCode::KeyB:
    return KEY_B;
  case KeyCode::KeyC:
    return KEY_C;
  case KeyCode::KeyD:
    return KEY_D;
  case KeyCode::KeyE:
    return KEY_E;
  case KeyCode::KeyF:
    return KEY_F;
  case KeyCode::KeyG:
    return KEY_G;
  case KeyCode::KeyH:
    return KEY_H;
  case KeyCode::KeyI:
    return KEY_I;
  case KeyCode::KeyJ:
    return KEY_J;
  case KeyCode::KeyK:
    return KEY_K;
  case KeyCode::KeyL:
    return KEY_L;
  case KeyCode::KeyM:
    return KEY_M;
  case KeyCode::KeyN:
    return KEY_N;
  case KeyCode::KeyO:
    return KEY_O;
  case KeyCode::KeyP:
    return KEY_P;
  case KeyCode::KeyQ:
    return KEY_Q;
  case KeyCode::KeyR:
    return KEY_R;
  case KeyCode::KeyS:
    return KEY_S;
  case KeyCode::KeyT:
    return KEY_T;
  case KeyCode::KeyU:
    return KEY_U;
  case KeyCode::KeyV:
    return KEY_V;
  case KeyCode::KeyW:
    return KEY_W;
  case KeyCode::KeyX:
    return KEY_X;
  case KeyCode::KeyY:
    return KEY_Y;
  case KeyCode::KeyZ:
    return KEY_Z;
  case KeyCode::Minus:
    return KEY_MINUS;
  case KeyCode::Period:
    return KEY_DOT;
  case KeyCode::Quote:
    return KEY_APOSTROPHE;
  case KeyCode::Semicolon:
    return KEY_SEMICOLON;
  case KeyCode::Slash:
    return KEY_SLASH;
  default:
    return -1;
  }
}

XkbLayout::XkbLayout(const XkbNames &names) {
  m_ctx = xkb_context_new(XKB_CONTEXT_NO_FLAGS);
  if (!m_ctx) {
    HOTKEY_IO_LOG_ERROR("KeyboardLayout (xkb): xkb_context_new() failed");
    return;
  }

  struct xkb_rule_names rmlvo = {nullptr, nullptr, nullptr, nullptr, nullptr};
  std::string dbg;
  if (!names.rules.empty()) {
    rmlvo.rules = names.rules.c_str();
    dbg += "rules=" + names.rules + " ";
  }
  if (!names.model.empty()) {
    rmlvo.model = names.model.c_str();
    dbg += "model=" + names.model + " ";
  }
  if (!names.layout.empty()) {
    rmlvo.layout = names.layout.c_str();
    dbg += "layout=" + names.layout + " ";
  }
  if (!names.variant.empty()) {
    rmlvo.variant = names.variant.c_str();
    dbg += "variant=" + names.variant + " ";
  }
  if (!names.options.empty()) {
    rmlvo.options = names.options.c_str();
    dbg += "options=" + names.options + " ";
  }
  if (!dbg.empty()) {
    HOTKEY_IO_LOG_DEBUG("KeyboardLayout (xkb): names: %s", dbg.c_str());
  }

  m_keymap =
      xkb_keymap_new_from_names(m_ctx, &rmlvo, XKB_KEYMAP_COMPILE_NO_FLAGS);
  if (!m_keymap) {
    HOTKEY_IO_LOG_WARN("KeyboardLayout (xkb): xkb_keymap_new_from_names() "
                       "failed; labels fall back to the US layout");
    return;
  }
  m_state = xkb_state_new(m_keymap);
  if (!m_state) {
    HOTKEY_IO_LOG_ERROR("KeyboardLayout (xkb): xkb_state_new() failed");
    return;
  }
  HOTKEY_IO_LOG_INFO("KeyboardLayout (xkb): layout '%s' loaded",
                     names.layout.empty() ? "default" : names.layout.c_str());
}

XkbLayout::~XkbLayout() {
  if (m_state)
    xkb_state_unref(m_state);
  if (m_keymap)
    xkb_keymap_unref(m_keymap);
  if (m_ctx)
    xkb_context_unref(m_ctx);
}

std::optional<std::string> XkbLayout::glyphForKey(KeyCode key) const {
  if (!m_state)
    return std::nullopt;
  int evdevCode = evdevCodeForKey(key);
  if (evdevCode < 0)
    return std::nullopt;

  // XKB keycodes are evdev codes offset by 8
  xkb_keycode_t xkbKey = static_cast<xkb_keycode_t>(evdevCode + 8);
  char buf[64];
  int len = xkb_state_key_get_utf8(m_state, xkbKey, buf, sizeof(buf));
  if (len <= 0 || static_cast<size_t>(len) >= sizeof(buf))
    return std::nullopt;

  unsigned char first = static_cast<unsigned char>(buf[0]);
  if (first < 0x20 || first == 0x7F)
    return std::nullopt;
  return std::string(buf, static_cast<size_t>(len));
}

} // namespace hotkey::io::keyboard::detail

#endif // __linux__
