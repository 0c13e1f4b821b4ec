#pragma once
/**
 * @file keyboard/common/linux_layout.hpp
 * @brief Internal helpers for querying the XKB keyboard layout on Linux.
 *
 * This header is intentionally placed under `src/` (not installed) because it
 * is an implementation detail of `KeyboardLayout`.
 */

#if defined(__linux__)

#include <hotkey-io/keyboard/common.hpp>

#include <optional>
#include <string>
#include <xkbcommon/xkbcommon.h>

namespace hotkey::io::keyboard::detail {

/**
 * @brief RMLVO names used to compile an XKB keymap.
 *
 * Empty members are left to libxkbcommon's own defaults.
 */
struct XkbNames {
  std::string rules;
  std::string model;
  std::string layout;
  std::string variant;
  std::string options;
};

/**
 * @brief Discover the XKB names of the user's layout.
 *
 * Sources, in order: the XKB_DEFAULT_* environment variables, the
 * Debian-style /etc/default/keyboard file, then a layout guessed from
 * LC_ALL / LC_MESSAGES / LANG.
 *
 * @return XkbNames Names found; any member may be empty.
 */
XkbNames discoverXkbNames();

/**
 * @brief discoverXkbNames() reading @p keyboardFile in place of
 * /etc/default/keyboard.
 */
XkbNames discoverXkbNames(const std::string &keyboardFile);

/**
 * @brief Fill the empty members of @p names from a Debian-style keyboard file
 * (`XKBLAYOUT="de"`, `XKBVARIANT=nodeadkeys`, ...).
 *
 * `#` starts a comment; single or double quotes around a value are removed.
 * Members that already hold a value are left alone. A missing or unreadable
 * file leaves @p names unchanged.
 */
void readKeyboardFile(XkbNames &names, const std::string &path);

/**
 * @brief Guess an XKB layout name from a POSIX locale string.
 * @param locale Locale such as "de_DE.UTF-8" or "en_GB".
 * @return std::string Layout name ("de", "gb", ...) or empty if none.
 */
std::string layoutFromLocale(const std::string &locale);

/**
 * @brief Map a writing system KeyCode to its evdev keycode.
 * @param key Physical key.
 * @return int evdev code (KEY_*), or -1 for keys outside the writing system
 * block.
 */
int evdevCodeForKey(KeyCode key);

/**
 * @class XkbLayout
 * @brief Owns an xkb context, keymap and state compiled from XkbNames.
 *
 * The state never has modifiers applied, so lookups report the base level of
 * each key. Not thread-safe; callers serialize access.
 */
class XkbLayout {
public:
  explicit XkbLayout(const XkbNames &names);
  ~XkbLayout();

  XkbLayout(const XkbLayout &) = delete;
  XkbLayout &operator=(const XkbLayout &) = delete;

  /// True when the keymap compiled and a state could be created.
  [[nodiscard]] bool isValid() const { return m_state != nullptr; }

  /**
   * @brief UTF-8 text produced by @p key at the base level.
   * @return std::optional<std::string> Text, or nullopt for unmapped keys,
   * dead keys and control characters.
   */
  [[nodiscard]] std::optional<std::string> glyphForKey(KeyCode key) const;

private:
  struct xkb_context *m_ctx = nullptr;
  struct xkb_keymap *m_keymap = nullptr;
  struct xkb_state *m_state = nullptr;
};

} // namespace hotkey::io::keyboard::detail

#endif // __linux__
