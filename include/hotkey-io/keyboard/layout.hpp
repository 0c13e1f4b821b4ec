#pragma once
/**
 * @file keyboard/layout.hpp
 * @brief Layout-aware key labels.
 *
 * `resolveKeyCode` produces the label a user expects to see printed on a key
 * under their active keyboard layout. Layout knowledge is injected as a
 * `LayoutQuery`, so callers (and tests) can supply their own source; the
 * overload without a query uses the platform `KeyboardLayout`.
 *
 * Threading:
 *  - `resolveKeyCode(key, query)` is as thread-safe as the query it is given.
 *  - `KeyboardLayout` follows the rules of the platform API behind it. On
 *    Windows the layout of the calling thread is used; on macOS queries must
 *    be made from the main thread; on Linux queries are serialized
 *    internally.
 *
 * Nothing here caches labels. Callers that redraw often should keep their own
 * cache and invalidate it after `KeyboardLayout::reload()`.
 */

#include <hotkey-io/keyboard/common.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace hotkey {
namespace io {
namespace keyboard {

/**
 * @brief Source of layout information.
 *
 * Returns the UTF-8 text the physical key produces under the active layout
 * (without modifiers), or nullopt when that is not known. A query that
 * throws a std::exception is treated the same as nullopt.
 */
using LayoutQuery = std::function<std::optional<std::string>(KeyCode)>;

/**
 * @class KeyboardLayout
 * @brief Platform keyboard layout query.
 *
 * Linux uses xkbcommon with the keymap named by the XKB_DEFAULT_* environment
 * variables, /etc/default/keyboard or the locale. Windows uses the calling
 * thread's keyboard layout. macOS uses the current keyboard input source.
 * Other platforms never report a glyph.
 *
 * Platform state is initialized lazily on first access.
 */
class HOTKEY_IO_API KeyboardLayout {
public:
  /**
   * @brief Get the process-wide KeyboardLayout.
   * @return KeyboardLayout& Reference to the singleton instance.
   */
  static KeyboardLayout &instance();

  ~KeyboardLayout();

  KeyboardLayout(const KeyboardLayout &) = delete;
  KeyboardLayout &operator=(const KeyboardLayout &) = delete;

  /**
   * @brief Rebuild platform state after the active layout changed.
   */
  void reload();

  /**
   * @brief Whether the platform layout could be loaded.
   * @return true if `glyphForKey` can produce results at all.
   */
  [[nodiscard]] bool isAvailable() const;

  /**
   * @brief Text produced by @p key under the active layout.
   *
   * Only writing system keys are looked up. Dead keys, control characters
   * and keys the layout does not map yield nullopt.
   *
   * @param key Physical key.
   * @return std::optional<std::string> UTF-8 text, or nullopt.
   */
  [[nodiscard]] std::optional<std::string> glyphForKey(KeyCode key) const;

  /**
   * @brief A LayoutQuery bound to this instance.
   */
  [[nodiscard]] LayoutQuery query() const;

private:
  KeyboardLayout();

  struct Impl;
  std::unique_ptr<Impl> m_impl;
};

/**
 * @brief Best label for @p key under the layout described by @p query.
 *
 * Keys outside KeyCodeClass::WritingSystem always get `keyCodeLabel(key)`
 * and @p query is not invoked for them. For writing system keys the queried
 * glyph is upper-cased (full Unicode mapping) and returned, except that "ß"
 * is returned as is. When the query yields nothing, or throws, the baseline
 * label is returned.
 *
 * @param key Key to label.
 * @param query Layout source; an empty function behaves like "no result".
 * @return std::string UTF-8 label, never empty.
 */
HOTKEY_IO_API std::string resolveKeyCode(KeyCode key, const LayoutQuery &query);

/**
 * @brief Best label for @p key under the platform's active layout.
 *
 * Equivalent to `resolveKeyCode(key, KeyboardLayout::instance().query())`.
 */
HOTKEY_IO_API std::string resolveKeyCode(KeyCode key);

} // namespace keyboard
} // namespace io
} // namespace hotkey
