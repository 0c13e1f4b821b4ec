#pragma once
/**
 * @file keyboard/common/macos_layout.hpp
 * @brief Internal helpers for querying the macOS keyboard layout.
 *
 * This header is intentionally placed under `src/` (not installed) because it
 * is an implementation detail of `KeyboardLayout`.
 */

#ifdef __APPLE__

#include <Carbon/Carbon.h>
#include <hotkey-io/keyboard/common.hpp>

#include <optional>
#include <string>

namespace hotkey::io::keyboard::detail {

/**
 * @brief Invalid keycode constant for macOS.
 */
inline constexpr CGKeyCode kMacOSInvalidKeyCode = UINT16_MAX;

/**
 * @brief Map a writing system KeyCode to its macOS virtual keycode.
 * @param key Physical key.
 * @return CGKeyCode kVK_* code, or kMacOSInvalidKeyCode for keys outside the
 * writing system block.
 */
CGKeyCode macKeyCodeForKey(KeyCode key);

/**
 * @brief Text produced by @p key under the current keyboard input source.
 *
 * Uses `UCKeyTranslate` in display mode without modifiers and with dead key
 * processing disabled. Must be called from the main thread.
 *
 * @param key Physical key.
 * @return std::optional<std::string> UTF-8 text, or nullopt.
 */
std::optional<std::string> glyphForKeyMacOS(KeyCode key);

} // namespace hotkey::io::keyboard::detail

#endif // __APPLE__
