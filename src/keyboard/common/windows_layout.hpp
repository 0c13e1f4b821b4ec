#pragma once
/**
 * @file keyboard/common/windows_layout.hpp
 * @brief Internal helpers for querying the Windows keyboard layout.
 *
 * This header is intentionally placed under `src/` (not installed) because it
 * is an implementation detail of `KeyboardLayout`.
 */

#ifdef _WIN32

#include <hotkey-io/keyboard/common.hpp>

#include <optional>
#include <string>

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <Windows.h>

namespace hotkey::io::keyboard::detail {

/**
 * @brief Map a writing system KeyCode to its set-1 scan code.
 * @param key Physical key.
 * @return UINT Scan code, or 0 for keys outside the writing system block.
 */
UINT scanCodeForKey(KeyCode key);

/**
 * @brief Text produced by @p key under @p layout without modifiers.
 *
 * Uses `ToUnicodeEx` with an empty key state and without touching the
 * thread's dead key buffer.
 *
 * @param key Physical key.
 * @param layout Keyboard layout; `GetKeyboardLayout(0)` when nullptr.
 * @return std::optional<std::string> UTF-8 text, or nullopt.
 */
std::optional<std::string> glyphForKeyWindows(KeyCode key,
                                              HKL layout = nullptr);

} // namespace hotkey::io::keyboard::detail

#endif // _WIN32
