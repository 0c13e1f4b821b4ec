/**
 * @file c_api.h
 * @brief C-compatible wrapper for the hotkey-io key vocabulary.
 *
 * This header provides a minimal, stable C ABI suitable for language bindings
 * and simple consumers that cannot directly link against the C++ API.
 *
 * Notes:
 *  - Keys cross the boundary as `hotkey_io_keyboard_key_t`, the numeric value
 *    of `hotkey::io::keyboard::KeyCode` (0 .. key_count - 1).
 *  - Exported symbols are decorated with `HOTKEY_IO_API`. When included from
 *    C++ this macro is reused from <hotkey-io/core.hpp>. When included from C
 *    a safe no-op fallback is provided below.
 *
 * Memory ownership:
 *  - Functions that return `char *` allocate heap memory which callers must
 *    free via `hotkey_io_free_string`.
 *
 * Example:
 * @code{.c}
 * #include <hotkey-io/c_api.h>
 *
 * hotkey_io_keyboard_key_t key;
 * if (hotkey_io_keyboard_string_to_key(config_line, &key)) {
 *   char *label = hotkey_io_keyboard_key_resolve(key);
 *   draw_label(label);
 *   hotkey_io_free_string(label);
 * } else {
 *   // unknown key: ignore or reject the binding
 * }
 * @endcode
 */

#pragma once
#ifndef HOTKEY_IO_C_API_H
#define HOTKEY_IO_C_API_H

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

#ifndef HOTKEY_IO_API
#define HOTKEY_IO_API
#endif

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Numeric key value (corresponds to hotkey::io::keyboard::KeyCode).
 */
typedef uint16_t hotkey_io_keyboard_key_t;

/**
 * @brief Key class value (corresponds to hotkey::io::keyboard::KeyCodeClass).
 */
typedef uint8_t hotkey_io_keyboard_key_class_t;

enum {
  HOTKEY_IO_KEY_CLASS_WRITING_SYSTEM = 0,
  HOTKEY_IO_KEY_CLASS_FUNCTIONAL = 1,
  HOTKEY_IO_KEY_CLASS_CONTROL_PAD = 2,
  HOTKEY_IO_KEY_CLASS_ARROW_PAD = 3,
  HOTKEY_IO_KEY_CLASS_NUMPAD = 4,
  HOTKEY_IO_KEY_CLASS_FUNCTION = 5,
  HOTKEY_IO_KEY_CLASS_MEDIA = 6,
  HOTKEY_IO_KEY_CLASS_LEGACY = 7,
  HOTKEY_IO_KEY_CLASS_GAMEPAD = 8,
  HOTKEY_IO_KEY_CLASS_NON_STANDARD = 9,
  /** Returned by `hotkey_io_keyboard_key_class` for out-of-range keys. */
  HOTKEY_IO_KEY_CLASS_INVALID = 0xFF,
};

/** @name Keys
 * @{
 */

/**
 * @brief Number of keys; valid key values are 0 .. count - 1.
 */
HOTKEY_IO_API size_t hotkey_io_keyboard_key_count(void);

/**
 * @brief Parse a key name (canonical name or accepted alias).
 *
 * Matching is exact and case-sensitive.
 *
 * @param name Null-terminated key name.
 * @param out_key Receives the key on success.
 * @return true on success. false if @p name is not recognized or an argument
 * is NULL; the last error describes which.
 */
HOTKEY_IO_API bool hotkey_io_keyboard_string_to_key(
    const char *name, hotkey_io_keyboard_key_t *out_key);

/**
 * @brief Canonical name of a key (e.g., "KeyA").
 * @return char* Heap-allocated string, or NULL for an out-of-range key.
 */
HOTKEY_IO_API char *hotkey_io_keyboard_key_to_string(hotkey_io_keyboard_key_t key);

/**
 * @brief Display label of a key on the US reference layout (UTF-8).
 * @return char* Heap-allocated string, or NULL for an out-of-range key.
 */
HOTKEY_IO_API char *hotkey_io_keyboard_key_label(hotkey_io_keyboard_key_t key);

/**
 * @brief Display label of a key under the active platform layout (UTF-8).
 *
 * Subject to the threading rules of the platform layout query (see
 * keyboard/layout.hpp).
 *
 * @return char* Heap-allocated string, or NULL for an out-of-range key.
 */
HOTKEY_IO_API char *hotkey_io_keyboard_key_resolve(hotkey_io_keyboard_key_t key);

/**
 * @brief Class of a key (one of HOTKEY_IO_KEY_CLASS_*).
 * @return hotkey_io_keyboard_key_class_t The class, or
 * HOTKEY_IO_KEY_CLASS_INVALID for an out-of-range key.
 */
HOTKEY_IO_API hotkey_io_keyboard_key_class_t
hotkey_io_keyboard_key_class(hotkey_io_keyboard_key_t key);

/**
 * @brief Reload the platform keyboard layout after the user switched it.
 */
HOTKEY_IO_API void hotkey_io_keyboard_layout_reload(void);

/** @} */

/**
 * @brief Get the library version string.
 * @return const char* Pointer to an internal, null-terminated version string
 * (do not free).
 */
HOTKEY_IO_API const char *hotkey_io_library_version(void);

/**
 * @brief Retrieve the last process-wide error string, if any.
 *
 * The returned string is heap-allocated and must be freed with
 * `hotkey_io_free_string`. Returns NULL if there is no last error.
 */
HOTKEY_IO_API char *hotkey_io_get_last_error(void);

/**
 * @brief Clear the process-wide last error string, if any.
 */
HOTKEY_IO_API void hotkey_io_clear_last_error(void);

/**
 * @brief Free a string returned by the C API. Safe to call with NULL.
 */
HOTKEY_IO_API void hotkey_io_free_string(char *s);

/** @name Logging
 * @brief Control the library's logging from C.
 * @{
 */

enum {
  HOTKEY_IO_LOG_LEVEL_DEBUG = 0, /**< Debug level (most verbose) */
  HOTKEY_IO_LOG_LEVEL_INFO = 1,  /**< Info level */
  HOTKEY_IO_LOG_LEVEL_WARN = 2,  /**< Warning level */
  HOTKEY_IO_LOG_LEVEL_ERROR = 3, /**< Error level (least verbose) */
};

typedef uint8_t hotkey_io_log_level_t;

/**
 * @brief Set the global logging level (one of HOTKEY_IO_LOG_LEVEL_*).
 */
HOTKEY_IO_API void hotkey_io_log_set_level(hotkey_io_log_level_t level);

/**
 * @brief Get the current global logging level.
 */
HOTKEY_IO_API hotkey_io_log_level_t hotkey_io_log_get_level(void);

/**
 * @brief Check whether messages at a specific level are currently enabled.
 */
HOTKEY_IO_API bool hotkey_io_log_is_enabled(hotkey_io_log_level_t level);

/**
 * @brief Emit a message through the library logger.
 *
 * @param level Log level for the message.
 * @param file Source file name (typically `__FILE__`).
 * @param line Source line number (typically `__LINE__`).
 * @param fmt Printf-style format string.
 * @param ... Variadic arguments for the format string.
 */
HOTKEY_IO_API void hotkey_io_log_message(hotkey_io_log_level_t level,
                                         const char *file, int line,
                                         const char *fmt, ...);

/** @} */ /* end of Logging group */

#ifdef __cplusplus
} /* extern "C" */
#endif

#endif /* HOTKEY_IO_C_API_H */
