#pragma once
/**
 * @file core.hpp
 * @brief Core library version and export macros for hotkey::io.
 *
 * This header defines library version information and symbol export macros
 * used throughout the hotkey-io library.
 *
 * For the key vocabulary (KeyCode, KeyCodeClass) and the name / label
 * helpers, include `<hotkey-io/keyboard/common.hpp>` instead.
 */

#ifndef HOTKEY_IO_VERSION
// Default version; CMake can override these by defining HOTKEY_IO_VERSION_* via
// -D flags if desired.
#define HOTKEY_IO_VERSION "0.4.0"
#define HOTKEY_IO_VERSION_MAJOR 0
#define HOTKEY_IO_VERSION_MINOR 4
#define HOTKEY_IO_VERSION_PATCH 0
#endif

// Symbol export macro to support building shared libraries on Windows.
// CMake configures `hotkey_io_EXPORTS` when building the shared target.
// For static builds we expose `HOTKEY_IO_STATIC` so headers avoid using
// __declspec(dllimport) which would make defining functions invalid on MSVC.
#ifndef HOTKEY_IO_API
#if defined(_WIN32) || defined(__CYGWIN__)
#if defined(hotkey_io_EXPORTS)
#define HOTKEY_IO_API __declspec(dllexport)
#elif defined(HOTKEY_IO_STATIC)
#define HOTKEY_IO_API
#else
#define HOTKEY_IO_API __declspec(dllimport)
#endif
#else
#if defined(__GNUC__) && (__GNUC__ >= 4)
#define HOTKEY_IO_API __attribute__((visibility("default")))
#else
#define HOTKEY_IO_API
#endif
#endif
#endif

namespace hotkey {
namespace io {

/**
 * @brief Convenience access to the library version string (mirrors
 * HOTKEY_IO_VERSION).
 * @return const char* Null-terminated version string (statically allocated).
 */
inline const char *libraryVersion() noexcept { return HOTKEY_IO_VERSION; }

} // namespace io
} // namespace hotkey
