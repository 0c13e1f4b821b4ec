/**
 * @file c_api.cpp
 * @brief C API implementation for hotkey-io.
 *
 * Implements the C-compatible wrapper declared in `include/hotkey-io/c_api.h`.
 *
 * C++ exceptions are caught at this boundary and converted into a
 * process-wide last-error string retrievable via `hotkey_io_get_last_error`.
 */

#include <hotkey-io/core.hpp>

#include <hotkey-io/c_api.h>

#include <cstdarg>
#include <cstdlib>
#include <cstring>

#include <exception>
#include <mutex>
#include <string>

#include <hotkey-io/keyboard/common.hpp>
#include <hotkey-io/keyboard/layout.hpp>
#include <hotkey-io/log.hpp>

namespace {

using hotkey::io::keyboard::KeyCode;
using hotkey::io::keyboard::kKeyCodeCount;

/**
 * @brief Process-global last-error storage used by the C API implementation.
 *
 * Protected by a mutex so it can be set and read from multiple threads.
 * Callers retrieve a heap-allocated copy via `hotkey_io_get_last_error`.
 */
static std::mutex g_last_error_mutex;
static std::string g_last_error;

static void set_last_error(const std::string &s) {
  std::lock_guard<std::mutex> lk(g_last_error_mutex);
  g_last_error = s;
}

static void clear_last_error() {
  std::lock_guard<std::mutex> lk(g_last_error_mutex);
  g_last_error.clear();
}

/**
 * @brief Duplicate a std::string into a malloc-allocated C string.
 *
 * The returned buffer must be freed via `hotkey_io_free_string`. Returns
 * nullptr (and records the last error) on allocation failure.
 */
static char *duplicate_c_string(const std::string &s) {
  size_t n = s.size();
  char *p = static_cast<char *>(std::malloc(n + 1));
  if (!p) {
    set_last_error("Out of memory");
    return nullptr;
  }
  std::memcpy(p, s.data(), n);
  p[n] = '\0';
  return p;
}

/**
 * @brief Validate a numeric key coming from C and convert it.
 * @return true if @p key names a KeyCode; otherwise records the last error.
 */
static bool to_key_code(hotkey_io_keyboard_key_t key, const char *fn,
                        KeyCode &out) {
  if (key >= kKeyCodeCount) {
    set_last_error(std::string(fn) + ": key " + std::to_string(key) +
                   " is out of range");
    return false;
  }
  out = static_cast<KeyCode>(key);
  return true;
}

static hotkey::io::log::Level to_log_level(hotkey_io_log_level_t level) {
  switch (level) {
  case HOTKEY_IO_LOG_LEVEL_DEBUG:
    return hotkey::io::log::Level::Debug;
  case HOTKEY_IO_LOG_LEVEL_INFO:
    return hotkey::io::log::Level::Info;
  case HOTKEY_IO_LOG_LEVEL_WARN:
    return hotkey::io::log::Level::Warn;
  default:
    return hotkey::io::log::Level::Error;
  }
}

} // namespace

#ifdef __cplusplus
extern "C" {
#endif

/* ---------------- Keys ---------------- */

HOTKEY_IO_API size_t hotkey_io_keyboard_key_count(void) {
  return kKeyCodeCount;
}

HOTKEY_IO_API bool
hotkey_io_keyboard_string_to_key(const char *name,
                                 hotkey_io_keyboard_key_t *out_key) {
  if (!name) {
    set_last_error("name is NULL");
    return false;
  }
  if (!out_key) {
    set_last_error("out_key is NULL");
    return false;
  }
  try {
    clear_last_error();
    auto key = hotkey::io::keyboard::stringToKeyCode(std::string(name));
    if (!key) {
      set_last_error(std::string("unknown key name: ") + name);
      return false;
    }
    *out_key = static_cast<hotkey_io_keyboard_key_t>(*key);
    return true;
  } catch (const std::exception &e) {
    set_last_error(e.what());
    return false;
  } catch (...) {
    set_last_error("Unknown exception in hotkey_io_keyboard_string_to_key");
    return false;
  }
}

HOTKEY_IO_API char *hotkey_io_keyboard_key_to_string(hotkey_io_keyboard_key_t key) {
  try {
    clear_last_error();
    KeyCode k;
    if (!to_key_code(key, "hotkey_io_keyboard_key_to_string", k))
      return nullptr;
    return duplicate_c_string(hotkey::io::keyboard::keyCodeToString(k));
  } catch (const std::exception &e) {
    set_last_error(e.what());
    return nullptr;
  } catch (...) {
    set_last_error("Unknown exception in hotkey_io_keyboard_key_to_string");
    return nullptr;
  }
}

HOTKEY_IO_API char *hotkey_io_keyboard_key_label(hotkey_io_keyboard_key_t key) {
  try {
    clear_last_error();
    KeyCode k;
    if (!to_key_code(key, "hotkey_io_keyboard_key_label", k))
      return nullptr;
    return duplicate_c_string(hotkey::io::keyboard::keyCodeLabel(k));
  } catch (const std::exception &e) {
    set_last_error(e.what());
    return nullptr;
  } catch (...) {
    set_last_error("Unknown exception in hotkey_io_keyboard_key_label");
    return nullptr;
  }
}

HOTKEY_IO_API char *hotkey_io_keyboard_key_resolve(hotkey_io_keyboard_key_t key) {
  try {
    clear_last_error();
    KeyCode k;
    if (!to_key_code(key, "hotkey_io_keyboard_key_resolve", k))
      return nullptr;
    return duplicate_c_string(hotkey::io::keyboard::resolveKeyCode(k));
  } catch (const std::exception &e) {
    set_last_error(e.what());
    return nullptr;
  } catch (...) {
    set_last_error("Unknown exception in hotkey_io_keyboard_key_resolve");
    return nullptr;
  }
}

HOTKEY_IO_API hotkey_io_keyboard_key_class_t
hotkey_io_keyboard_key_class(hotkey_io_keyboard_key_t key) {
  try {
    clear_last_error();
    KeyCode k;
    if (!to_key_code(key, "hotkey_io_keyboard_key_class", k))
      return HOTKEY_IO_KEY_CLASS_INVALID;
    return static_cast<hotkey_io_keyboard_key_class_t>(
        hotkey::io::keyboard::classify(k));
  } catch (const std::exception &e) {
    set_last_error(e.what());
    return HOTKEY_IO_KEY_CLASS_INVALID;
  } catch (...) {
    set_last_error("Unknown exception in hotkey_io_keyboard_key_class");
    return HOTKEY_IO_KEY_CLASS_INVALID;
  }
}

HOTKEY_IO_API void hotkey_io_keyboard_layout_reload(void) {
  try {
    clear_last_error();
    hotkey::io::keyboard::KeyboardLayout::instance().reload();
  } catch (const std::exception &e) {
    set_last_error(e.what());
  } catch (...) {
    set_last_error("Unknown exception in hotkey_io_keyboard_layout_reload");
  }
}

/* ---------------- Utilities ---------------- */

HOTKEY_IO_API const char *hotkey_io_library_version(void) {
  clear_last_error();
  return hotkey::io::libraryVersion();
}

HOTKEY_IO_API char *hotkey_io_get_last_error(void) {
  std::string copy;
  {
    std::lock_guard<std::mutex> lk(g_last_error_mutex);
    if (g_last_error.empty()) {
      return nullptr;
    }
    copy = g_last_error;
  }
  return duplicate_c_string(copy);
}

HOTKEY_IO_API void hotkey_io_clear_last_error(void) { clear_last_error(); }

HOTKEY_IO_API void hotkey_io_free_string(char *s) {
  if (!s) {
    return;
  }
  std::free(s);
}

/* ---------------- Logging ---------------- */

HOTKEY_IO_API void hotkey_io_log_set_level(hotkey_io_log_level_t level) {
  hotkey::io::log::setLevel(to_log_level(level));
}

HOTKEY_IO_API hotkey_io_log_level_t hotkey_io_log_get_level(void) {
  return static_cast<hotkey_io_log_level_t>(hotkey::io::log::getLevel());
}

HOTKEY_IO_API bool hotkey_io_log_is_enabled(hotkey_io_log_level_t level) {
  return hotkey::io::log::isEnabled(to_log_level(level));
}

HOTKEY_IO_API void hotkey_io_log_message(hotkey_io_log_level_t level,
                                         const char *file, int line,
                                         const char *fmt, ...) {
  if (!fmt) {
    return;
  }
  va_list ap;
  va_start(ap, fmt);
  hotkey::io::log::vlog(to_log_level(level), file ? file : "<c>", line, fmt,
                        ap);
  va_end(ap);
}

#ifdef __cplusplus
} /* extern "C" */
#endif
