/**
 * @file keyboard/common/layout.cpp
 * @brief Layout-aware key labels and the platform KeyboardLayout.
 */

#include <hotkey-io/keyboard/layout.hpp>
#include <hotkey-io/log.hpp>

#include <exception>
#include <mutex>

#include <unicode/locid.h>
#include <unicode/unistr.h>

#ifdef __APPLE__
#include "keyboard/common/macos_layout.hpp"
#elif defined(_WIN32)
#include "keyboard/common/windows_layout.hpp"
#elif defined(__linux__)
#include "keyboard/common/linux_layout.hpp"
#endif

namespace hotkey {
namespace io {
namespace keyboard {

namespace {

// U+00DF LATIN SMALL LETTER SHARP S. Its full uppercase mapping is "SS",
// which is not the key that was pressed.
constexpr const char *kSharpS = "\xC3\x9F";

std::string toUpperUtf8(const std::string &text) {
  icu::UnicodeString unicode = icu::UnicodeString::fromUTF8(text);
  unicode.toUpper(icu::Locale::getRoot());
  std::string out;
  unicode.toUTF8String(out);
  return out;
}

} // namespace

struct KeyboardLayout::Impl {
  mutable std::mutex mutex;
#if defined(__linux__) && !defined(__APPLE__)
  std::unique_ptr<detail::XkbLayout> xkb;
#endif

  // Caller holds `mutex`.
  void load() {
#ifdef __APPLE__
    HOTKEY_IO_LOG_DEBUG("KeyboardLayout: using the current TIS input source");
#elif defined(_WIN32)
    HOTKEY_IO_LOG_DEBUG("KeyboardLayout: using the thread keyboard layout "
                        "(HKL %p)",
                        static_cast<void *>(GetKeyboardLayout(0)));
#elif defined(__linux__)
    xkb = std::make_unique<detail::XkbLayout>(detail::discoverXkbNames());
#else
    HOTKEY_IO_LOG_WARN("KeyboardLayout: no platform layout query available");
#endif
  }
};

KeyboardLayout &KeyboardLayout::instance() {
  static KeyboardLayout layout;
  return layout;
}

KeyboardLayout::KeyboardLayout() : m_impl(std::make_unique<Impl>()) {
  std::lock_guard<std::mutex> lock(m_impl->mutex);
  m_impl->load();
}

KeyboardLayout::~KeyboardLayout() = default;

void KeyboardLayout::reload() {
  std::lock_guard<std::mutex> lock(m_impl->mutex);
  HOTKEY_IO_LOG_DEBUG("KeyboardLayout: reloading");
  m_impl->load();
}

bool KeyboardLayout::isAvailable() const {
  std::lock_guard<std::mutex> lock(m_impl->mutex);
#ifdef __APPLE__
  TISInputSourceRef source = TISCopyCurrentKeyboardLayoutInputSource();
  if (!source)
    return false;
  CFRelease(source);
  return true;
#elif defined(_WIN32)
  return GetKeyboardLayout(0) != nullptr;
#elif defined(__linux__)
  return m_impl->xkb && m_impl->xkb->isValid();
#else
  return false;
#endif
}

std::optional<std::string> KeyboardLayout::glyphForKey(KeyCode key) const {
  if (classify(key) != KeyCodeClass::WritingSystem)
    return std::nullopt;

  std::lock_guard<std::mutex> lock(m_impl->mutex);
#ifdef __APPLE__
  return detail::glyphForKeyMacOS(key);
#elif defined(_WIN32)
  return detail::glyphForKeyWindows(key);
#elif defined(__linux__)
  if (!m_impl->xkb)
    return std::nullopt;
  return m_impl->xkb->glyphForKey(key);
#else
  return std::nullopt;
#endif
}

LayoutQuery KeyboardLayout::query() const {
  return [this](KeyCode key) { return glyphForKey(key); };
}

HOTKEY_IO_API std::string resolveKeyCode(KeyCode key,
                                         const LayoutQuery &query) {
  if (classify(key) != KeyCodeClass::WritingSystem || !query)
    return keyCodeLabel(key);

  std::optional<std::string> glyph;
  try {
    glyph = query(key);
  } catch (const std::exception &e) {
    HOTKEY_IO_LOG_DEBUG("resolveKeyCode: layout query failed for %s: %s",
                        keyCodeToString(key).c_str(), e.what());
    return keyCodeLabel(key);
  }
  if (!glyph || glyph->empty())
    return keyCodeLabel(key);
  if (*glyph == kSharpS)
    return *glyph;
  return toUpperUtf8(*glyph);
}

HOTKEY_IO_API std::string resolveKeyCode(KeyCode key) {
  return resolveKeyCode(key, KeyboardLayout::instance().query());
}

} // namespace keyboard
} // namespace io
} // namespace hotkey
