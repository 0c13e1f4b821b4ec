// test_layout_resolve.cpp
// Unit tests for layout-aware labels.
//
// resolveKeyCode is exercised with fake layout queries so the expectations do
// not depend on the keyboard layout of the machine running the tests. The
// platform KeyboardLayout is only checked for properties that hold on every
// layout (and when no layout is available at all).

#include <gtest/gtest.h>

#include <hotkey-io/keyboard/common.hpp>
#include <hotkey-io/keyboard/layout.hpp>
#include <hotkey-io/log.hpp>

#include <optional>
#include <stdexcept>
#include <string>

using namespace hotkey::io::keyboard;

namespace {

LayoutQuery constantQuery(std::optional<std::string> glyph, int *calls) {
  return [glyph, calls](KeyCode) {
    if (calls)
      ++*calls;
    return glyph;
  };
}

} // namespace

TEST(LayoutResolveTest, FallsBackWhenQueryHasNoAnswer) {
  HOTKEY_IO_LOG_INFO("test_layout_resolve: fallback start");
  EXPECT_EQ(resolveKeyCode(KeyCode::KeyA, constantQuery(std::nullopt, nullptr)),
            "A");
  EXPECT_EQ(resolveKeyCode(KeyCode::Semicolon,
                           constantQuery(std::string(), nullptr)),
            ";");
  EXPECT_EQ(resolveKeyCode(KeyCode::Backquote, LayoutQuery{}), "`");
}

TEST(LayoutResolveTest, ThrowingQueryFallsBack) {
  HOTKEY_IO_LOG_INFO("test_layout_resolve: throwing query start");
  LayoutQuery failing = [](KeyCode) -> std::optional<std::string> {
    throw std::runtime_error("layout backend unavailable");
  };
  std::string out;
  EXPECT_NO_THROW(out = resolveKeyCode(KeyCode::KeyA, failing));
  EXPECT_EQ(out, "A");
  EXPECT_NO_THROW(out = resolveKeyCode(KeyCode::Slash, failing));
  EXPECT_EQ(out, "/");
}

TEST(LayoutResolveTest, UppercasesLayoutGlyphs) {
  HOTKEY_IO_LOG_INFO("test_layout_resolve: uppercase start");
  EXPECT_EQ(resolveKeyCode(KeyCode::KeyQ, constantQuery("a", nullptr)), "A");
  // AZERTY digit row: é -> É
  EXPECT_EQ(resolveKeyCode(KeyCode::Digit2, constantQuery("\xC3\xA9", nullptr)),
            "\xC3\x89");
  // German layout: ü -> Ü
  EXPECT_EQ(resolveKeyCode(KeyCode::BracketLeft,
                           constantQuery("\xC3\xBC", nullptr)),
            "\xC3\x9C");
  // Symbols have no case and pass through.
  EXPECT_EQ(resolveKeyCode(KeyCode::Minus, constantQuery("+", nullptr)), "+");
}

TEST(LayoutResolveTest, SharpSIsNotExpanded) {
  HOTKEY_IO_LOG_INFO("test_layout_resolve: sharp s start");
  EXPECT_EQ(resolveKeyCode(KeyCode::Minus, constantQuery("\xC3\x9F", nullptr)),
            "\xC3\x9F");
}

TEST(LayoutResolveTest, NonWritingKeysNeverQueryTheLayout) {
  HOTKEY_IO_LOG_INFO("test_layout_resolve: non-writing keys start");
  int calls = 0;
  LayoutQuery query = constantQuery("x", &calls);
  for (KeyCode key : allKeyCodes()) {
    if (classify(key) == KeyCodeClass::WritingSystem)
      continue;
    EXPECT_EQ(resolveKeyCode(key, query), keyCodeLabel(key))
        << keyCodeToString(key);
  }
  EXPECT_EQ(calls, 0);

  EXPECT_EQ(resolveKeyCode(KeyCode::KeyA, query), "X");
  EXPECT_EQ(calls, 1);
}

TEST(LayoutResolveTest, PlatformLayoutIgnoresNonWritingKeys) {
  HOTKEY_IO_LOG_INFO("test_layout_resolve: platform layout start");
  KeyboardLayout &layout = KeyboardLayout::instance();
  HOTKEY_IO_LOG_INFO("test_layout_resolve: platform layout available=%d",
                     static_cast<int>(layout.isAvailable()));
  for (KeyCode key : allKeyCodes()) {
    if (classify(key) == KeyCodeClass::WritingSystem)
      continue;
    EXPECT_FALSE(layout.glyphForKey(key).has_value()) << keyCodeToString(key);
  }
}

TEST(LayoutResolveTest, PlatformResolveIsTotal) {
  HOTKEY_IO_LOG_INFO("test_layout_resolve: platform resolve start");
  for (KeyCode key : allKeyCodes()) {
    EXPECT_FALSE(resolveKeyCode(key).empty()) << keyCodeToString(key);
  }
  KeyboardLayout::instance().reload();
  EXPECT_EQ(resolveKeyCode(KeyCode::F5), "F5");
}
