// test_key_utils.cpp
// Unit tests for the key vocabulary: classification, names, aliases and
// baseline labels.
//
// These tests use Google Test and exercise:
//  - totality of classify / keyCodeToString / keyCodeLabel over every KeyCode
//  - the class partition (every key in exactly one class, no empty class)
//  - keyCodeToString / stringToKeyCode round-trip and name uniqueness
//  - alias lookups (e.g., "A" -> KeyA, "OSLeft" -> MetaLeft)
//  - edge cases (unknown names, no trimming, no case folding)
//
// To run these tests enable HOTKEY_IO_BUILD_TESTS=ON when configuring the
// project.

#include <gtest/gtest.h>

#include <hotkey-io/keyboard/common.hpp>
#include <hotkey-io/log.hpp>

#include <array>
#include <string>
#include <unordered_set>

using namespace hotkey::io::keyboard;

TEST(KeyUtilsTest, AllKeyCodesIsComplete) {
  HOTKEY_IO_LOG_INFO("test_key_utils: all key codes start");
  const auto &keys = allKeyCodes();
  ASSERT_EQ(keys.size(), kKeyCodeCount);
  for (std::size_t i = 0; i < keys.size(); ++i) {
    EXPECT_EQ(static_cast<std::size_t>(keys[i]), i);
  }
  EXPECT_EQ(keys.front(), KeyCode::Backquote);
  EXPECT_EQ(keys.back(), KeyCode::ZoomToggle);
}

TEST(KeyUtilsTest, ClassesPartitionTheKeys) {
  HOTKEY_IO_LOG_INFO("test_key_utils: class partition start");
  std::array<std::size_t, kKeyCodeClassCount> counts{};
  for (KeyCode key : allKeyCodes()) {
    auto c = static_cast<std::size_t>(classify(key));
    ASSERT_LT(c, kKeyCodeClassCount) << keyCodeToString(key);
    ++counts[c];
  }

  std::size_t total = 0;
  for (std::size_t i = 0; i < counts.size(); ++i) {
    EXPECT_GT(counts[i], 0u)
        << keyCodeClassToString(static_cast<KeyCodeClass>(i)) << " is empty";
    total += counts[i];
  }
  EXPECT_EQ(total, kKeyCodeCount);

  EXPECT_EQ(counts[static_cast<std::size_t>(KeyCodeClass::WritingSystem)], 51u);
  EXPECT_EQ(counts[static_cast<std::size_t>(KeyCodeClass::ArrowPad)], 4u);
  EXPECT_EQ(counts[static_cast<std::size_t>(KeyCodeClass::Gamepad)], 20u);
}

TEST(KeyUtilsTest, ClassExamples) {
  HOTKEY_IO_LOG_INFO("test_key_utils: class examples start");
  EXPECT_EQ(classify(KeyCode::KeyA), KeyCodeClass::WritingSystem);
  EXPECT_EQ(classify(KeyCode::Backspace), KeyCodeClass::WritingSystem);
  EXPECT_EQ(classify(KeyCode::IntlYen), KeyCodeClass::WritingSystem);
  EXPECT_EQ(classify(KeyCode::ShiftLeft), KeyCodeClass::Functional);
  EXPECT_EQ(classify(KeyCode::Lang1), KeyCodeClass::Functional);
  EXPECT_EQ(classify(KeyCode::Delete), KeyCodeClass::ControlPad);
  EXPECT_EQ(classify(KeyCode::ArrowUp), KeyCodeClass::ArrowPad);
  EXPECT_EQ(classify(KeyCode::NumLock), KeyCodeClass::Numpad);
  EXPECT_EQ(classify(KeyCode::Numpad5), KeyCodeClass::Numpad);
  EXPECT_EQ(classify(KeyCode::F5), KeyCodeClass::Function);
  EXPECT_EQ(classify(KeyCode::Escape), KeyCodeClass::Function);
  EXPECT_EQ(classify(KeyCode::AudioVolumeUp), KeyCodeClass::Media);
  EXPECT_EQ(classify(KeyCode::Copy), KeyCodeClass::Legacy);
  EXPECT_EQ(classify(KeyCode::Gamepad10), KeyCodeClass::Gamepad);
  EXPECT_EQ(classify(KeyCode::ZoomToggle), KeyCodeClass::NonStandard);
}

TEST(KeyUtilsTest, LabelsAreNeverEmpty) {
  HOTKEY_IO_LOG_INFO("test_key_utils: labels start");
  for (KeyCode key : allKeyCodes()) {
    EXPECT_FALSE(keyCodeLabel(key).empty()) << keyCodeToString(key);
  }
  EXPECT_EQ(keyCodeLabel(KeyCode::KeyA), "A");
  EXPECT_EQ(keyCodeLabel(KeyCode::Digit1), "1");
  EXPECT_EQ(keyCodeLabel(KeyCode::Backquote), "`");
  EXPECT_EQ(keyCodeLabel(KeyCode::Semicolon), ";");
  EXPECT_EQ(keyCodeLabel(KeyCode::ArrowUp), "\xE2\x86\x91");
  EXPECT_EQ(keyCodeLabel(KeyCode::F5), "F5");
}

TEST(KeyUtilsTest, RoundtripAndUniqueness) {
  HOTKEY_IO_LOG_INFO("test_key_utils: roundtrip/uniqueness start");
  std::unordered_set<std::string> seen;
  for (KeyCode key : allKeyCodes()) {
    std::string name = keyCodeToString(key);
    ASSERT_FALSE(name.empty());
    auto [it, inserted] = seen.emplace(name);
    EXPECT_TRUE(inserted) << "Canonical name '" << name << "' is duplicated";

    auto parsed = stringToKeyCode(name);
    ASSERT_TRUE(parsed.has_value()) << name;
    EXPECT_EQ(*parsed, key);
  }
  EXPECT_EQ(seen.size(), kKeyCodeCount);
}

TEST(KeyUtilsTest, CanonicalNames) {
  HOTKEY_IO_LOG_INFO("test_key_utils: canonical names start");
  EXPECT_EQ(keyCodeToString(KeyCode::KeyA), "KeyA");
  EXPECT_EQ(keyCodeToString(KeyCode::Digit0), "Digit0");
  EXPECT_EQ(keyCodeToString(KeyCode::MetaLeft), "MetaLeft");
  EXPECT_EQ(keyCodeToString(KeyCode::AudioVolumeUp), "AudioVolumeUp");
  EXPECT_EQ(keyCodeToString(KeyCode::MediaSelect), "MediaSelect");
  EXPECT_EQ(keyCodeToString(KeyCode::Gamepad10), "Gamepad10");
}

TEST(KeyUtilsTest, Aliases) {
  HOTKEY_IO_LOG_INFO("test_key_utils: aliases start");
  EXPECT_EQ(stringToKeyCode("0"), KeyCode::Digit0);
  EXPECT_EQ(stringToKeyCode("9"), KeyCode::Digit9);
  EXPECT_EQ(stringToKeyCode("A"), KeyCode::KeyA);
  EXPECT_EQ(stringToKeyCode("Z"), KeyCode::KeyZ);
  EXPECT_EQ(stringToKeyCode("OSLeft"), KeyCode::MetaLeft);
  EXPECT_EQ(stringToKeyCode("OSRight"), KeyCode::MetaRight);
  EXPECT_EQ(stringToKeyCode("VolumeUp"), KeyCode::AudioVolumeUp);
  EXPECT_EQ(stringToKeyCode("VolumeDown"), KeyCode::AudioVolumeDown);
  EXPECT_EQ(stringToKeyCode("VolumeMute"), KeyCode::AudioVolumeMute);
  EXPECT_EQ(stringToKeyCode("LaunchMediaPlayer"), KeyCode::MediaSelect);

  // Aliases are accepted on input only.
  EXPECT_NE(keyCodeToString(KeyCode::KeyA), "A");
  EXPECT_NE(keyCodeToString(KeyCode::MetaLeft), "OSLeft");
}

TEST(KeyUtilsTest, AliasTableIsConsistent) {
  HOTKEY_IO_LOG_INFO("test_key_utils: alias table start");
  std::unordered_set<std::string> canonical;
  for (KeyCode key : allKeyCodes())
    canonical.insert(keyCodeToString(key));

  std::unordered_set<std::string> aliases;
  for (const auto &[alias, key] : keyCodeAliases()) {
    EXPECT_TRUE(aliases.insert(alias).second)
        << "alias '" << alias << "' is duplicated";
    EXPECT_EQ(canonical.count(alias), 0u)
        << "alias '" << alias << "' shadows a canonical name";
    EXPECT_EQ(stringToKeyCode(alias), key) << alias;
  }
  EXPECT_FALSE(aliases.empty());
}

TEST(KeyUtilsTest, UnknownAndMalformedInput) {
  HOTKEY_IO_LOG_INFO("test_key_utils: invalid input start");
  EXPECT_FALSE(stringToKeyCode("NotARealKey").has_value());
  EXPECT_FALSE(stringToKeyCode("").has_value());

  // Matching is exact: no case folding and no whitespace trimming.
  EXPECT_FALSE(stringToKeyCode("keya").has_value());
  EXPECT_FALSE(stringToKeyCode("KEYA").has_value());
  EXPECT_FALSE(stringToKeyCode("a").has_value());
  EXPECT_FALSE(stringToKeyCode(" KeyA").has_value());
  EXPECT_FALSE(stringToKeyCode("KeyA ").has_value());
  EXPECT_FALSE(stringToKeyCode("volumeup").has_value());
}

TEST(KeyUtilsTest, OutOfRangeValuesAreNotNamed) {
  HOTKEY_IO_LOG_INFO("test_key_utils: out-of-range value start");
  const auto bad = static_cast<KeyCode>(kKeyCodeCount);
  const std::string name = keyCodeToString(bad);
  EXPECT_EQ(name, "Unknown");
  EXPECT_FALSE(stringToKeyCode(name).has_value());
  EXPECT_EQ(keyCodeLabel(bad), "Unknown");
  EXPECT_EQ(classify(bad), KeyCodeClass::NonStandard);
}

TEST(KeyUtilsTest, ClassNames) {
  HOTKEY_IO_LOG_INFO("test_key_utils: class names start");
  std::unordered_set<std::string> names;
  for (std::size_t i = 0; i < kKeyCodeClassCount; ++i) {
    std::string name = keyCodeClassToString(static_cast<KeyCodeClass>(i));
    EXPECT_FALSE(name.empty());
    EXPECT_TRUE(names.insert(name).second) << name;
  }
  EXPECT_STREQ(keyCodeClassToString(KeyCodeClass::WritingSystem),
               "WritingSystem");
}
