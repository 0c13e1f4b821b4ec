// test_linux_layout.cpp
// Unit tests for XKB layout name discovery on Linux.
//
// These tests exercise:
//  - layoutFromLocale mappings (region specific layouts, encodings and
//    modifiers stripped, C / POSIX ignored)
//  - readKeyboardFile parsing of a Debian-style keyboard file (comments,
//    quotes, lower-case keys, values already set are kept)
//  - discoverXkbNames ordering: environment, then keyboard file, then locale
//  - the evdev table used for xkb lookups
//
// The detail helpers are not exported from the library, so this test is built
// together with linux_layout.cpp.

#include <gtest/gtest.h>

#include "keyboard/common/linux_layout.hpp"

#include <hotkey-io/log.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

#include <linux/input-event-codes.h>
#include <unistd.h>

using namespace hotkey::io::keyboard;
using namespace hotkey::io::keyboard::detail;

namespace {

const std::vector<std::string> kLayoutEnv = {
    "XKB_DEFAULT_RULES",   "XKB_DEFAULT_MODEL", "XKB_DEFAULT_LAYOUT",
    "XKB_DEFAULT_VARIANT", "XKB_DEFAULT_OPTIONS", "LC_ALL",
    "LC_MESSAGES",         "LANG"};

// Clears the variables discoverXkbNames reads and restores them afterwards.
class LinuxLayoutTest : public ::testing::Test {
protected:
  void SetUp() override {
    for (const auto &name : kLayoutEnv) {
      const char *value = std::getenv(name.c_str());
      m_saved.emplace_back(name, value ? std::optional<std::string>(value)
                                       : std::nullopt);
      unsetenv(name.c_str());
    }
    m_file = std::filesystem::temp_directory_path() /
             ("hotkey_io_keyboard_" + std::to_string(::getpid()));
  }

  void TearDown() override {
    for (const auto &[name, value] : m_saved) {
      if (value)
        setenv(name.c_str(), value->c_str(), 1);
      else
        unsetenv(name.c_str());
    }
    std::error_code ec;
    std::filesystem::remove(m_file, ec);
  }

  std::string writeKeyboardFile(const std::string &contents) {
    std::ofstream out(m_file);
    out << contents;
    return m_file.string();
  }

  std::string missingFile() const { return (m_file / "missing").string(); }

  std::vector<std::pair<std::string, std::optional<std::string>>> m_saved;
  std::filesystem::path m_file;
};

} // namespace

TEST(LinuxLayoutLocaleTest, LayoutFromLocale) {
  HOTKEY_IO_LOG_INFO("test_linux_layout: locale mapping start");
  EXPECT_EQ(layoutFromLocale("en_US.UTF-8"), "us");
  EXPECT_EQ(layoutFromLocale("en_GB"), "gb");
  EXPECT_EQ(layoutFromLocale("en_UK.UTF-8"), "gb");
  EXPECT_EQ(layoutFromLocale("en"), "us");
  EXPECT_EQ(layoutFromLocale("de_DE.UTF-8@euro"), "de");
  EXPECT_EQ(layoutFromLocale("de_CH.UTF-8"), "ch");
  EXPECT_EQ(layoutFromLocale("pt_BR"), "br");
  EXPECT_EQ(layoutFromLocale("pt_PT"), "pt");
  EXPECT_EQ(layoutFromLocale("fr_FR"), "fr");
  EXPECT_EQ(layoutFromLocale("da_DK"), "dk");
  EXPECT_EQ(layoutFromLocale("sv_SE.UTF-8"), "se");
  EXPECT_EQ(layoutFromLocale("ja_JP.eucJP"), "jp");
  EXPECT_EQ(layoutFromLocale("ko_KR"), "kr");
  EXPECT_EQ(layoutFromLocale("C"), "");
  EXPECT_EQ(layoutFromLocale("C.UTF-8"), "");
  EXPECT_EQ(layoutFromLocale("POSIX"), "");
  EXPECT_EQ(layoutFromLocale(""), "");
}

TEST_F(LinuxLayoutTest, ReadKeyboardFileParsesDebianFormat) {
  HOTKEY_IO_LOG_INFO("test_linux_layout: keyboard file start");
  std::string path = writeKeyboardFile(
      "# KEYBOARD CONFIGURATION FILE\n"
      "\n"
      "XKBMODEL=\"pc105\"\n"
      "XKBLAYOUT=\"de\"  # German\n"
      "XKBVARIANT='nodeadkeys'\n"
      "  xkboptions = ctrl:nocaps\n"
      "BACKSPACE=\"guess\"\n"
      "not a setting\n");

  XkbNames names;
  readKeyboardFile(names, path);
  EXPECT_EQ(names.rules, "");
  EXPECT_EQ(names.model, "pc105");
  EXPECT_EQ(names.layout, "de");
  EXPECT_EQ(names.variant, "nodeadkeys");
  EXPECT_EQ(names.options, "ctrl:nocaps");
}

TEST_F(LinuxLayoutTest, ReadKeyboardFileKeepsExistingValues) {
  HOTKEY_IO_LOG_INFO("test_linux_layout: existing values start");
  std::string path =
      writeKeyboardFile("XKBLAYOUT=\"fr\"\nXKBVARIANT=\"azerty\"\n");

  XkbNames names;
  names.layout = "us";
  readKeyboardFile(names, path);
  EXPECT_EQ(names.layout, "us");
  EXPECT_EQ(names.variant, "azerty");

  XkbNames untouched;
  readKeyboardFile(untouched, missingFile());
  EXPECT_TRUE(untouched.layout.empty());
  EXPECT_TRUE(untouched.variant.empty());
}

TEST_F(LinuxLayoutTest, EnvironmentWinsOverKeyboardFile) {
  HOTKEY_IO_LOG_INFO("test_linux_layout: env precedence start");
  std::string path =
      writeKeyboardFile("XKBLAYOUT=\"fr\"\nXKBMODEL=\"pc104\"\n");
  setenv("XKB_DEFAULT_LAYOUT", "de", 1);
  setenv("LANG", "sv_SE.UTF-8", 1);

  XkbNames names = discoverXkbNames(path);
  EXPECT_EQ(names.layout, "de");
  EXPECT_EQ(names.model, "pc104");
}

TEST_F(LinuxLayoutTest, KeyboardFileWinsOverLocale) {
  HOTKEY_IO_LOG_INFO("test_linux_layout: file precedence start");
  std::string path = writeKeyboardFile("XKBLAYOUT=\"fr\"\n");
  setenv("LANG", "de_DE.UTF-8", 1);

  EXPECT_EQ(discoverXkbNames(path).layout, "fr");
}

TEST_F(LinuxLayoutTest, LocaleIsTheLastResort) {
  HOTKEY_IO_LOG_INFO("test_linux_layout: locale fallback start");
  setenv("LANG", "pt_BR.UTF-8", 1);
  EXPECT_EQ(discoverXkbNames(missingFile()).layout, "br");

  // LC_ALL takes precedence over LANG.
  setenv("LC_ALL", "de_CH.UTF-8", 1);
  EXPECT_EQ(discoverXkbNames(missingFile()).layout, "ch");

  unsetenv("LC_ALL");
  unsetenv("LANG");
  EXPECT_EQ(discoverXkbNames(missingFile()).layout, "");
}

TEST(LinuxLayoutEvdevTest, WritingSystemKeysHaveEvdevCodes) {
  HOTKEY_IO_LOG_INFO("test_linux_layout: evdev table start");
  EXPECT_EQ(evdevCodeForKey(KeyCode::KeyA), KEY_A);
  EXPECT_EQ(evdevCodeForKey(KeyCode::Digit1), KEY_1);
  EXPECT_EQ(evdevCodeForKey(KeyCode::Semicolon), KEY_SEMICOLON);
  EXPECT_EQ(evdevCodeForKey(KeyCode::F5), -1);
  EXPECT_EQ(evdevCodeForKey(KeyCode::ArrowUp), -1);
}
