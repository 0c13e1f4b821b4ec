#include <gtest/gtest.h>

#include <cstring>
#include <string>

#include <hotkey-io/c_api.h>

TEST(CApiTest, KeyStringConversion) {
  hotkey_io_clear_last_error();

  const char *ver = hotkey_io_library_version();
  ASSERT_NE(ver, nullptr);
  EXPECT_GT(std::strlen(ver), 0u);

  EXPECT_EQ(hotkey_io_keyboard_key_count(), 214u);

  hotkey_io_keyboard_key_t k = 0xFFFF;
  ASSERT_TRUE(hotkey_io_keyboard_string_to_key("KeyA", &k));
  EXPECT_LT(k, hotkey_io_keyboard_key_count());

  char *s = hotkey_io_keyboard_key_to_string(k);
  ASSERT_NE(s, nullptr);
  EXPECT_EQ(std::string(s), "KeyA");
  hotkey_io_free_string(s);

  /* Aliases resolve to the same key. */
  hotkey_io_keyboard_key_t alias = 0xFFFF;
  ASSERT_TRUE(hotkey_io_keyboard_string_to_key("A", &alias));
  EXPECT_EQ(alias, k);
}

TEST(CApiTest, UnknownNameSetsLastError) {
  hotkey_io_clear_last_error();

  hotkey_io_keyboard_key_t k = 7;
  EXPECT_FALSE(hotkey_io_keyboard_string_to_key("no-such-key", &k));
  EXPECT_EQ(k, 7u); /* untouched on failure */

  char *err = hotkey_io_get_last_error();
  ASSERT_NE(err, nullptr);
  EXPECT_NE(std::string(err).find("no-such-key"), std::string::npos);
  hotkey_io_free_string(err);

  hotkey_io_clear_last_error();
  EXPECT_EQ(hotkey_io_get_last_error(), nullptr);

  EXPECT_FALSE(hotkey_io_keyboard_string_to_key(NULL, &k));
  err = hotkey_io_get_last_error();
  ASSERT_NE(err, nullptr);
  EXPECT_NE(std::string(err).find("name"), std::string::npos);
  hotkey_io_free_string(err);

  EXPECT_FALSE(hotkey_io_keyboard_string_to_key("KeyA", NULL));
}

TEST(CApiTest, LabelsAndClasses) {
  hotkey_io_clear_last_error();

  hotkey_io_keyboard_key_t key = 0;
  ASSERT_TRUE(hotkey_io_keyboard_string_to_key("F5", &key));
  EXPECT_EQ(hotkey_io_keyboard_key_class(key), HOTKEY_IO_KEY_CLASS_FUNCTION);

  char *label = hotkey_io_keyboard_key_label(key);
  ASSERT_NE(label, nullptr);
  EXPECT_EQ(std::string(label), "F5");
  hotkey_io_free_string(label);

  char *resolved = hotkey_io_keyboard_key_resolve(key);
  ASSERT_NE(resolved, nullptr);
  EXPECT_EQ(std::string(resolved), "F5");
  hotkey_io_free_string(resolved);

  ASSERT_TRUE(hotkey_io_keyboard_string_to_key("Backspace", &key));
  EXPECT_EQ(hotkey_io_keyboard_key_class(key),
            HOTKEY_IO_KEY_CLASS_WRITING_SYSTEM);

  hotkey_io_keyboard_layout_reload();
  EXPECT_EQ(hotkey_io_get_last_error(), nullptr);
}

TEST(CApiTest, OutOfRangeKeys) {
  hotkey_io_clear_last_error();

  const hotkey_io_keyboard_key_t bad =
      static_cast<hotkey_io_keyboard_key_t>(hotkey_io_keyboard_key_count());

  EXPECT_EQ(hotkey_io_keyboard_key_to_string(bad), nullptr);
  char *err = hotkey_io_get_last_error();
  ASSERT_NE(err, nullptr);
  EXPECT_NE(std::string(err).find("out of range"), std::string::npos);
  hotkey_io_free_string(err);

  EXPECT_EQ(hotkey_io_keyboard_key_label(bad), nullptr);
  EXPECT_EQ(hotkey_io_keyboard_key_resolve(bad), nullptr);
  EXPECT_EQ(hotkey_io_keyboard_key_class(bad), HOTKEY_IO_KEY_CLASS_INVALID);

  /* Freeing NULL is allowed. */
  hotkey_io_free_string(NULL);
}

TEST(CApiTest, KeyClassReportsErrors) {
  hotkey_io_clear_last_error();

  EXPECT_EQ(hotkey_io_keyboard_key_class(0xFFFF), HOTKEY_IO_KEY_CLASS_INVALID);
  char *err = hotkey_io_get_last_error();
  ASSERT_NE(err, nullptr);
  EXPECT_NE(std::string(err).find("hotkey_io_keyboard_key_class"),
            std::string::npos);
  hotkey_io_free_string(err);

  /* A successful call clears the previous error. */
  hotkey_io_keyboard_key_t key = 0;
  ASSERT_TRUE(hotkey_io_keyboard_string_to_key("ArrowUp", &key));
  EXPECT_EQ(hotkey_io_keyboard_key_class(key), HOTKEY_IO_KEY_CLASS_ARROW_PAD);
  EXPECT_EQ(hotkey_io_get_last_error(), nullptr);
}

TEST(CApiTest, LogLevelControl) {
  hotkey_io_log_level_t saved = hotkey_io_log_get_level();

  hotkey_io_log_set_level(HOTKEY_IO_LOG_LEVEL_WARN);
  EXPECT_EQ(hotkey_io_log_get_level(), HOTKEY_IO_LOG_LEVEL_WARN);
  EXPECT_FALSE(hotkey_io_log_is_enabled(HOTKEY_IO_LOG_LEVEL_INFO));
  EXPECT_TRUE(hotkey_io_log_is_enabled(HOTKEY_IO_LOG_LEVEL_ERROR));
  hotkey_io_log_message(HOTKEY_IO_LOG_LEVEL_WARN, __FILE__, __LINE__,
                        "test_c_api: warn from C (%d)", 42);

  hotkey_io_log_set_level(saved);
}
