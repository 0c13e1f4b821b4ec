/*
 * Simple example for hotkey-io showing basic usage.
 *
 * Build with:
 *   cmake -DHOTKEY_IO_BUILD_EXAMPLES=ON ..
 *   cmake --build .
 *
 * Run:
 *   ./hotkey-io-example KeyA Semicolon F5
 *   ./hotkey-io-example --list --class Numpad
 *
 * Note: layout-resolved labels come from the active platform keyboard layout
 * (xkbcommon on Linux, the thread layout on Windows, the current input source
 * on macOS). Pass --no-layout to show only the US reference labels.
 */

#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <hotkey-io/core.hpp>
#include <hotkey-io/keyboard/common.hpp>
#include <hotkey-io/keyboard/layout.hpp>
#include <hotkey-io/log.hpp>

using namespace hotkey::io::keyboard;

namespace {

void printUsage() {
  std::cout << "Usage: hotkey-io-example [options] KEYNAME...\n"
            << "  --list          : print every key (see --class)\n"
            << "  --class NAME    : restrict --list to one class (e.g., "
               "WritingSystem, Numpad)\n"
            << "  --no-layout     : skip the platform layout query\n"
            << "  --help          : show this text\n";
}

std::optional<KeyCodeClass> classFromString(const std::string &name) {
  for (std::size_t i = 0; i < kKeyCodeClassCount; ++i) {
    auto c = static_cast<KeyCodeClass>(i);
    if (name == keyCodeClassToString(c))
      return c;
  }
  return std::nullopt;
}

void printKey(KeyCode key, bool useLayout) {
  std::cout << "  " << keyCodeToString(key) << "  ["
            << keyCodeClassToString(classify(key)) << "]  label=\""
            << keyCodeLabel(key) << "\"";
  if (useLayout)
    std::cout << "  resolved=\"" << resolveKeyCode(key) << "\"";
  std::cout << "\n";
}

} // namespace

int main(int argc, char **argv) {
  std::cout << "hotkey-io example (v" << hotkey::io::libraryVersion() << ")\n";
  HOTKEY_IO_LOG_INFO("example: startup argc=%d", argc);

  if (argc <= 1) {
    printUsage();
    return 0;
  }

  bool list = false;
  bool useLayout = true;
  std::optional<KeyCodeClass> filter;
  std::vector<std::string> names;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help") {
      printUsage();
      return 0;
    } else if (arg == "--list") {
      list = true;
    } else if (arg == "--no-layout") {
      useLayout = false;
    } else if (arg == "--class") {
      if (i + 1 >= argc) {
        std::cerr << "--class requires an argument\n";
        return 1;
      }
      std::string name = argv[++i];
      filter = classFromString(name);
      if (!filter) {
        std::cerr << "Unknown key class: " << name << "\n";
        return 1;
      }
    } else {
      names.push_back(std::move(arg));
    }
  }

  if (useLayout) {
    bool available = KeyboardLayout::instance().isAvailable();
    HOTKEY_IO_LOG_INFO("example: platform layout available=%d",
                       static_cast<int>(available));
    if (!available)
      std::cout << "(no platform layout; resolved labels use the US layout)\n";
  }

  if (list) {
    for (KeyCode key : allKeyCodes()) {
      if (filter && classify(key) != *filter)
        continue;
      printKey(key, useLayout);
    }
  }

  int rc = 0;
  for (const auto &name : names) {
    auto key = stringToKeyCode(name);
    if (!key) {
      std::cerr << "Unrecognized key name: \"" << name << "\"\n";
      rc = 1;
      continue;
    }
    printKey(*key, useLayout);
  }

  HOTKEY_IO_LOG_INFO("example: exiting rc=%d", rc);
  return rc;
}
