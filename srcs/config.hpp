#pragma once
#include "log.hpp"
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace tagmenu {

// Engine behavior
struct MenuConfig {
    bool clearScreen = true;               // run the platform clear before each frame
    bool pauseOnError = true;              // "Press Enter to continue..." after a reported error
    unsigned maxConsecutiveIoFailures = 0; // stop the loop after this many; 0 = never
    bool history = true;                   // readline history
};

struct LogConfig {
    Logger::Level level = Logger::Level::Info;
    std::string file = ".tagmenu.log";     // empty = no file sink
    std::size_t rotateBytes = 1024 * 1024;
    unsigned rotateFiles = 5;
    bool console = false;                  // stderr would draw over the menu
    std::string pattern = "[{time}] {level} {file}:{line} {func} | {msg}";
};

struct AppConfig {
    MenuConfig menu;
    LogConfig log;
    std::vector<std::string> warnings;     // malformed settings, defaults kept
};

// Returns the value of an environment variable or nullptr.
using EnvLookup = std::function<const char*(const char*)>;

// Reads TAGMENU_* variables on top of the defaults.
AppConfig loadConfig(const EnvLookup& env);
AppConfig loadConfig();

// Configures the Logger singleton. False if the log file could not be opened.
bool applyLogConfig(const LogConfig& cfg);

} // namespace tagmenu
