#include "config.hpp"
#include "utils.hpp"
#include <cerrno>
#include <cstdlib>

namespace tagmenu {

namespace {

bool parse_bool(const std::string& text, bool& out) {
    const std::string t = to_lower(trim(text));
    if (t == "1" || t == "true" || t == "yes" || t == "on")  { out = true;  return true; }
    if (t == "0" || t == "false" || t == "no" || t == "off") { out = false; return true; }
    return false;
}

bool parse_unsigned(const std::string& text, unsigned long long& out) {
    const std::string t = trim(text);
    if (t.empty() || t.find_first_not_of("0123456789") != std::string::npos) return false;
    errno = 0;
    unsigned long long v = std::strtoull(t.c_str(), nullptr, 10);
    if (errno == ERANGE) return false;
    out = v;
    return true;
}

class Reader {
public:
    Reader(const EnvLookup& env, AppConfig& cfg) : _env(env), _cfg(cfg) {}

    void flag(const char* name, bool& field) {
        const char* v = _env(name);
        if (!v) return;
        if (!parse_bool(v, field)) warn(name, v, "expected a boolean");
    }

    template <typename T>
    void number(const char* name, T& field, unsigned long long max) {
        const char* v = _env(name);
        if (!v) return;
        unsigned long long n = 0;
        if (!parse_unsigned(v, n) || n > max) {
            warn(name, v, "expected a non-negative integer");
            return;
        }
        field = static_cast<T>(n);
    }

    void text(const char* name, std::string& field) {
        const char* v = _env(name);
        if (v) field = v;
    }

    void level(const char* name, Logger::Level& field) {
        const char* v = _env(name);
        if (!v) return;
        if (!Logger::parseLevel(v, field)) warn(name, v, "expected trace, debug, info, warn, error, fatal or off");
    }

private:
    void warn(const char* name, const char* value, const char* why) {
        _cfg.warnings.push_back(std::string(name) + "='" + value + "' ignored: " + why);
    }

    const EnvLookup& _env;
    AppConfig& _cfg;
};

} // namespace

AppConfig loadConfig(const EnvLookup& env) {
    AppConfig cfg;
    Reader r(env, cfg);
    r.flag("TAGMENU_CLEAR", cfg.menu.clearScreen);
    r.flag("TAGMENU_PAUSE_ON_ERROR", cfg.menu.pauseOnError);
    r.number("TAGMENU_MAX_IO_FAILURES", cfg.menu.maxConsecutiveIoFailures, 1000000);
    r.flag("TAGMENU_HISTORY", cfg.menu.history);
    r.level("TAGMENU_LOG_LEVEL", cfg.log.level);
    r.text("TAGMENU_LOG_FILE", cfg.log.file);
    r.number("TAGMENU_LOG_ROTATE_BYTES", cfg.log.rotateBytes, 1ull << 40);
    r.number("TAGMENU_LOG_ROTATE_FILES", cfg.log.rotateFiles, 100);
    r.flag("TAGMENU_LOG_CONSOLE", cfg.log.console);
    r.text("TAGMENU_LOG_PATTERN", cfg.log.pattern);
    return cfg;
}

AppConfig loadConfig() {
    return loadConfig([](const char* name) -> const char* { return std::getenv(name); });
}

bool applyLogConfig(const LogConfig& cfg) {
    Logger& L = Logger::instance();
    L.setLevel(cfg.level);
    L.enableConsole(cfg.console);
    if (!cfg.pattern.empty()) L.setPattern(cfg.pattern);
    L.setRotation(cfg.rotateBytes, cfg.rotateFiles);
    if (cfg.file.empty()) {
        L.clearFile();
        return true;
    }
    return L.setFile(cfg.file);
}

} // namespace tagmenu
