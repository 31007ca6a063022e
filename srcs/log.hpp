#pragma once
#include <string>
#include <chrono>
#include <atomic>
#include <mutex>
#include <memory>
#include <fstream>
#include <sstream>

namespace tagmenu {

class Logger {
public:
    enum class Level {
        Trace = 0,
        Debug,
        Info,
        Warn,
        Error,
        Fatal,
        Off
    };

    static Logger& instance();

    void setLevel(Level lvl);
    Level level() const noexcept;
    bool shouldLog(Level lvl) const noexcept;

    // Console sink writes to stderr. Off by default for menus, see LogConfig.
    void enableConsole(bool on);
    void setConsoleColored(bool on);

    // File sink; set truncate=true to start fresh
    bool setFile(const std::string& path, bool truncate = false);
    void clearFile();
    std::string filePath() const;

    // Size-based rotation; maxBytes=0 disables rotation. maxFiles>=1.
    void setRotation(size_t maxBytes, unsigned maxFiles);

    // Pattern tokens: {time} {level} {file} {line} {func} {msg}
    void setPattern(const std::string& pattern);

    void flush();

    void log(Level lvl,
             const std::string& msg,
             const char* file,
             int line,
             const char* func);

    static const char* levelName(Level lvl) noexcept;

    // Case-insensitive "trace".."fatal", "off". Returns false on unknown names.
    static bool parseLevel(const std::string& text, Level& out);

    // Stream-style builder, emits on destruction
    class Line {
    public:
        Line(Level lvl, const char* file, int line, const char* func)
        : _lvl(lvl), _file(file), _line(line), _func(func),
          _enabled(Logger::instance().shouldLog(lvl)) {}

        ~Line() {
            if (_enabled) {
                Logger::instance().log(_lvl, _ss.str(), _file, _line, _func);
            }
        }

        template <typename T>
        Line& operator<<(const T& v) {
            if (_enabled) _ss << v;
            return *this;
        }

    private:
        Level _lvl;
        const char* _file;
        int _line;
        const char* _func;
        bool _enabled;
        std::ostringstream _ss;
    };

private:
    Logger();
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    struct Record {
        std::chrono::system_clock::time_point tp;
        Level lvl;
        std::string msg;
        std::string file;
        std::string func;
        int line;
    };

    void writeRecord(const Record& rec);
    std::string format(const Record& rec, bool forConsole) const;
    static const char* levelColor(Level lvl) noexcept;
    std::string makeTime(std::chrono::system_clock::time_point tp) const;
    void rotateIfNeededLocked(size_t incomingBytes);

    std::atomic<Level> _level;
    std::atomic<bool> _console{true};
    std::atomic<bool> _color{true};

    // Guards the file sink and the pattern
    mutable std::mutex _mx;
    std::string _filePath;
    size_t _fileSize = 0;
    size_t _rotateBytes = 0;
    unsigned _rotateFiles = 3;
    std::unique_ptr<std::ofstream> _file;
    std::string _pattern;
};

#define TAGMENU_LOG_TRACE() ::tagmenu::Logger::Line(::tagmenu::Logger::Level::Trace, __FILE__, __LINE__, __func__)
#define TAGMENU_LOG_DEBUG() ::tagmenu::Logger::Line(::tagmenu::Logger::Level::Debug, __FILE__, __LINE__, __func__)
#define TAGMENU_LOG_INFO()  ::tagmenu::Logger::Line(::tagmenu::Logger::Level::Info,  __FILE__, __LINE__, __func__)
#define TAGMENU_LOG_WARN()  ::tagmenu::Logger::Line(::tagmenu::Logger::Level::Warn,  __FILE__, __LINE__, __func__)
#define TAGMENU_LOG_ERROR() ::tagmenu::Logger::Line(::tagmenu::Logger::Level::Error, __FILE__, __LINE__, __func__)
#define TAGMENU_LOG_FATAL() ::tagmenu::Logger::Line(::tagmenu::Logger::Level::Fatal, __FILE__, __LINE__, __func__)

} // namespace tagmenu
