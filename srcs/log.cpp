#include "log.hpp"
#include "utils.hpp"
#include <iostream>
#include <ctime>
#include <cstdio>      // std::rename, std::remove
#include <unistd.h>    // isatty, STDERR_FILENO
#include <algorithm>

namespace tagmenu {

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

Logger::Logger()
: _level(Level::Info) {
    _pattern = "[{time}] {level} {file}:{line} {func} | {msg}";
    _color = isatty(STDERR_FILENO);
}

Logger::~Logger() {
    flush();
}

void Logger::setLevel(Level lvl) { _level.store(lvl, std::memory_order_relaxed); }
Logger::Level Logger::level() const noexcept { return _level.load(std::memory_order_relaxed); }

bool Logger::shouldLog(Level lvl) const noexcept {
    Level cur = _level.load(std::memory_order_relaxed);
    return cur != Level::Off && lvl != Level::Off && lvl >= cur;
}

void Logger::enableConsole(bool on) { _console.store(on, std::memory_order_relaxed); }
void Logger::setConsoleColored(bool on) { _color.store(on, std::memory_order_relaxed); }

bool Logger::setFile(const std::string& path, bool truncate) {
    std::lock_guard<std::mutex> lk(_mx);
    _filePath = path;
    _file.reset(new std::ofstream());
    std::ios_base::openmode mode = truncate ? (std::ios::out | std::ios::trunc)
                                            : (std::ios::out | std::ios::app);
    _file->open(path.c_str(), mode);
    if (!_file->is_open()) {
        _file.reset();
        _filePath.clear();
        _fileSize = 0;
        return false;
    }
    _file->seekp(0, std::ios::end);
    std::streampos pos = _file->tellp();
    _fileSize = pos < 0 ? 0 : static_cast<size_t>(pos);
    return true;
}

void Logger::clearFile() {
    std::lock_guard<std::mutex> lk(_mx);
    _file.reset();
    _filePath.clear();
    _fileSize = 0;
}

std::string Logger::filePath() const {
    std::lock_guard<std::mutex> lk(_mx);
    return _filePath;
}

void Logger::setRotation(size_t maxBytes, unsigned maxFiles) {
    std::lock_guard<std::mutex> lk(_mx);
    _rotateBytes = maxBytes;
    _rotateFiles = std::max(1u, maxFiles);
}

void Logger::setPattern(const std::string& pattern) {
    std::lock_guard<std::mutex> lk(_mx);
    _pattern = pattern;
}

void Logger::flush() {
    if (_console.load()) std::cerr.flush();
    std::lock_guard<std::mutex> lk(_mx);
    if (_file && _file->is_open()) _file->flush();
}

const char* Logger::levelName(Level lvl) noexcept {
    switch (lvl) {
        case Level::Trace: return "TRACE";
        case Level::Debug: return "DEBUG";
        case Level::Info:  return "INFO ";
        case Level::Warn:  return "WARN ";
        case Level::Error: return "ERROR";
        case Level::Fatal: return "FATAL";
        default:           return "OFF  ";
    }
}

bool Logger::parseLevel(const std::string& text, Level& out) {
    const std::string t = to_lower(trim(text));
    if (t == "trace")                     { out = Level::Trace; return true; }
    if (t == "debug")                     { out = Level::Debug; return true; }
    if (t == "info")                      { out = Level::Info;  return true; }
    if (t == "warn" || t == "warning")    { out = Level::Warn;  return true; }
    if (t == "error")                     { out = Level::Error; return true; }
    if (t == "fatal")                     { out = Level::Fatal; return true; }
    if (t == "off" || t == "none")        { out = Level::Off;   return true; }
    return false;
}

const char* Logger::levelColor(Level lvl) noexcept {
    switch (lvl) {
        case Level::Trace: return "\033[90m";
        case Level::Debug: return "\033[36m";
        case Level::Info:  return "\033[32m";
        case Level::Warn:  return "\033[33m";
        case Level::Error: return "\033[31m";
        case Level::Fatal: return "\033[41;97m";
        default:           return "\033[0m";
    }
}

std::string Logger::makeTime(std::chrono::system_clock::time_point tp) const {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
#ifdef __linux__
    localtime_r(&t, &tm);
#else
    tm = *std::localtime(&t);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return std::string(buf);
}

// Caller holds _mx (the pattern lives under it).
std::string Logger::format(const Record& rec, bool forConsole) const {
    std::string out = _pattern;
    replace_all(out, "{time}", makeTime(rec.tp));
    replace_all(out, "{level}", levelName(rec.lvl));
    replace_all(out, "{file}", rec.file);
    replace_all(out, "{line}", std::to_string(rec.line));
    replace_all(out, "{func}", rec.func);
    replace_all(out, "{msg}", rec.msg);

    if (forConsole && _color.load()) {
        return std::string(levelColor(rec.lvl)) + out + "\033[0m";
    }
    return out;
}

void Logger::rotateIfNeededLocked(size_t incomingBytes) {
    if (!_file || !_file->is_open() || _rotateBytes == 0) return;
    if (_fileSize + incomingBytes <= _rotateBytes) return;

    _file->close();

    auto rotated = [&](unsigned i) {
        return _filePath + "." + std::to_string(i);
    };

    // path.N-2 -> path.N-1 ... path -> path.1
    if (_rotateFiles > 1) {
        std::remove(rotated(_rotateFiles - 1).c_str());
        for (unsigned i = _rotateFiles - 1; i >= 2; --i) {
            std::rename(rotated(i - 1).c_str(), rotated(i).c_str());
        }
        std::rename(_filePath.c_str(), rotated(1).c_str());
    }

    _file.reset(new std::ofstream());
    _file->open(_filePath.c_str(), std::ios::out | std::ios::trunc);
    _fileSize = 0;
}

void Logger::writeRecord(const Record& rec) {
    std::lock_guard<std::mutex> lk(_mx);
    if (_console.load()) {
        std::cerr << format(rec, true) << '\n';
    }
    if (_file && _file->is_open()) {
        const std::string line = format(rec, false);
        rotateIfNeededLocked(line.size() + 1);
        (*_file) << line << '\n';
        _fileSize += line.size() + 1;
    }
}

void Logger::log(Level lvl,
                 const std::string& msg,
                 const char* file,
                 int line,
                 const char* func) {
    if (!shouldLog(lvl)) return;

    Record rec;
    rec.tp = std::chrono::system_clock::now();
    rec.lvl = lvl;
    rec.msg = msg;
    rec.file = file ? file : "";
    rec.line = line;
    rec.func = func ? func : "";

    writeRecord(rec);

    if (lvl >= Level::Error) {
        flush();
    }
}

} // namespace tagmenu
