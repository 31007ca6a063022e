#include "line_reader.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "utils.hpp"
#include <readline/readline.h>
#include <readline/history.h>

namespace tagmenu {

ReadlineReader::ReadlineReader(bool history)
: _history(history) {
    if (_history) using_history();
    TAGMENU_LOG_DEBUG() << "readline input opened (history=" << (_history ? "on" : "off") << ")";
}

ReadlineReader::~ReadlineReader() {
    close();
}

std::optional<std::string> ReadlineReader::readLine(const std::string& prompt) {
    if (!_open) throw IoFailure("read on a closed input channel", "input");
    std::string line;
    if (!read_line(prompt, line, _history)) {
        _eof = true;
        return std::nullopt;
    }
    return line;
}

void ReadlineReader::close() {
    if (!_open) return;
    _open = false;
    if (_history) clear_history();
    TAGMENU_LOG_DEBUG() << "readline input closed";
}

StreamLineReader::StreamLineReader(std::istream& in, std::ostream& echo)
: _in(in), _echo(echo) {}

StreamLineReader::~StreamLineReader() {
    close();
}

std::optional<std::string> StreamLineReader::readLine(const std::string& prompt) {
    if (!_open) throw IoFailure("read on a closed input channel", "input");
    if (!prompt.empty()) {
        _echo << prompt;
        _echo.flush();
    }
    std::string line;
    if (!std::getline(_in, line)) {
        if (_in.bad()) throw IoFailure("input stream failed", "input");
        _eof = true;
        return std::nullopt;
    }
    if (!line.empty() && line.back() == '\r') line.pop_back();
    return line;
}

void StreamLineReader::close() {
    if (!_open) return;
    _open = false;
    ++_closeCount;
}

} // namespace tagmenu
