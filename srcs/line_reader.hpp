#pragma once
#include <istream>
#include <optional>
#include <ostream>
#include <string>

namespace tagmenu {

// The raw input channel. One line per call; the menu owns it exclusively
// and closes it exactly once.
class LineReader {
public:
    virtual ~LineReader() = default;

    // Emits prompt (may be empty), then blocks for one line without its
    // terminator. Returns nullopt at end of stream; throws IoFailure on a
    // stream error or when the reader is closed.
    virtual std::optional<std::string> readLine(const std::string& prompt) = 0;

    // Idempotent.
    virtual void close() = 0;
    virtual bool isOpen() const = 0;

    // True once readLine() has reported end of stream.
    virtual bool atEnd() const = 0;
};

// GNU readline on the process terminal.
class ReadlineReader : public LineReader {
public:
    explicit ReadlineReader(bool history = true);
    ~ReadlineReader() override;

    std::optional<std::string> readLine(const std::string& prompt) override;
    void close() override;
    bool isOpen() const override { return _open; }
    bool atEnd() const override { return _eof; }

private:
    bool _history;
    bool _open = true;
    bool _eof = false;
};

// Reads from any std::istream and echoes the prompt to an std::ostream.
// Used for piped input and in tests.
class StreamLineReader : public LineReader {
public:
    StreamLineReader(std::istream& in, std::ostream& echo);
    ~StreamLineReader() override;

    std::optional<std::string> readLine(const std::string& prompt) override;
    void close() override;
    bool isOpen() const override { return _open; }
    bool atEnd() const override { return _eof; }

    unsigned closeCount() const noexcept { return _closeCount; }

private:
    std::istream& _in;
    std::ostream& _echo;
    bool _open = true;
    bool _eof = false;
    unsigned _closeCount = 0;
};

} // namespace tagmenu
