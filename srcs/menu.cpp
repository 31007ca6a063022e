#include "menu.hpp"
#include "debug.hpp"
#include "log.hpp"
#include "utils.hpp"
#include <iostream>
#include <stdexcept>
#include <unistd.h>

namespace tagmenu {

namespace {

std::unique_ptr<LineReader> default_input(const MenuConfig& config) {
    if (isatty(STDIN_FILENO)) {
        return std::unique_ptr<LineReader>(new ReadlineReader(config.history));
    }
    return std::unique_ptr<LineReader>(new StreamLineReader(std::cin, std::cout));
}

// Closes the input channel on every way out of run()
class InputGuard {
public:
    explicit InputGuard(LineReader& input) : _input(input) {}
    ~InputGuard() { _input.close(); }
    InputGuard(const InputGuard&) = delete;
    InputGuard& operator=(const InputGuard&) = delete;
private:
    LineReader& _input;
};

const char* const kUnknownInputOrigin = "on-unknown-input";

std::unique_ptr<LineReader> require_input(std::unique_ptr<LineReader> input) {
    if (!input) throw std::invalid_argument("Menu needs an input channel");
    return input;
}

} // namespace

Menu::Menu(std::string title, MenuConfig config)
: Menu(std::move(title), default_input(config), std::cout, std::cerr, config) {}

Menu::Menu(std::string title, std::unique_ptr<LineReader> input,
           std::ostream& out, std::ostream& err, MenuConfig config)
: _config(config),
  _out(out),
  _err(err),
  _input(require_input(std::move(input))),
  _reporter(err),
  _reader(*_input, _reporter),
  _renderer(std::move(title)),
  _clearer(&Menu::clear) {
    TAGMENU_LOG_DEBUG() << "Menu '" << _renderer.title() << "' created";
}

Menu::~Menu() {
    if (_input) _input->close();
}

void Menu::clear() {
    int status = clear_screen();
    if (status != 0) {
        throw IoFailure("screen clear failed (status " + std::to_string(status) + ")", "screen");
    }
}

void Menu::run() {
    DebugTools::ScopeTrace trace("Menu::run");
    _iterations = 0;
    if (!_input->isOpen()) {
        TAGMENU_LOG_WARN() << "run() called on menu '" << title() << "' after its input was closed";
        return;
    }
    InputGuard guard(*_input);

    RunFlag flag;
    unsigned ioFailures = 0;
    TAGMENU_LOG_INFO() << "Menu '" << title() << "' running with " << size() << " options"
                       << (hasUnknownInputHandler() ? " and an unknown-input handler" : "");

    while (flag.running()) {
        try {
            step(flag);
            ioFailures = 0;
        } catch (const IoFailure& e) {
            _reporter.report(e);
            ++ioFailures;
            if (_config.maxConsecutiveIoFailures != 0 && ioFailures >= _config.maxConsecutiveIoFailures) {
                TAGMENU_LOG_ERROR() << "Giving up after " << ioFailures << " consecutive I/O failures";
                flag.stop();
                break;
            }
            pauseAfterError();
        } catch (const Error& e) {
            _reporter.report(e);
            pauseAfterError();
        }
        if (flag.running() && !_input->isOpen()) {
            TAGMENU_LOG_WARN() << "Input channel closed by a handler, stopping";
            flag.stop();
        }
    }
    TAGMENU_LOG_INFO() << "Menu '" << title() << "' stopped after " << _iterations << " iterations";
}

void Menu::step(RunFlag& flag) {
    ++_iterations;
    drawFrame();

    ParsedValue line = _reader.read(ValueKind::Text, std::string(kPromptMarker));
    if (line.isNone()) {
        if (_reader.exhausted()) {
            TAGMENU_LOG_INFO() << "EOF received, exiting loop";
            flag.stop();
        }
        return;
    }

    const std::string& input = *line.get<std::string>();
    const Option* match = input.empty() ? nullptr : _registry.find(input);
    if (!match) {
        if (_registry.hasFallback()) {
            TAGMENU_LOG_DEBUG() << "Unknown input '" << input << "', calling the unknown-input handler";
            // hold a reference: the handler may edit the registry
            std::shared_ptr<const Handler> fallback = _registry.fallback();
            dispatch(*fallback, kUnknownInputOrigin, flag);
        } else {
            TAGMENU_LOG_DEBUG() << "Unknown input '" << input << "' ignored";
        }
        return;
    }

    const Option chosen = *match;
    TAGMENU_LOG_DEBUG() << "Dispatch '" << chosen.pattern() << "' -> " << chosen.name();
    dispatch(chosen.handler(), chosen.name(), flag);
}

void Menu::drawFrame() {
    if (_config.clearScreen && _clearer) _clearer();
    _out << _renderer.frame(_registry);
    _out.flush();
}

void Menu::dispatch(const Handler& handler, const std::string& origin, RunFlag& flag) {
    InvokeContext ctx{flag, *_input};
    Outcome outcome;
    try {
        DebugTools::ScopeTimer timer(origin);
        outcome = invokeHandler(handler, ctx, origin);
    } catch (const Error&) {
        throw;
    } catch (const std::exception& e) {
        throw InvocationError(e.what(), origin);
    } catch (...) {
        throw InvocationError("unknown exception", origin);
    }

    if (const Stopped* stopped = std::get_if<Stopped>(&outcome)) {
        // the flag means "keep running"
        flag.set(!stopped->value);
    }
    if (!flag.running()) {
        TAGMENU_LOG_DEBUG() << "'" << origin << "' stopped the menu";
    }
}

void Menu::pauseAfterError() {
    if (!_config.pauseOnError || !_input->isOpen() || _input->atEnd()) return;
    try {
        _input->readLine("Press Enter to continue...");
    } catch (const IoFailure& e) {
        TAGMENU_LOG_WARN() << "Pause after error failed: " << e.what();
    }
}

} // namespace tagmenu
