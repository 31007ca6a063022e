#pragma once
#include "line_reader.hpp"
#include <functional>
#include <memory>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

namespace tagmenu {

// "Keep running" flag of one run() call. A handler that takes a RunFlag&
// may stop the loop through it.
class RunFlag {
public:
    bool running() const noexcept { return _running; }
    void set(bool running) noexcept { _running = running; }
    void stop() noexcept { _running = false; }

private:
    bool _running = true;
};

// What the engine can pass to a handler.
enum class ParamKind {
    RunFlag,      // RunFlag&
    Input,        // LineReader&
    Unsupported   // anything else; invoking the handler fails
};

enum class ReturnKind { Void, Boolean };

const char* paramKindName(ParamKind kind) noexcept;

// Result of one invocation. Stopped carries the handler's boolean return,
// the engine sets the run flag to its negation.
struct Continued {};
struct Stopped { bool value; };
using Outcome = std::variant<Continued, Stopped>;

// Everything a handler's parameters can be resolved from.
struct InvokeContext {
    RunFlag& runFlag;
    LineReader& input;
};

// A bound handler routine with the signature captured at registration.
struct Handler {
    std::string identity;
    std::vector<ParamKind> params;
    ReturnKind returns = ReturnKind::Void;
    std::function<Outcome(InvokeContext&)> call;
};

// Checks the parameter kinds, then calls. Throws InvocationError (with
// origin) for an unsupported parameter kind.
Outcome invokeHandler(const Handler& handler, InvokeContext& ctx, const std::string& origin);

// One selectable menu entry. Immutable; equality is (name, pattern, handler).
class Option {
public:
    // name and pattern must be non-empty, handler non-null (std::invalid_argument)
    Option(std::string name, std::string pattern, std::shared_ptr<const Handler> handler);

    const std::string& name() const noexcept { return _name; }
    const std::string& pattern() const noexcept { return _pattern; }
    const Handler& handler() const noexcept { return *_handler; }
    const std::shared_ptr<const Handler>& handlerRef() const noexcept { return _handler; }
    const std::vector<ParamKind>& params() const noexcept { return _handler->params; }
    ReturnKind returns() const noexcept { return _handler->returns; }

    Outcome invoke(InvokeContext& ctx) const { return invokeHandler(*_handler, ctx, _name); }

    friend bool operator==(const Option& a, const Option& b) {
        return a._name == b._name && a._pattern == b._pattern
            && a._handler->identity == b._handler->identity;
    }
    friend bool operator!=(const Option& a, const Option& b) { return !(a == b); }

private:
    std::string _name;
    std::string _pattern;
    std::shared_ptr<const Handler> _handler;
};

std::ostream& operator<<(std::ostream& os, const Option& option);

} // namespace tagmenu
