#pragma once
#include <stdexcept>
#include <string>
#include <ostream>
#include <utility>

namespace tagmenu {

// Base of every error the engine raises. origin() names where it happened
// (an option's display name, "on-unknown-input", "input", "screen", ...).
class Error : public std::runtime_error {
public:
    Error(const std::string& message, std::string origin)
    : std::runtime_error(message), _origin(std::move(origin)) {}

    const std::string& origin() const noexcept { return _origin; }

private:
    std::string _origin;
};

// A second @OnUnknownInput-style handler was registered. Raised from the
// menu's constructor, so the menu never exists.
class DuplicateFallbackHandler : public Error {
public:
    explicit DuplicateFallbackHandler(const std::string& origin)
    : Error("Only one handler for unknown input is possible", origin) {}
};

// A handler threw, or asked for a parameter kind the engine cannot supply.
class InvocationError : public Error {
public:
    using Error::Error;
};

// The input channel or the screen clear failed.
class IoFailure : public Error {
public:
    using Error::Error;
};

// Writes runtime errors to the user's error stream and to the log.
class ErrorReporter {
public:
    explicit ErrorReporter(std::ostream& err) : _err(err) {}

    void report(const Error& e);
    void report(const std::exception& e, const std::string& origin);

    unsigned count() const noexcept { return _count; }

private:
    std::ostream& _err;
    unsigned _count = 0;
};

} // namespace tagmenu
