#pragma once
#include "line_reader.hpp"
#include "value.hpp"
#include <optional>
#include <string>

namespace tagmenu {

class ErrorReporter;

// Reads one line from the input channel and converts it to a requested
// kind. Never throws on malformed text: the failure is reported and none is
// returned so the caller can ask again.
class TypedReader {
public:
    TypedReader(LineReader& input, ErrorReporter& reporter)
    : _input(input), _reporter(reporter) {}

    // Emits prompt when given, consumes exactly one line.
    // None on parse failure, unsupported kind or end of input.
    ParsedValue read(ValueKind kind, const std::optional<std::string>& prompt = std::nullopt);

    template <typename T>
    std::optional<T> read(const std::optional<std::string>& prompt = std::nullopt) {
        if constexpr (ValueTraits<T>::supported) {
            ParsedValue v = read(ValueTraits<T>::kind, prompt);
            if (const T* p = v.template get<T>()) return *p;
            return std::nullopt;
        } else {
            // consume the line anyway, the caller asked for input
            read(ValueKind::None, prompt);
            return std::nullopt;
        }
    }

    // True once the input channel has reported end of stream.
    bool exhausted() const { return _input.atEnd(); }

private:
    LineReader& _input;
    ErrorReporter& _reporter;
};

} // namespace tagmenu
