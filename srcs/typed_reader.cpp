#include "typed_reader.hpp"
#include "errors.hpp"
#include "log.hpp"
#include <stdexcept>

namespace tagmenu {

namespace {

class ParseFailure : public std::invalid_argument {
public:
    ParseFailure(ValueKind kind, const std::string& text)
    : std::invalid_argument(kind == ValueKind::None
                                ? std::string("unsupported input type")
                                : "cannot read '" + text + "' as " + kindName(kind)) {}
};

} // namespace

ParsedValue TypedReader::read(ValueKind kind, const std::optional<std::string>& prompt) {
    std::optional<std::string> line = _input.readLine(prompt ? *prompt : std::string());
    if (!line) {
        TAGMENU_LOG_DEBUG() << "end of input while reading " << kindName(kind);
        return ParsedValue::none();
    }

    ParsedValue value = parseValue(kind, *line);
    if (value.isNone()) {
        // reported, not raised: callers retry on none
        _reporter.report(ParseFailure(kind, *line), "input");
        return value;
    }
    TAGMENU_LOG_TRACE() << "read " << kindName(kind) << ": " << value;
    return value;
}

} // namespace tagmenu
