#include "option.hpp"
#include "errors.hpp"
#include <stdexcept>

namespace tagmenu {

const char* paramKindName(ParamKind kind) noexcept {
    switch (kind) {
        case ParamKind::RunFlag:     return "run-flag";
        case ParamKind::Input:       return "input";
        case ParamKind::Unsupported: return "unsupported";
    }
    return "unknown";
}

Outcome invokeHandler(const Handler& handler, InvokeContext& ctx, const std::string& origin) {
    for (std::size_t i = 0; i < handler.params.size(); ++i) {
        if (handler.params[i] == ParamKind::Unsupported) {
            throw InvocationError("parameter " + std::to_string(i + 1)
                                  + " has a type the menu cannot supply (accepted: RunFlag&, LineReader&)",
                                  origin);
        }
    }
    if (!handler.call) throw InvocationError("handler is not callable", origin);
    return handler.call(ctx);
}

Option::Option(std::string name, std::string pattern, std::shared_ptr<const Handler> handler)
: _name(std::move(name)), _pattern(std::move(pattern)), _handler(std::move(handler)) {
    if (_name.empty()) throw std::invalid_argument("option name must not be empty");
    if (_pattern.empty()) throw std::invalid_argument("option '" + _name + "' needs a non-empty pattern");
    if (!_handler) throw std::invalid_argument("option '" + _name + "' has no handler");
}

std::ostream& operator<<(std::ostream& os, const Option& option) {
    os << "Option{name='" << option.name() << "', pattern='" << option.pattern()
       << "', handler=" << option.handler().identity << "(";
    const auto& params = option.params();
    for (std::size_t i = 0; i < params.size(); ++i) {
        if (i) os << ", ";
        os << paramKindName(params[i]);
    }
    os << ") -> " << (option.returns() == ReturnKind::Boolean ? "bool" : "void") << "}";
    return os;
}

} // namespace tagmenu
