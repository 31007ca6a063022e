#include "registry.hpp"
#include "errors.hpp"
#include "log.hpp"
#include <algorithm>
#include <stdexcept>

namespace tagmenu {

void OptionRegistry::add(Option option) {
    if (const Option* first = find(option.pattern())) {
        TAGMENU_LOG_WARN() << "Pattern '" << option.pattern() << "' of option '" << option.name()
                           << "' is already used by '" << first->name() << "'; it will never be selected";
    }
    TAGMENU_LOG_DEBUG() << "Registered " << option;
    _options.push_back(std::move(option));
}

bool OptionRegistry::remove(const Option& option) {
    auto it = std::find(_options.begin(), _options.end(), option);
    if (it == _options.end()) return false;
    _options.erase(it);
    return true;
}

Option OptionRegistry::remove(std::size_t index) {
    if (index >= _options.size()) {
        throw std::out_of_range("option index " + std::to_string(index) + " out of range (size "
                                + std::to_string(_options.size()) + ")");
    }
    Option removed = _options[index];
    _options.erase(_options.begin() + static_cast<std::ptrdiff_t>(index));
    return removed;
}

const Option& OptionRegistry::get(std::size_t index) const {
    return _options.at(index);
}

const Option* OptionRegistry::find(const std::string& input) const {
    for (const Option& option : _options) {
        if (option.pattern() == input) return &option;
    }
    return nullptr;
}

void OptionRegistry::setFallback(std::shared_ptr<const Handler> handler) {
    if (_fallback) {
        throw DuplicateFallbackHandler(handler ? handler->identity : std::string("on-unknown-input"));
    }
    _fallback = std::move(handler);
}

} // namespace tagmenu
