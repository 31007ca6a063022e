#pragma once
#include "option.hpp"
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace tagmenu {

// Ordered option table plus at most one unknown-input handler.
// Insertion order is dispatch order and render order. Options sharing a
// pattern are kept, but only the first one is ever selected.
class OptionRegistry {
public:
    using const_iterator = std::vector<Option>::const_iterator;

    void add(Option option);
    bool remove(const Option& option);
    Option remove(std::size_t index);               // std::out_of_range
    const Option& get(std::size_t index) const;     // std::out_of_range

    std::size_t size() const noexcept { return _options.size(); }
    bool empty() const noexcept { return _options.empty(); }
    const_iterator begin() const noexcept { return _options.begin(); }
    const_iterator end() const noexcept { return _options.end(); }

    // First option whose pattern equals input exactly, or nullptr.
    const Option* find(const std::string& input) const;

    // Throws DuplicateFallbackHandler when one is already set.
    void setFallback(std::shared_ptr<const Handler> handler);
    bool hasFallback() const noexcept { return static_cast<bool>(_fallback); }
    const std::shared_ptr<const Handler>& fallback() const noexcept { return _fallback; }

private:
    std::vector<Option> _options;
    std::shared_ptr<const Handler> _fallback;
};

} // namespace tagmenu
