#pragma once
#include "registry.hpp"
#include <cstddef>
#include <string>

namespace tagmenu {

// Underline length = title length (in characters) times this.
constexpr std::size_t kUnderlineMultiplier = 2;

// Printed before the input line is read.
constexpr const char* kPromptMarker = " > ";

// Formats the menu. The underline is computed once, on construction.
//
//   <blank>
//    TITLE
//    ==========
//      (h) Help
//      (q) Quit
//   <blank>
//    >
class Renderer {
public:
    explicit Renderer(std::string title);

    const std::string& title() const noexcept { return _title; }
    const std::string& underline() const noexcept { return _underline; }

    // Everything up to and including the blank line before the prompt marker.
    std::string frame(const OptionRegistry& options) const;

    // frame() followed by the prompt marker.
    std::string render(const OptionRegistry& options) const;

    static std::string underlineFor(const std::string& title);

private:
    std::string _title;
    std::string _underline;
};

std::string render(const std::string& title, const OptionRegistry& options);

} // namespace tagmenu
