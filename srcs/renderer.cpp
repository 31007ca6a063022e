#include "renderer.hpp"
#include "utils.hpp"
#include <sstream>

namespace tagmenu {

Renderer::Renderer(std::string title)
: _title(std::move(title)), _underline(underlineFor(_title)) {}

std::string Renderer::underlineFor(const std::string& title) {
    return std::string(utf8_length(title) * kUnderlineMultiplier, '=');
}

std::string Renderer::frame(const OptionRegistry& options) const {
    std::ostringstream out;
    out << "\n " << _title << "\n " << _underline << "\n";
    for (const Option& option : options) {
        out << "   (" << option.pattern() << ") " << option.name() << "\n";
    }
    out << "\n";
    return out.str();
}

std::string Renderer::render(const OptionRegistry& options) const {
    return frame(options) + kPromptMarker;
}

std::string render(const std::string& title, const OptionRegistry& options) {
    return Renderer(title).render(options);
}

} // namespace tagmenu
