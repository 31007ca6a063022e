#include "config.hpp"
#include "log.hpp"
#include "menu.hpp"
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>

namespace {

class DemoApp : public tagmenu::Menu {
public:
    explicit DemoApp(const tagmenu::MenuConfig& config)
    : Menu("MY COOL CLI APP", config) {
        option("Info", "i", &DemoApp::info);
        option("Greet", "g", &DemoApp::greet);
        option("Add numbers", "a", &DemoApp::add);
        option("Quit", "q", &DemoApp::quit);
        onUnknownInput(&DemoApp::unknown);
    }

    void info() {
        out() << "\ntagmenu demo: every entry above is a member function of DemoApp.\n";
        read(tagmenu::ValueKind::Text, std::string("Press Enter to go back..."));
    }

    void greet() {
        std::optional<std::string> name = read<std::string>(std::string("Your name: "));
        if (!name) return;
        out() << "Hello, " << (name->empty() ? std::string("stranger") : *name) << "!\n";
        read(tagmenu::ValueKind::Text, std::string("Press Enter to go back..."));
    }

    void add() {
        std::optional<std::int64_t> a = read<std::int64_t>(std::string("First number: "));
        if (!a) return;
        std::optional<std::int64_t> b = read<std::int64_t>(std::string("Second number: "));
        if (!b) return;
        std::int64_t sum = 0;
        if (tagmenu::checked_add(*a, *b, sum)) {
            out() << *a << " + " << *b << " = " << sum << "\n";
        } else {
            err() << "Error: " << *a << " + " << *b << " does not fit in 64 bits\n";
        }
        read(tagmenu::ValueKind::Text, std::string("Press Enter to go back..."));
    }

    bool quit() {
        std::optional<bool> sure = read<bool>(std::string("Quit? (true/false): "));
        return sure.value_or(false);
    }

    void unknown(tagmenu::RunFlag& flag, tagmenu::LineReader& input) {
        std::optional<std::string> again = input.readLine("Unknown option. Type 'exit' to leave, Enter to retry: ");
        if (!again || *again == "exit") flag.stop();
    }
};

} // namespace

int main() {
    tagmenu::AppConfig config = tagmenu::loadConfig();

    if (!tagmenu::applyLogConfig(config.log)) {
        std::cerr << "warning: cannot open log file '" << config.log.file << "'\n";
    }
    for (const std::string& w : config.warnings) {
        TAGMENU_LOG_WARN() << w;
    }

    TAGMENU_LOG_INFO() << "tagmenu demo starting";
    try {
        DemoApp app(config.menu);
        app.run();
    } catch (const tagmenu::DuplicateFallbackHandler& e) {
        TAGMENU_LOG_FATAL() << e.what() << " (" << e.origin() << ")";
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    TAGMENU_LOG_INFO() << "tagmenu demo exited";
    tagmenu::Logger::instance().flush();
    return 0;
}
