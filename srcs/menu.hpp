#pragma once
#include "config.hpp"
#include "discovery.hpp"
#include "errors.hpp"
#include "line_reader.hpp"
#include "registry.hpp"
#include "renderer.hpp"
#include "typed_reader.hpp"
#include "value.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <type_traits>

namespace tagmenu {

// Base class of an interactive text menu. A subclass registers its handler
// member functions in its constructor, then the owner calls run():
//
//   class App : public tagmenu::Menu {
//   public:
//       App() : Menu("MY COOL CLI APP") {
//           option("Info", "i", &App::info);
//           option("Quit", "q", &App::quit);
//           onUnknownInput(&App::unknown);
//       }
//       void info() { out() << "tagmenu demo\n"; }
//       bool quit() { return true; }            // true stops the loop
//       void unknown(RunFlag& flag) { ... }     // or stop through the flag
//   };
//
// Handlers return void or bool and may take RunFlag& and LineReader& in any
// order. A bool result stops the loop when true.
class Menu {
public:
    // Interactive: readline on a terminal, std::cin otherwise; std::cout/std::cerr.
    explicit Menu(std::string title, MenuConfig config = MenuConfig());
    // Throws std::invalid_argument when input is null.
    Menu(std::string title, std::unique_ptr<LineReader> input,
         std::ostream& out, std::ostream& err, MenuConfig config = MenuConfig());
    virtual ~Menu();

    Menu(const Menu&) = delete;
    Menu& operator=(const Menu&) = delete;

    // Render, read, dispatch until a handler stops the loop or input ends.
    // The input channel is closed when it returns; a second call returns at once.
    void run();

    // Option table access
    std::size_t size() const noexcept { return _registry.size(); }
    void add(Option option) { _registry.add(std::move(option)); }
    bool remove(const Option& option) { return _registry.remove(option); }
    Option remove(std::size_t index) { return _registry.remove(index); }
    const Option& get(std::size_t index) const { return _registry.get(index); }
    const OptionRegistry& options() const noexcept { return _registry; }
    bool hasUnknownInputHandler() const noexcept { return _registry.hasFallback(); }

    const std::string& title() const noexcept { return _renderer.title(); }

    // The frame as printed, including the prompt marker.
    std::string render() const { return _renderer.render(_registry); }

    // Iterations of the last run() and how many runtime errors it reported.
    unsigned iterations() const noexcept { return _iterations; }
    unsigned errorCount() const noexcept { return _reporter.count(); }

    // Replaces the screen clear; it signals failure by throwing IoFailure.
    void setScreenClearer(std::function<void()> clearer) { _clearer = std::move(clearer); }

    // Platform clear ("cls"/"clear"), waits for it. Throws IoFailure.
    static void clear();

protected:
    template <typename Self, typename R, typename... Args>
    void option(std::string name, std::string pattern, R (Self::*fn)(Args...)) {
        checkSelf<Self>();
        _registry.add(Option(std::move(name), std::move(pattern), bindMember(static_cast<Self*>(this), fn)));
    }

    template <typename Self, typename R, typename... Args>
    void option(std::string name, std::string pattern, R (Self::*fn)(Args...) const) {
        checkSelf<Self>();
        _registry.add(Option(std::move(name), std::move(pattern), bindMember(static_cast<Self*>(this), fn)));
    }

    // At most one per menu; a second one throws DuplicateFallbackHandler.
    template <typename Self, typename R, typename... Args>
    void onUnknownInput(R (Self::*fn)(Args...)) {
        checkSelf<Self>();
        _registry.setFallback(bindMember(static_cast<Self*>(this), fn));
    }

    template <typename Self, typename R, typename... Args>
    void onUnknownInput(R (Self::*fn)(Args...) const) {
        checkSelf<Self>();
        _registry.setFallback(bindMember(static_cast<Self*>(this), fn));
    }

    // Reads one more line for a handler, converted to kind. None when the
    // text does not parse (already reported) or input ended.
    ParsedValue read(ValueKind kind, const std::optional<std::string>& prompt = std::nullopt) {
        return _reader.read(kind, prompt);
    }

    template <typename T>
    std::optional<T> read(const std::optional<std::string>& prompt = std::nullopt) {
        return _reader.read<T>(prompt);
    }

    std::ostream& out() noexcept { return _out; }
    std::ostream& err() noexcept { return _err; }

private:
    template <typename Self>
    static void checkSelf() {
        static_assert(std::is_base_of<Menu, Self>::value && !std::is_same<Self, Menu>::value,
                      "handlers must be declared on a class derived from tagmenu::Menu");
    }

    void step(RunFlag& flag);
    void drawFrame();
    void dispatch(const Handler& handler, const std::string& origin, RunFlag& flag);
    void pauseAfterError();

    MenuConfig _config;
    std::ostream& _out;
    std::ostream& _err;
    std::unique_ptr<LineReader> _input;
    ErrorReporter _reporter;
    TypedReader _reader;
    Renderer _renderer;
    OptionRegistry _registry;
    std::function<void()> _clearer;
    unsigned _iterations = 0;
};

} // namespace tagmenu
