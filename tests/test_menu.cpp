/**
 * @file test_menu.cpp
 * @brief Render, read, dispatch loop of tagmenu::Menu.
 */

#include "menu.hpp"
#include "support/scripted_menu.hpp"
#include "gtest/gtest.h"

#include <stdexcept>
#include <vector>

using namespace tagmenu;
using tagmenu_test::Console;
using tagmenu_test::ScriptedMenu;
using tagmenu_test::countOf;
using tagmenu_test::quietConfig;

namespace {

// Help / Quit menu from the README
class CoolApp : public ScriptedMenu {
public:
    explicit CoolApp(Console& c, MenuConfig config = quietConfig())
    : ScriptedMenu("MY COOL CLI APP", c, config) {
        option("Help", "h", &CoolApp::help);
        option("Quit", "q", &CoolApp::quit);
    }

    void help() { calls.push_back("help"); }
    bool quit() { calls.push_back("quit"); return true; }

    std::vector<std::string> calls;
};

class FallbackApp : public ScriptedMenu {
public:
    explicit FallbackApp(Console& c) : ScriptedMenu("F", c) {
        option("Help", "h", &FallbackApp::help);
        option("Quit", "q", &FallbackApp::quit);
        onUnknownInput(&FallbackApp::unknown);
    }

    void help() { ++helps; }
    bool quit() { return true; }
    void unknown() { ++unknowns; }

    int helps = 0;
    int unknowns = 0;
};

// Fallback declared const: it only looks at the menu
class ConstFallbackApp : public ScriptedMenu {
public:
    explicit ConstFallbackApp(Console& c) : ScriptedMenu("C", c) {
        option("Quit", "q", &ConstFallbackApp::quit);
        onUnknownInput(&ConstFallbackApp::unknown);
    }
    bool quit() { return true; }
    void unknown(RunFlag& flag) const {
        ++unknowns;
        if (unknowns == 2) flag.stop();
    }
    mutable int unknowns = 0;
};

class TwoFallbacks : public ScriptedMenu {
public:
    explicit TwoFallbacks(Console& c) : ScriptedMenu("Broken", c) {
        option("Quit", "q", &TwoFallbacks::quit);
        onUnknownInput(&TwoFallbacks::first);
        onUnknownInput(&TwoFallbacks::second);
    }
    bool quit() { return true; }
    void first() {}
    void second() {}
};

class DuplicatePatterns : public ScriptedMenu {
public:
    explicit DuplicatePatterns(Console& c) : ScriptedMenu("Dup", c) {
        option("First", "x", &DuplicatePatterns::first);
        option("Second", "x", &DuplicatePatterns::second);
        option("Quit", "q", &DuplicatePatterns::quit);
    }
    void first() { calls.push_back("first"); }
    void second() { calls.push_back("second"); }
    bool quit() { return true; }
    std::vector<std::string> calls;
};

class FlagApp : public ScriptedMenu {
public:
    explicit FlagApp(Console& c, MenuConfig config = quietConfig()) : ScriptedMenu("Flags", c, config) {
        option("Keep going", "k", &FlagApp::keepGoing);
        option("Exit", "e", &FlagApp::exit);
        option("Ask", "a", &FlagApp::ask);
        option("Sum", "s", &FlagApp::sum);
        option("Boom", "b", &FlagApp::boom);
        option("Bad signature", "w", &FlagApp::wrong);
        option("Throw int", "t", &FlagApp::throwInt);
    }

    bool keepGoing() { ++kept; return false; }
    void exit(RunFlag& flag) { flag.stop(); }
    void ask(LineReader& input, RunFlag& flag) {
        std::optional<std::string> answer = input.readLine("sure? ");
        if (answer && *answer == "yes") flag.stop();
    }
    void sum() {
        std::optional<std::int32_t> a = read<std::int32_t>(std::string("a: "));
        std::optional<std::int32_t> b = read<std::int32_t>(std::string("b: "));
        if (a && b) total = *a + *b;
        else total = -1;
    }
    void boom() { throw std::runtime_error("kaboom"); }
    void wrong(int) { ++wrongCalls; }
    void throwInt() { throw 7; }

    int kept = 0;
    int total = 0;
    int wrongCalls = 0;
};

}  // namespace

// ============================================================================
// CONSTRUCTION
// ============================================================================

TEST(MenuTest, RegistersEveryOptionInOrder) {
    Console c("");
    FallbackApp app(c);
    EXPECT_EQ(2u, app.size());
    EXPECT_EQ("Help", app.get(0).name());
    EXPECT_EQ("Quit", app.get(1).name());
    EXPECT_TRUE(app.hasUnknownInputHandler());
}

TEST(MenuTest, SecondUnknownInputHandlerAbortsConstruction) {
    Console c("q\n");
    EXPECT_THROW(TwoFallbacks app(c), DuplicateFallbackHandler);
}

// ============================================================================
// SCENARIO AND TERMINATION
// ============================================================================

TEST(MenuTest, NullInputChannelIsRejected) {
    std::ostringstream out;
    std::ostringstream err;
    EXPECT_THROW(Menu("T", nullptr, out, err), std::invalid_argument);
}

TEST(MenuTest, ConstMemberCanHandleUnknownInput) {
    Console c("zz\nyy\n");
    ConstFallbackApp app(c);
    EXPECT_TRUE(app.hasUnknownInputHandler());
    app.run();
    EXPECT_EQ(2, app.unknowns);
    EXPECT_EQ(2u, app.iterations());
}

TEST(MenuTest, QuitReturningTrueStopsAfterOneIteration) {
    Console c("q\n");
    CoolApp app(c);
    app.run();

    EXPECT_EQ(1u, app.iterations());
    EXPECT_EQ(std::vector<std::string>{"quit"}, app.calls);
    const std::string expected =
        "\n MY COOL CLI APP\n"
        " ==============================\n"
        "   (h) Help\n"
        "   (q) Quit\n"
        "\n > ";
    EXPECT_EQ(expected, c.out.str());
}

TEST(MenuTest, ReturningFalseKeepsRunning) {
    Console c("k\nk\ne\n");
    FlagApp app(c);
    app.run();
    EXPECT_EQ(2, app.kept);
    EXPECT_EQ(3u, app.iterations());
}

TEST(MenuTest, VoidHandlerDoesNotTouchTheFlag) {
    Console c("h\nh\nq\n");
    CoolApp app(c);
    app.run();
    EXPECT_EQ((std::vector<std::string>{"help", "help", "quit"}), app.calls);
    EXPECT_EQ(3u, countOf(c.out.str(), " MY COOL CLI APP\n"));
}

TEST(MenuTest, RunFlagParameterStopsTheLoop) {
    Console c("e\nk\n");
    FlagApp app(c);
    app.run();
    EXPECT_EQ(1u, app.iterations());
    EXPECT_EQ(0, app.kept);
}

TEST(MenuTest, InputChannelParameterReadsTheNextLine) {
    Console c("a\nno\na\nyes\nk\n");
    FlagApp app(c);
    app.run();
    EXPECT_EQ(2u, app.iterations());
    EXPECT_EQ(0, app.kept);
    EXPECT_EQ(2u, countOf(c.out.str(), "sure? "));
}

TEST(MenuTest, EndOfInputEndsTheLoop) {
    Console c("h\n");
    CoolApp app(c);
    app.run();
    EXPECT_EQ(2u, app.iterations());
    EXPECT_EQ(std::vector<std::string>{"help"}, app.calls);
}

// ============================================================================
// MATCHING
// ============================================================================

TEST(MenuTest, FirstDeclaredPatternWins) {
    Console c("x\nx\nq\n");
    DuplicatePatterns app(c);
    app.run();
    EXPECT_EQ((std::vector<std::string>{"first", "first"}), app.calls);
}

TEST(MenuTest, UnknownInputCallsFallbackOnce) {
    Console c("zzz\nq\n");
    FallbackApp app(c);
    app.run();
    EXPECT_EQ(1, app.unknowns);
    EXPECT_EQ(0, app.helps);
}

TEST(MenuTest, EmptyLineCallsFallback) {
    Console c("\nq\n");
    FallbackApp app(c);
    app.run();
    EXPECT_EQ(1, app.unknowns);
}

TEST(MenuTest, MatchIsExactAndCaseSensitive) {
    Console c("H\n h\nh\nq\n");
    FallbackApp app(c);
    app.run();
    EXPECT_EQ(2, app.unknowns);
    EXPECT_EQ(1, app.helps);
}

TEST(MenuTest, UnknownInputWithoutFallbackRedrawsSilently) {
    Console c("nope\n\nq\n");
    CoolApp app(c);
    app.run();
    EXPECT_EQ(std::vector<std::string>{"quit"}, app.calls);
    EXPECT_EQ(3u, app.iterations());
    EXPECT_EQ(0u, app.errorCount());
    EXPECT_EQ("", c.err.str());
}

// ============================================================================
// TYPED INPUT INSIDE HANDLERS
// ============================================================================

TEST(MenuTest, HandlerReadsTypedValues) {
    Console c("s\n40\n2\ne\n");
    FlagApp app(c);
    app.run();
    EXPECT_EQ(42, app.total);
    EXPECT_NE(std::string::npos, c.out.str().find("a: b: "));
}

TEST(MenuTest, MalformedTypedValueIsNoneNotFatal) {
    Console c("s\nforty\n2\ne\n");
    FlagApp app(c);
    app.run();
    EXPECT_EQ(-1, app.total);
    EXPECT_EQ(2u, app.iterations());
    EXPECT_NE(std::string::npos, c.err.str().find("cannot read 'forty' as integer"));
}

// ============================================================================
// ERRORS
// ============================================================================

TEST(MenuTest, HandlerExceptionIsReportedAndLoopContinues) {
    Console c("b\ne\n");
    FlagApp app(c);
    app.run();
    EXPECT_EQ(2u, app.iterations());
    EXPECT_EQ(1u, app.errorCount());
    EXPECT_NE(std::string::npos, c.err.str().find("Error: kaboom\n at Boom\n"));
}

TEST(MenuTest, UnsupportedParameterIsAnInvocationError) {
    Console c("w\ne\n");
    FlagApp app(c);
    app.run();
    EXPECT_EQ(0, app.wrongCalls);
    EXPECT_EQ(1u, app.errorCount());
    EXPECT_NE(std::string::npos, c.err.str().find(" at Bad signature\n"));
}

TEST(MenuTest, PauseAfterErrorConsumesOneLine) {
    MenuConfig config = quietConfig();
    config.pauseOnError = true;
    Console c("b\nk\ne\n");
    FlagApp app(c, config);
    app.run();
    // "k" was swallowed by the pause
    EXPECT_EQ(0, app.kept);
    EXPECT_NE(std::string::npos, c.out.str().find("Press Enter to continue..."));
}

TEST(MenuTest, NonStandardExceptionIsReportedAndLoopContinues) {
    Console c("t\ne\n");
    FlagApp app(c);
    EXPECT_NO_THROW(app.run());
    EXPECT_EQ(2u, app.iterations());
    EXPECT_EQ(1u, app.errorCount());
    EXPECT_NE(std::string::npos, c.err.str().find("Error: unknown exception\n at Throw int\n"));
    EXPECT_EQ(1u, c.reader->closeCount());
}

// ============================================================================
// RESOURCES AND SCREEN
// ============================================================================

TEST(MenuTest, InputIsClosedExactlyOnce) {
    Console c("q\n");
    CoolApp app(c);
    app.run();
    EXPECT_FALSE(c.reader->isOpen());
    app.run();
    EXPECT_EQ(1u, c.reader->closeCount());
    EXPECT_EQ(0u, app.iterations());
}

TEST(MenuTest, ScreenIsClearedBeforeEveryFrame) {
    MenuConfig config = quietConfig();
    config.clearScreen = true;
    Console c("h\nq\n");
    CoolApp app(c, config);
    int clears = 0;
    app.setScreenClearer([&clears] { ++clears; });
    app.run();
    EXPECT_EQ(2, clears);
}

TEST(MenuTest, ScreenClearFailureIsReportedAndRetried) {
    MenuConfig config = quietConfig();
    config.clearScreen = true;
    Console c("q\n");
    CoolApp app(c, config);
    int attempts = 0;
    app.setScreenClearer([&attempts] {
        if (++attempts == 1) throw IoFailure("clear exited with 1", "screen");
    });
    app.run();
    EXPECT_EQ(2, attempts);
    EXPECT_EQ(1u, app.errorCount());
    EXPECT_EQ(std::vector<std::string>{"quit"}, app.calls);
    EXPECT_NE(std::string::npos, c.err.str().find(" at screen\n"));
}

TEST(MenuTest, RepeatedIoFailuresStopWhenLimited) {
    MenuConfig config = quietConfig();
    config.clearScreen = true;
    config.maxConsecutiveIoFailures = 3;
    Console c("q\n");
    CoolApp app(c, config);
    app.setScreenClearer([] { throw IoFailure("no terminal", "screen"); });
    app.run();
    EXPECT_EQ(3u, app.errorCount());
    EXPECT_TRUE(app.calls.empty());
}

TEST(MenuTest, RenderMatchesPrintedFrame) {
    Console c("q\n");
    CoolApp app(c);
    const std::string frame = app.render();
    app.run();
    EXPECT_EQ(frame, c.out.str());
}

TEST(MenuTest, OptionsCanBeEditedAfterConstruction) {
    Console c("x\nq\n");
    CoolApp app(c);
    int extra = 0;
    app.add(Option("Extra", "x", bindCallable([&extra] { ++extra; })));
    EXPECT_EQ(3u, app.size());
    EXPECT_TRUE(app.remove(app.get(0)));
    app.run();
    EXPECT_EQ(1, extra);
    EXPECT_EQ(std::string::npos, c.out.str().find("(h) Help"));
}
