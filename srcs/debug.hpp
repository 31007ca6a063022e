#pragma once
#include <string>
#include <cstddef>

namespace tagmenu {

class DebugTools {
public:
    // Log a call stack if available (Linux/glibc), at Debug level
    static void logCallstack(std::size_t maxFrames = 32);

    // RAII: measure scope time, logged at Debug
    class ScopeTimer {
    public:
        explicit ScopeTimer(const std::string& name);
        ~ScopeTimer();
    private:
        std::string _name;
        unsigned long long _startNs;
    };

    // RAII: trace enter/leave
    class ScopeTrace {
    public:
        explicit ScopeTrace(const std::string& name);
        ~ScopeTrace();
    private:
        std::string _name;
    };
};

} // namespace tagmenu
