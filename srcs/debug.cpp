#include "debug.hpp"
#include "log.hpp"
#include <algorithm>
#include <cstdlib>
#include <ctime>

#if defined(__linux__)
#include <execinfo.h>
#endif

namespace tagmenu {

static unsigned long long now_ns() {
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return static_cast<unsigned long long>(ts.tv_sec) * 1000000000ull + static_cast<unsigned long long>(ts.tv_nsec);
}

void DebugTools::logCallstack(std::size_t maxFrames) {
#if defined(__linux__)
    void* addrs[64];
    int n = backtrace(addrs, static_cast<int>(std::min<std::size_t>(maxFrames, 64)));
    char** syms = backtrace_symbols(addrs, n);
    if (!syms) {
        TAGMENU_LOG_WARN() << "backtrace_symbols failed";
        return;
    }
    // frame 0 is this function
    TAGMENU_LOG_DEBUG() << "Call stack (" << (n - 1) << " frames):";
    for (int i = 1; i < n; ++i) {
        TAGMENU_LOG_DEBUG() << "  " << syms[i];
    }
    std::free(syms);
#else
    TAGMENU_LOG_DEBUG() << "Call stack not available on this platform";
#endif
}

DebugTools::ScopeTimer::ScopeTimer(const std::string& name)
: _name(name), _startNs(now_ns()) {}

DebugTools::ScopeTimer::~ScopeTimer() {
    unsigned long long elapsed = now_ns() - _startNs;
    TAGMENU_LOG_DEBUG() << "Timer [" << _name << "] " << (static_cast<double>(elapsed) / 1e6) << " ms";
}

DebugTools::ScopeTrace::ScopeTrace(const std::string& name)
: _name(name) {
    TAGMENU_LOG_TRACE() << "Enter: " << _name;
}

DebugTools::ScopeTrace::~ScopeTrace() {
    TAGMENU_LOG_TRACE() << "Leave: " << _name;
}

} // namespace tagmenu
