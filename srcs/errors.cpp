#include "errors.hpp"
#include "debug.hpp"
#include "log.hpp"

namespace tagmenu {

void ErrorReporter::report(const Error& e) {
    report(e, e.origin());
}

void ErrorReporter::report(const std::exception& e, const std::string& origin) {
    ++_count;
    _err << "Error: " << e.what() << "\n";
    if (!origin.empty()) _err << " at " << origin << "\n";
    _err.flush();

    TAGMENU_LOG_ERROR() << e.what() << " (origin: " << (origin.empty() ? "?" : origin) << ")";
    if (Logger::instance().shouldLog(Logger::Level::Debug)) {
        DebugTools::logCallstack();
    }
}

} // namespace tagmenu
