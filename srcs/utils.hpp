#pragma once
#include <string>
#include <cstddef>

namespace tagmenu {

// Small helpers reused across the library
std::string trim(const std::string& s);
std::string to_lower(std::string s);
void replace_all(std::string& s, const std::string& from, const std::string& to);

// Number of code points in a UTF-8 string (continuation bytes are skipped).
std::size_t utf8_length(const std::string& s);

// Runs the platform clear command ("cls" on Windows, "clear" elsewhere) and
// waits for it. Returns the command's exit status, -1 if it could not run.
int clear_screen();

// Read one line using readline. Returns false on EOF (Ctrl+D).
// Non-empty lines go to the history when addHistory is set.
bool read_line(const std::string& prompt, std::string& out, bool addHistory = true);

} // namespace tagmenu
