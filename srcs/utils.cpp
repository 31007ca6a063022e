#include "utils.hpp"
#include <cstdio>
#include <cstdlib>
#include <cctype>
#include <readline/readline.h>
#include <readline/history.h>
#if !defined(_WIN32)
#include <sys/wait.h>
#endif

namespace tagmenu {

std::string trim(const std::string& s) {
    if (s.empty()) return s;
    size_t i = 0, j = s.size();
    while (i < j && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
    while (j > i && std::isspace(static_cast<unsigned char>(s[j - 1]))) --j;
    return s.substr(i, j - i);
}

std::string to_lower(std::string s) {
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

void replace_all(std::string& s, const std::string& from, const std::string& to) {
    if (from.empty()) return;
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

std::size_t utf8_length(const std::string& s) {
    std::size_t n = 0;
    for (unsigned char c : s) {
        // continuation bytes are 10xxxxxx
        if ((c & 0xC0) != 0x80) ++n;
    }
    return n;
}

int clear_screen() {
    // Flush pending output so it cannot land after the clear
    std::fflush(stdout);
#if defined(_WIN32)
    return std::system("cls");
#else
    int status = std::system("clear");
    if (status == -1) return -1;
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    return -1;
#endif
}

bool read_line(const std::string& prompt, std::string& out, bool addHistory) {
    char* in = readline(prompt.c_str());
    if (!in) return false; // EOF (Ctrl+D)
    out.assign(in);
    if (addHistory && !out.empty()) add_history(out.c_str());
    std::free(in);
    return true;
}

} // namespace tagmenu
