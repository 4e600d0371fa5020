#pragma once

#include <sys/ioctl.h>
#include <unistd.h>
#include <cstdlib>
#include <string>
#include <string_view>
#include <fmt/core.h>

namespace ci::util {

inline int term_width(const int fd = STDOUT_FILENO) {
    if (!isatty(fd)) return 80;
    winsize ws{};
    if (ioctl(fd, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0) return ws.ws_col;
    const char* c = std::getenv("COLUMNS");
    if (c) { int n = std::atoi(c); if (n > 0) return n; }
    return 80;
}

inline bool is_tty(const int fd = STDOUT_FILENO) { return isatty(fd) == 1; }

inline std::string ellipsize_middle(std::string s, size_t maxw) {
    if (s.size() <= maxw || maxw < 5) return s;
    const size_t keep = (maxw - 3) / 2;
    const size_t tail = maxw - 3 - keep;
    return s.substr(0, keep) + "..." + s.substr(s.size() - tail);
}

// Overwrites the current terminal line
inline std::string status_line(std::string_view prefix, std::string_view text, size_t width) {
    const size_t room = width > prefix.size() + 1 ? width - prefix.size() - 1 : 0;
    auto body = ellipsize_middle(std::string(text), room);
    return fmt::format("\r{}{:<{}}", prefix, body, room);
}

}
