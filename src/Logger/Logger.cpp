// === src/Logger/Logger.cpp ===
#include "Logger.hpp"
#include <cstring>
#include <ctime>
#include <fcntl.h>
#include <unistd.h>

static int g_log_fd = -1;

namespace Logger {

// Desc: open (append) the log file; empty path leaves logging disabled
// In: const std::string& path
// Out: bool (false if the file cannot be opened)
bool open(const std::string& path) {
    close();
    if (path.empty()) return true;
    g_log_fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    return g_log_fd != -1;
}

// Desc: append a timestamped line to the log file
// In: const std::string& msg
// Out: void
void log(const std::string& msg) {
    if (g_log_fd == -1) return;
    time_t now = ::time(nullptr);
    char buf[64];
    if (ctime_r(&now, buf) == nullptr) {
        buf[0] = '\0';
    } else {
        size_t len = std::strlen(buf);
        if (len > 0 && buf[len - 1] == '\n') buf[len - 1] = '\0';
    }
    std::string line = "[" + std::string(buf) + "] " + msg + "\n";
    ssize_t _wr = ::write(g_log_fd, line.c_str(), line.size());
    (void)_wr;
}

void close() {
    if (g_log_fd != -1) {
        ::close(g_log_fd);
        g_log_fd = -1;
    }
}

bool isOpen() {
    return g_log_fd != -1;
}
}
