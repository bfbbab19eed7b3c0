#include "terminal.hpp"
#include "text.hpp"

#include <sys/ioctl.h>
#include <unistd.h>

#include <cstdlib>
#include <string>

namespace conz {
namespace terminal {

int get_width() {
    struct winsize ws;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0) {
        return ws.ws_col;
    }

    // Try COLUMNS environment variable
    const char* columns = std::getenv("COLUMNS");
    if (columns) {
        int width = std::atoi(columns);
        if (width > 0) {
            return width;
        }
    }

    return DEFAULT_WIDTH;
}

bool is_tty() {
    return isatty(STDOUT_FILENO) != 0;
}

bool is_stderr_tty() {
    return isatty(STDERR_FILENO) != 0;
}

bool is_stdin_tty() {
    return isatty(STDIN_FILENO) != 0;
}

bool supports_ansi() {
    const char* term = std::getenv("TERM");
    return term && std::string(term) != "dumb";
}

} // namespace terminal
} // namespace conz
