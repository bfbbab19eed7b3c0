#pragma once

namespace conz {
namespace terminal {

/**
 * Get the terminal width in columns.
 * Falls back to the COLUMNS environment variable, then to 79.
 */
int get_width();

/**
 * Check if stdout is a TTY (interactive terminal).
 */
bool is_tty();

/**
 * Check if stderr is a TTY (interactive terminal).
 */
bool is_stderr_tty();

/**
 * Check if stdin is a TTY (interactive terminal).
 */
bool is_stdin_tty();

/**
 * Check whether the TERM environment variable names a terminal that
 * understands ANSI escape sequences (set and not "dumb").
 */
bool supports_ansi();

} // namespace terminal
} // namespace conz
