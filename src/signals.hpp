#pragma once

/**
 * SIGINT / SIGPIPE handling for interactive programs.
 *
 * Handlers are installed once at program start. SIGPIPE always terminates
 * the process silently with status 1.
 */

namespace conz {

// What happens when the user presses Ctrl+C.
enum class SignalMode {
    exit,   // Print a notice to stderr and exit with status 1.
    raise   // Record the interrupt; the next input read throws Interrupted.
};

// Notice printed by SignalMode::exit.
constexpr const char* INTERRUPT_NOTICE = "\nQuitting program due to keyboard interrupt\n";

// Installs the SIGINT and SIGPIPE handlers.
void install_signal_handlers(SignalMode mode = SignalMode::exit);

// Returns true if an interrupt was recorded and not yet consumed.
bool interrupt_pending();

// Forgets a recorded interrupt.
void clear_interrupt();

// Records an interrupt as if SIGINT had arrived in SignalMode::raise.
void request_interrupt();

// Throws Interrupted (and clears the flag) if an interrupt is pending.
void check_interrupt();

} // namespace conz
