#include "signals.hpp"
#include "errors.hpp"

#include <signal.h>
#include <unistd.h>

#include <csignal>
#include <cstring>

namespace conz {

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

// Handles SIGINT (Ctrl+C) by quitting.
void on_interrupt_exit(int) {
    ssize_t written = ::write(STDERR_FILENO, INTERRUPT_NOTICE, std::strlen(INTERRUPT_NOTICE));
    (void)written;
    ::_exit(1);
}

// Handles SIGINT (Ctrl+C) by recording it for the reader.
void on_interrupt_raise(int) {
    g_interrupted = 1;
}

// Handles SIGPIPE (downstream closed).
void on_pipe(int) {
    ::_exit(1);
}

void install(int signum, void (*handler)(int)) {
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;  // no SA_RESTART: a blocked read returns so the interrupt is seen
    sigaction(signum, &sa, nullptr);
}

} // namespace

void install_signal_handlers(SignalMode mode) {
    install(SIGINT, mode == SignalMode::exit ? on_interrupt_exit : on_interrupt_raise);
    install(SIGPIPE, on_pipe);
}

bool interrupt_pending() {
    return g_interrupted != 0;
}

void clear_interrupt() {
    g_interrupted = 0;
}

void request_interrupt() {
    g_interrupted = 1;
}

void check_interrupt() {
    if (interrupt_pending()) {
        clear_interrupt();
        throw Interrupted();
    }
}

} // namespace conz
