#include "console.hpp"
#include "terminal.hpp"
#include "trace.hpp"

#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace conz {

// ========== Menu Helpers ==========

std::vector<std::string> number_choices(std::size_t n) {
    std::vector<std::string> keys;
    keys.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        keys.push_back(std::to_string(i + 1));
    }
    return keys;
}

std::string format_choice(const std::string& key, const std::string& label) {
    std::ostringstream oss;
    oss << std::setw(3) << std::right << key << ") " << label;
    return oss.str();
}

std::string clean_choice(const std::string& raw) {
    std::optional<int> number = safeint(raw);
    return number ? std::to_string(*number) : std::string();
}

// ========== Console ==========

Console::Console(Config config, std::ostream& out, std::ostream& err, std::istream& in)
    : config_(std::move(config)),
      color_(config_),
      err_color_(Color::detect(config_.color, terminal::is_stderr_tty())),
      out_(out),
      err_(err),
      in_(in) {}

void Console::pstd(const std::string& text, const std::string& end) const {
    out_ << text << end << std::flush;
}

void Console::perr(const std::string& text, const std::string& end) const {
    err_ << text << end << std::flush;
}

void Console::pverr(const std::string& value, const std::string& message) const {
    perr(value + ": " + message);
}

void Console::pverb(const std::string& text, const std::string& end) const {
    if (!config_.verbose) {
        return;
    }
    pstd(text, end);
}

void Console::quit(int code) const {
    out_ << std::flush;
    err_ << std::flush;
    std::exit(code);
}

std::optional<std::string> Console::read_line() const {
    check_interrupt();

    std::string line;
    if (!std::getline(in_, line)) {
        // A read cut short by SIGINT looks like end of input.
        if (interrupt_pending()) {
            in_.clear();
            check_interrupt();
        }
        return std::nullopt;
    }
    return line;
}

std::string Console::read(const std::string& prompt) const {
    return read(prompt, [](const std::string& s) { return s; });
}

std::string Console::rvpl(const std::string& prompt) const {
    return rvpl(prompt, ReadOptions<std::string>{});
}

bool Console::yesno(const std::string& prompt, const YesNoOptions& options) const {
    ReadOptions<std::string> read_options;
    read_options.error = options.error;
    read_options.intro = options.intro;
    read_options.clean = [](const std::string& s) { return to_lower(trim(s)); };
    read_options.validate = [](const std::string& s) {
        return s == "y" || s == "yes" || s == "n" || s == "no";
    };

    std::string full_prompt = prompt;
    if (!options.default_answer) {
        full_prompt += " (y/n):";
    } else if (*options.default_answer) {
        full_prompt += " (Y/n):";
        read_options.strict = false;
        read_options.default_value = "y";
    } else {
        full_prompt += " (y/N):";
        read_options.strict = false;
        read_options.default_value = "n";
    }

    std::string answer = rvpl(full_prompt, read_options);
    return answer == "y" || answer == "yes";
}

void Console::read_pipe(const std::function<void(const std::string&)>& on_line) const {
    std::string line;
    while (std::getline(in_, line)) {
        if (!in_.eof()) {
            line += '\n';
        }
        on_line(line);
    }
    check_interrupt();
}

void Console::read_pipe(std::size_t chunk,
                        const std::function<void(const std::vector<std::string>&)>& on_chunk) const {
    if (chunk == 0) {
        throw UsageError("Chunk size must be positive");
    }

    std::vector<std::string> lines;
    read_pipe([&](const std::string& line) {
        lines.push_back(line);
        if (lines.size() == chunk) {
            on_chunk(lines);
            lines.clear();
        }
    });
    if (!lines.empty()) {
        on_chunk(lines);
    }
}

bool Console::in_terminal() const {
    return terminal::is_stdin_tty();
}

bool Console::out_terminal() const {
    return terminal::is_tty();
}

void Console::register_signals(SignalMode mode) const {
    install_signal_handlers(mode);
}

// ========== Progress ==========

ErrorHandler Console::error(const std::string& message, std::optional<int> exit_code) const {
    return [this, message, exit_code](const std::exception_ptr& failure) {
        if (!message.empty()) {
            std::string text = message;
            const std::string placeholder = "{err}";
            const std::string description = describe(failure);
            size_t pos = 0;
            while ((pos = text.find(placeholder, pos)) != std::string::npos) {
                text.replace(pos, placeholder.size(), description);
                pos += description.size();
            }
            perr(text);
        }
        if (exit_code) {
            quit(*exit_code);
        }
    };
}

ErrorHandler Console::error() const {
    return error(config_.error_template);
}

ErrorHandler Console::resolve_error_handler(const ProgressOptions& options) const {
    if (const auto* handler = std::get_if<ErrorHandler>(&options.on_error)) {
        if (*handler) {
            return *handler;
        }
    }
    if (const auto* message = std::get_if<std::string>(&options.on_error)) {
        if (!message->empty()) {
            return error(*message);
        }
    }
    return error();
}

Outcome Console::progress(const std::string& message, const std::function<void(Progress&)>& body,
                          const ProgressOptions& options) const {
    ErrorHandler on_error = resolve_error_handler(options);

    pverb(message, options.separator.value_or(config_.separator));
    Progress step(
        [this](const std::string& text, const std::string& end) { pverb(text, end); },
        color_,
        options.done.value_or(config_.done),
        options.fail.value_or(config_.fail),
        options.tick.value_or(config_.tick));

    try {
        body(step);
        if (step.state() == Progress::State::running) {
            step.succeed();
        }
        if (step.state() == Progress::State::aborted) {
            throw ProgressAbort();
        }
        return Outcome::succeeded;
    } catch (const ProgressOK&) {
        // A signal that did not come from this step's handle (nested code).
        if (!step.resolved()) {
            step.succeed("", {}, true);
        }
        // The printed banner decides the outcome.
        if (step.state() == Progress::State::aborted) {
            if (options.reraise) {
                throw ProgressAbort();
            }
            return Outcome::aborted;
        }
        return Outcome::succeeded;
    } catch (const ProgressAbort&) {
        if (!step.resolved()) {
            step.abort("", {}, true);
        }
        if (options.reraise) {
            throw;
        }
        return Outcome::aborted;
    } catch (const Interrupted&) {
        throw;
    } catch (const ProgrammingError&) {
        throw;
    } catch (...) {
        std::exception_ptr failure = std::current_exception();
        bool intercepted = std::any_of(options.intercept.begin(), options.intercept.end(),
                                       [&failure](const ExceptionMatcher& matches) {
                                           return matches && matches(failure);
                                       });
        if (!intercepted) {
            throw;
        }

        if (!step.resolved()) {
            step.abort("", {}, true);
        }
        on_error(failure);
        if (config_.debug) {
            write_exception_trace(err_, err_color_, "progress", failure);
        }
        if (options.reraise) {
            throw ProgressAbort();
        }
        return Outcome::aborted;
    }
}

} // namespace conz
