#pragma once

#include "color.hpp"
#include "errors.hpp"
#include "message.hpp"
#include "progress.hpp"
#include "settings.hpp"
#include "signals.hpp"
#include "text.hpp"

#include <algorithm>
#include <cstddef>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace conz {

// ========== Prompt Options ==========

// Default cleaner and validator of read-validate-print loops.
template <typename T>
struct ReadDefaults {
    // No generic way to build a T from text; callers must pass a cleaner.
    static std::function<T(const std::string&)> clean() { return {}; }
    static std::function<bool(const T&)> validate() {
        return [](const T&) { return true; };
    }
};

template <>
struct ReadDefaults<std::string> {
    static std::function<std::string(const std::string&)> clean() {
        return [](const std::string& s) { return trim(s); };
    }
    static std::function<bool(const std::string&)> validate() {
        return [](const std::string& s) { return !s.empty(); };
    }
};

/**
 * Settings of a read-validate-print loop.
 *
 * The cleaner turns the raw input line into a T, the validator decides
 * whether that value is acceptable.
 */
template <typename T = std::string>
struct ReadOptions {
    std::function<T(const std::string&)> clean;   // Empty: ReadDefaults<T>::clean().
    std::function<bool(const T&)> validate;       // Empty: ReadDefaults<T>::validate().
    MessageSource<T> error = "Entered value is invalid";
    std::string intro;                            // Printed once above the prompt.
    bool strict = true;                           // Keep asking until valid.
    T default_value{};                            // Returned by non-strict loops on bad input.
};

// Settings of Console::yesno().
struct YesNoOptions {
    MessageSource<std::string> error = "Please type either y or n";
    std::string intro;
    std::optional<bool> default_answer;  // Unset: an answer is required.
};

// One entry of a menu: the value returned and the label shown.
template <typename V>
struct MenuChoice {
    V value;
    std::string label;
};

// Settings of Console::menu().
template <typename V>
struct MenuOptions {
    std::string prompt = "Please choose from the provided options:";
    MessageSource<std::string> error = "Invalid choice";
    std::string intro;
    bool strict = true;
    V default_value{};

    // Keys shown in front of the labels. Empty: number_choices().
    std::function<std::vector<std::string>(std::size_t)> numerator;
    // Formats one menu line. Empty: format_choice().
    std::function<std::string(const std::string& key, const std::string& label)> formatter;
    // Turns the input line into a key. Empty: clean_choice().
    std::function<std::string(const std::string&)> clean;
};

// Returns the keys "1" to "n".
std::vector<std::string> number_choices(std::size_t n);

// Formats a menu line as "  1) label" (key right-aligned to 3 columns).
std::string format_choice(const std::string& key, const std::string& label);

// Parses a menu answer as an integer key; empty if it is not one.
std::string clean_choice(const std::string& raw);

/**
 * Console helper for small interactive programs.
 *
 * Wraps the standard output, error output and input streams with colored
 * output, verbose-only output, prompts that validate their answers, menus
 * and progress steps. All output is flushed after every write.
 */
class Console {
public:
    // Creates a Console over the given streams.
    explicit Console(Config config = Config{},
                     std::ostream& out = std::cout,
                     std::ostream& err = std::cerr,
                     std::istream& in = std::cin);

    const Config& config() const { return config_; }
    const Color& color() const { return color_; }
    bool verbose() const { return config_.verbose; }
    bool debug() const { return config_.debug; }

    // ========== Output ==========

    // Prints to standard output.
    void pstd(const std::string& text = "", const std::string& end = "\n") const;

    // Prints to error output.
    void perr(const std::string& text = "", const std::string& end = "\n") const;

    // Prints "value: message" to error output.
    void pverr(const std::string& value, const std::string& message) const;

    // Prints to standard output only in verbose mode.
    void pverb(const std::string& text = "", const std::string& end = "\n") const;

    // Terminates the program with the given status.
    void quit(int code = 0) const;

    // ========== Input ==========

    // Reads one line. Returns empty optional at end of input.
    // Throws Interrupted if an interrupt is pending.
    std::optional<std::string> read_line() const;

    /**
     * Displays a prompt and returns the answer passed through clean.
     * @throws EndOfInput if the input is closed
     */
    template <typename Clean>
    auto read(const std::string& prompt, Clean clean) const -> decltype(clean(std::string())) {
        out_ << prompt << " " << std::flush;
        std::optional<std::string> line = read_line();
        if (!line) {
            throw EndOfInput();
        }
        return clean(*line);
    }

    // Displays a prompt and returns the raw answer.
    std::string read(const std::string& prompt) const;

    /**
     * Read-validate-print loop returning empty optional on non-strict fallback.
     *
     * Reads until the cleaned answer passes the validator. A rejected answer
     * prints the error message in strict mode, and ends the loop with an
     * empty result otherwise.
     */
    template <typename T>
    std::optional<T> read_valid(const std::string& prompt, const ReadOptions<T>& options) const {
        auto clean = options.clean ? options.clean : ReadDefaults<T>::clean();
        auto validate = options.validate ? options.validate : ReadDefaults<T>::validate();
        if (!clean) {
            throw UsageError("A cleaner is required to read non-string values");
        }

        if (!options.intro.empty()) {
            pstd(rewrap_long(options.intro, config_.effective_width()));
        }

        T value = read(prompt, clean);
        while (!validate(value)) {
            if (!options.strict) {
                return std::nullopt;
            }
            perr(options.error.resolve(value));
            value = read(prompt, clean);
        }
        return value;
    }

    // Read-validate-print loop; non-strict loops return options.default_value.
    template <typename T>
    T rvpl(const std::string& prompt, const ReadOptions<T>& options) const {
        std::optional<T> value = read_valid(prompt, options);
        if (!value) {
            return options.default_value;
        }
        return std::move(*value);
    }

    // Read-validate-print loop over trimmed, non-empty strings.
    std::string rvpl(const std::string& prompt) const;

    /**
     * Asks a yes or no question.
     *
     * The prompt gets a " (y/n):" hint, or " (Y/n):" / " (y/N):" when a
     * default answer is set. With a default, invalid or empty answers
     * return the default.
     */
    bool yesno(const std::string& prompt, const YesNoOptions& options = {}) const;

    /**
     * Prints a numbered menu and returns the value of the chosen entry.
     *
     * Loops until a displayed key is entered. In non-strict mode an invalid
     * answer returns options.default_value instead.
     */
    template <typename V>
    V menu(const std::vector<MenuChoice<V>>& choices, const MenuOptions<V>& options = {}) const {
        std::function<std::vector<std::string>(std::size_t)> numerator = options.numerator;
        if (!numerator) numerator = number_choices;
        std::function<std::string(const std::string&, const std::string&)> formatter = options.formatter;
        if (!formatter) formatter = format_choice;

        const std::vector<std::string> keys = numerator(choices.size());
        if (keys.size() != choices.size()) {
            throw UsageError("Menu numerator must return one key per choice");
        }

        if (!options.intro.empty()) {
            pstd("\n" + rewrap_long(options.intro, config_.effective_width()));
        }
        for (size_t i = 0; i < choices.size(); ++i) {
            pstd(formatter(keys[i], choices[i].label));
        }

        ReadOptions<std::string> read_options;
        read_options.clean = options.clean;
        if (!read_options.clean) read_options.clean = clean_choice;
        read_options.validate = [&keys](const std::string& key) {
            return std::find(keys.begin(), keys.end(), key) != keys.end();
        };
        read_options.error = options.error;
        read_options.strict = options.strict;

        std::optional<std::string> key = read_valid(options.prompt, read_options);
        if (!key) {
            return options.default_value;
        }
        auto pos = std::find(keys.begin(), keys.end(), *key);
        return choices[static_cast<size_t>(pos - keys.begin())].value;
    }

    // ========== Pipes ==========

    // Calls on_line for each input line (newline kept when present).
    void read_pipe(const std::function<void(const std::string&)>& on_line) const;

    // Calls on_chunk with groups of chunk lines; the last group may be shorter.
    void read_pipe(std::size_t chunk,
                   const std::function<void(const std::vector<std::string>&)>& on_chunk) const;

    // True if stdin is an interactive terminal.
    bool in_terminal() const;

    // True if stdout is an interactive terminal.
    bool out_terminal() const;

    // ========== Signals ==========

    // Installs SIGINT / SIGPIPE handlers (see install_signal_handlers()).
    void register_signals(SignalMode mode = SignalMode::exit) const;

    // ========== Progress ==========

    /**
     * Error handler factory for progress steps.
     *
     * The returned handler prints message (with "{err}" replaced by the
     * failure text) to error output, then quits with exit_code if one is
     * given. An empty message prints nothing. The handler refers to this
     * console and must not outlive it.
     */
    ErrorHandler error(const std::string& message, std::optional<int> exit_code = std::nullopt) const;

    // Error handler using the configured error template.
    ErrorHandler error() const;

    /**
     * Runs body as one progress step.
     *
     * Prints message and the separator (verbose only), runs body, then:
     *   - body returns: success banner, Outcome::succeeded
     *   - ProgressOK: Outcome::succeeded
     *   - ProgressAbort: rethrown if options.reraise, else Outcome::aborted
     *   - Interrupted, ProgrammingError: propagated untouched
     *   - intercepted failure: abort banner, error handler, trace in debug
     *     mode, then ProgressAbort if options.reraise, else Outcome::aborted
     *   - anything else: propagated untouched
     */
    Outcome progress(const std::string& message, const std::function<void(Progress&)>& body,
                     const ProgressOptions& options = {}) const;

private:
    Config config_;
    Color color_;
    Color err_color_;  // Rendering state of the error sink.
    std::ostream& out_;
    std::ostream& err_;
    std::istream& in_;

    ErrorHandler resolve_error_handler(const ProgressOptions& options) const;
};

} // namespace conz
