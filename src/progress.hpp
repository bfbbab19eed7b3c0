#pragma once

/**
 * Step progress reporting.
 *
 * A progress step prints a start message, lets the caller's code run, and
 * ends with exactly one banner: the success banner (green) or the abort
 * banner (red). The caller's code receives a Progress handle and may end the
 * step early from any depth with succeed() or abort(), which unwind through
 * the ProgressOK / ProgressAbort signals. The signals are not std::exception
 * types, so `catch (const std::exception&)` in caller code lets them pass.
 *
 * Usage:
 *   console.progress("Checking files", [&](Progress& step) {
 *       for (const auto& f : files) {
 *           if (!check(f)) step.abort();
 *           step.tick();
 *       }
 *   });
 */

#include "color.hpp"

#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace conz {

// ========== Outcome Signals ==========

// Base of the signals that end a step early.
class ProgressEnd {
public:
    virtual ~ProgressEnd() = default;
};

// The step succeeded.
class ProgressOK : public ProgressEnd {};

// The step failed. Re-raised to the caller unless the scope says otherwise.
class ProgressAbort : public ProgressEnd {};

// Result of a step that was not re-raised.
enum class Outcome {
    succeeded,
    aborted
};

// ========== Failure Interception ==========

// Receives the failure that ended a step.
using ErrorHandler = std::function<void(const std::exception_ptr&)>;

// Decides whether a step intercepts a failure.
using ExceptionMatcher = std::function<bool(const std::exception_ptr&)>;

// Matches failures of type E (or derived from E).
template <typename E>
ExceptionMatcher catches() {
    return [](const std::exception_ptr& error) {
        try {
            std::rethrow_exception(error);
        } catch (const E&) {
            return true;
        } catch (...) {
            return false;
        }
    };
}

// Matches every failure, whatever its type.
inline ExceptionMatcher catches_anything() {
    return [](const std::exception_ptr&) { return true; };
}

/**
 * Per-step settings. Unset banners fall back to the console config.
 */
struct ProgressOptions {
    std::optional<std::string> separator;  // Printed after the start message.
    std::optional<std::string> done;       // Success banner.
    std::optional<std::string> fail;       // Abort banner.
    std::optional<std::string> tick;       // Progress mark.

    // Failures converted into an aborted step. Others propagate untouched.
    std::vector<ExceptionMatcher> intercept = {catches<std::exception>()};

    // Handler for intercepted failures: a function, or a message template
    // for Console::error(). Unset or empty text selects Console::error().
    std::variant<std::monostate, std::string, ErrorHandler> on_error;

    // Re-raise ProgressAbort after an aborted step.
    bool reraise = true;
};

/**
 * Handle passed to the body of a progress step.
 */
class Progress {
public:
    // Prints text followed by end (the console's verbose output).
    using Printer = std::function<void(const std::string& text, const std::string& end)>;

    enum class State {
        running,
        succeeded,
        aborted
    };

    Progress(Printer printer, const Color& color,
             std::string done = "DONE", std::string fail = "FAIL", std::string tick = ".");

    /**
     * Prints the success banner and raises ProgressOK.
     * @param message Banner text, defaults to the step's success banner
     * @param post Called after the banner is printed, before the signal
     * @param no_signal Return to the caller instead of raising
     * @throws ProgressMisuse if the step already printed its banner
     */
    void succeed(const std::string& message = "", const std::function<void()>& post = {},
                 bool no_signal = false);

    /**
     * Prints the abort banner and raises ProgressAbort.
     * Same parameters as succeed().
     */
    void abort(const std::string& message = "", const std::function<void()>& post = {},
               bool no_signal = false);

    // Prints a progress mark without a line break.
    void tick(const std::string& mark = "");

    State state() const { return state_; }

    // True once a banner has been printed.
    bool resolved() const { return state_ != State::running; }

private:
    Printer printer_;
    const Color& color_;
    std::string done_;
    std::string fail_;
    std::string tick_;
    State state_ = State::running;

    void resolve(State state, const std::string& banner, const std::function<void()>& post);
};

} // namespace conz
