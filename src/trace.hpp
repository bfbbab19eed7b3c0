#pragma once

/**
 * Diagnostic output for the console helpers.
 *
 * Provides timestamped category lines and the exception trace printed by
 * progress scopes when debug mode is enabled.
 */

#include "color.hpp"
#include "errors.hpp"

#include <chrono>
#include <ctime>
#include <exception>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <string>

namespace conz {

/**
 * Get current timestamp as string.
 */
inline std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_now;
    localtime_r(&time_t_now, &tm_now);

    std::ostringstream oss;
    oss << std::put_time(&tm_now, "%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

/**
 * Write a diagnostic line with timestamp and category.
 */
inline void trace_line(std::ostream& out, const Color& color,
                       const std::string& category, const std::string& message) {
    out << color.white("[" + timestamp() + "]", "dim") << " "
        << color.cyan("[" + category + "]") << " " << message << std::endl;
}

/**
 * Text describing a captured exception.
 *
 * Uses what() for std::exception and Interrupted, a fixed text otherwise.
 */
inline std::string describe(const std::exception_ptr& error) {
    if (!error) {
        return "no error";
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (const Interrupted& e) {
        return e.what();
    } catch (...) {
        return "unknown error";
    }
}

/**
 * Write the full chain of a captured exception, outermost first.
 *
 * Exceptions thrown with std::throw_with_nested() contribute one line per
 * nesting level.
 */
inline void write_exception_trace(std::ostream& out, const Color& color,
                                  const std::string& category,
                                  const std::exception_ptr& error) {
    trace_line(out, color, category, color.red("Traceback (outermost first):"));

    std::exception_ptr current = error;
    int depth = 0;
    while (current) {
        std::exception_ptr next;
        try {
            std::rethrow_exception(current);
        } catch (const std::exception& e) {
            try {
                std::rethrow_if_nested(e);
            } catch (...) {
                next = std::current_exception();
            }
        } catch (...) {
            // Non-standard exceptions carry no nested chain.
        }

        out << std::string(2 * (depth + 1), ' ') << describe(current) << std::endl;
        current = next;
        ++depth;
    }
}

} // namespace conz
