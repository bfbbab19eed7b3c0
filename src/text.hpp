#pragma once

/**
 * String helpers shared by the prompts and the console output.
 *
 * All functions are pure; none of them touch the terminal.
 */

#include <optional>
#include <string>

namespace conz {

// Default width used for rewrapping when nothing better is known.
constexpr int DEFAULT_WIDTH = 79;

// Removes spaces, tabs, carriage returns and newlines at both ends.
std::string trim(const std::string& s);

// ASCII lower-casing.
std::string to_lower(std::string s);

/**
 * Joins all lines of the input into one paragraph and wraps it.
 *
 * Each line is stripped before joining. Words longer than the width are
 * split across lines.
 */
std::string rewrap(const std::string& s, int width = DEFAULT_WIDTH);

/**
 * Rewraps text that contains several paragraphs.
 *
 * Paragraphs are separated by a blank line ("\n\n") and stay separated in
 * the output.
 */
std::string rewrap_long(const std::string& s, int width = DEFAULT_WIDTH);

// Strips whitespace from each line of the (trimmed) input.
std::string striplines(const std::string& s);

// Parses a trimmed decimal integer. Returns empty on any malformed input.
std::optional<int> safeint(const std::string& s);

} // namespace conz
