#pragma once

/**
 * Console configuration.
 *
 * A Config is built once at program start (defaults, optional JSON file,
 * environment overrides) and handed to the Console, which passes the
 * relevant parts on to the color codec and the progress scopes.
 */

#include <optional>
#include <string>

namespace conz {

// ========== File Locations ==========

constexpr const char* CONFIG_FILE = ".conz.json";     // Default config file.
constexpr const char* CONFIG_ENV = "CONZ_CONFIG";     // Overrides CONFIG_FILE.

// Color rendering policy.
enum class ColorMode {
    automatic,  // Detect from the terminal and the environment.
    always,
    never
};

// Parses "auto", "always" or "never". Throws ConfigError otherwise.
ColorMode parse_color_mode(const std::string& value);

// Inverse of parse_color_mode().
std::string to_string(ColorMode mode);

/**
 * Settings shared by every console component.
 */
struct Config {
    bool verbose = false;                    // Show banners, ticks and pverb() output.
    bool debug = false;                      // Dump exception traces for intercepted failures.
    ColorMode color = ColorMode::automatic;  // Color rendering policy.
    int width = 0;                           // Wrap width; 0 means detect.

    // Progress banner defaults.
    std::string separator = "...";
    std::string done = "DONE";
    std::string fail = "FAIL";
    std::string tick = ".";

    // Default message of the recovery handler; {err} is the failure text.
    std::string error_template = "Program error: {err}";

    // Returns the configured width, or the detected terminal width.
    int effective_width() const;
};

// Loads a config file. Returns empty optional if the file doesn't exist.
// Throws ConfigError if it exists but is malformed.
std::optional<Config> load_config(const std::string& path);

// Saves a config file as indented JSON.
void save_config(const Config& config, const std::string& path);

/**
 * Applies environment overrides to a config.
 *
 * CONZ_VERBOSE, CONZ_DEBUG: "1", "true" or "yes" enable, anything else disables.
 * CONZ_COLOR: auto, always or never.
 * ANSI_COLORS_DISABLED: when set, forces ColorMode::never.
 * COLUMNS: used as width when the config does not set one.
 */
Config apply_environment(Config config);

// Loads CONZ_CONFIG or .conz.json (if present), then applies the environment.
Config load_default_config();

} // namespace conz
