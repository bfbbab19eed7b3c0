#pragma once

#include "settings.hpp"

#include <map>
#include <string>

namespace conz {

// ========== ANSI Codes ==========

// Numeric SGR codes for each axis of a color specification.
namespace ansi {
    inline const std::map<std::string, int> COLORS = {
        {"black", 30}, {"red", 31}, {"green", 32}, {"yellow", 33},
        {"blue", 34}, {"purple", 35}, {"cyan", 36}, {"white", 37}
    };

    inline const std::map<std::string, int> BACKGROUNDS = {
        {"black", 40}, {"red", 41}, {"green", 42}, {"yellow", 43},
        {"blue", 44}, {"purple", 45}, {"cyan", 46}, {"white", 47}
    };

    inline const std::map<std::string, int> STYLES = {
        {"bold", 1}, {"dim", 2}, {"italic", 3},
        {"underline", 4}, {"blink", 5}, {"reverse", 7}
    };

    constexpr const char* RESET = "\033[0m";
}

/**
 * Colorizes text with ANSI escape sequences.
 *
 * Names are looked up exactly; an unknown name throws LookupError rather than
 * falling back to uncolored text. When rendering is disabled the input text
 * is returned unchanged and no escape byte is ever produced.
 */
class Color {
public:
    // Creates a codec with rendering explicitly enabled or disabled.
    explicit Color(bool enabled);

    // Creates a codec whose rendering state follows the config color mode.
    explicit Color(const Config& config);

    // Decides whether colors should be rendered on stdout for the given mode.
    static bool detect(ColorMode mode);

    // Same decision for a stream whose terminal state is already known.
    static bool detect(ColorMode mode, bool is_terminal);

    bool enabled() const { return enabled_; }

    // Refresh hook for programs that redirect output after startup.
    void set_enabled(bool enabled) { enabled_ = enabled; }

    /**
     * Renders text in the given foreground color.
     * @param fg Foreground color name (required)
     * @param style Optional style name, empty for none
     * @param bg Optional background color name, empty for none
     */
    std::string color(const std::string& text, const std::string& fg,
                      const std::string& style = "", const std::string& bg = "") const;

    // ========== Named Foregrounds ==========

    std::string black(const std::string& text, const std::string& style = "", const std::string& bg = "") const;
    std::string red(const std::string& text, const std::string& style = "", const std::string& bg = "") const;
    std::string green(const std::string& text, const std::string& style = "", const std::string& bg = "") const;
    std::string yellow(const std::string& text, const std::string& style = "", const std::string& bg = "") const;
    std::string blue(const std::string& text, const std::string& style = "", const std::string& bg = "") const;
    std::string purple(const std::string& text, const std::string& style = "", const std::string& bg = "") const;
    std::string cyan(const std::string& text, const std::string& style = "", const std::string& bg = "") const;
    std::string white(const std::string& text, const std::string& style = "", const std::string& bg = "") const;

private:
    bool enabled_;  // True if escape sequences are emitted.
};

} // namespace conz
