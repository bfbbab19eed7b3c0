#include "color.hpp"
#include "errors.hpp"
#include "terminal.hpp"

#include <cstdlib>

namespace conz {

namespace {

int lookup(const std::map<std::string, int>& table, const char* axis, const std::string& name) {
    auto it = table.find(name);
    if (it == table.end()) {
        throw LookupError(axis, name);
    }
    return it->second;
}

} // namespace

Color::Color(bool enabled) : enabled_(enabled) {}

Color::Color(const Config& config) : enabled_(detect(config.color)) {}

bool Color::detect(ColorMode mode) {
    return detect(mode, terminal::is_tty());
}

bool Color::detect(ColorMode mode, bool is_terminal) {
    switch (mode) {
        case ColorMode::always: return true;
        case ColorMode::never: return false;
        case ColorMode::automatic: break;
    }
#ifdef _WIN32
    return false;
#else
    if (std::getenv("ANSI_COLORS_DISABLED")) {
        return false;
    }
    return is_terminal && terminal::supports_ansi();
#endif
}

std::string Color::color(const std::string& text, const std::string& fg,
                         const std::string& style, const std::string& bg) const {
    // Resolve every name first so a bad one fails regardless of enabled_.
    std::string codes = std::to_string(lookup(ansi::COLORS, "color", fg));
    if (!style.empty()) {
        codes += ";" + std::to_string(lookup(ansi::STYLES, "style", style));
    }
    if (!bg.empty()) {
        codes += ";" + std::to_string(lookup(ansi::BACKGROUNDS, "background", bg));
    }

    if (!enabled_) {
        return text;
    }
    return "\033[" + codes + "m" + text + ansi::RESET;
}

std::string Color::black(const std::string& text, const std::string& style, const std::string& bg) const {
    return color(text, "black", style, bg);
}

std::string Color::red(const std::string& text, const std::string& style, const std::string& bg) const {
    return color(text, "red", style, bg);
}

std::string Color::green(const std::string& text, const std::string& style, const std::string& bg) const {
    return color(text, "green", style, bg);
}

std::string Color::yellow(const std::string& text, const std::string& style, const std::string& bg) const {
    return color(text, "yellow", style, bg);
}

std::string Color::blue(const std::string& text, const std::string& style, const std::string& bg) const {
    return color(text, "blue", style, bg);
}

std::string Color::purple(const std::string& text, const std::string& style, const std::string& bg) const {
    return color(text, "purple", style, bg);
}

std::string Color::cyan(const std::string& text, const std::string& style, const std::string& bg) const {
    return color(text, "cyan", style, bg);
}

std::string Color::white(const std::string& text, const std::string& style, const std::string& bg) const {
    return color(text, "white", style, bg);
}

} // namespace conz
