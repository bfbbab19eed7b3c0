#include "console.hpp"
#include "settings.hpp"

#include <CLI/CLI.hpp>

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>

using namespace conz;

// ========== Tours ==========

// Shows every foreground color with and without styles and backgrounds.
void show_colors(const Console& console) {
    const Color& c = console.color();
    console.pstd(c.black("black", "", "white") + " " + c.red("red") + " " + c.green("green") + " " +
                 c.yellow("yellow") + " " + c.blue("blue") + " " + c.purple("purple") + " " +
                 c.cyan("cyan") + " " + c.white("white"));
    for (const auto& [style, code] : ansi::STYLES) {
        console.pstd(c.cyan(style, style) + " (" + std::to_string(code) + ")");
    }
    for (const auto& [bg, code] : ansi::BACKGROUNDS) {
        console.pstd(c.white("on " + bg, "bold", bg));
    }
}

// Runs a few steps that succeed, fail and report progress.
void show_progress(const Console& console) {
    auto pause = [](int ms) { std::this_thread::sleep_for(std::chrono::milliseconds(ms)); };

    console.progress("Waiting", [&](Progress&) { pause(500); });

    ProgressOptions quiet_failure;
    quiet_failure.reraise = false;
    console.progress("Failing", [&](Progress&) {
        pause(500);
        throw std::runtime_error("This is a gratuitous error");
    }, quiet_failure);

    console.progress("Progressing", [&](Progress& step) {
        for (int i = 0; i < 10; ++i) {
            pause(100);
            step.tick();
        }
    });

    try {
        console.progress("Step 1", [&](Progress&) { pause(300); });
        console.progress("Step 2", [&](Progress&) { pause(300); });
        console.progress("Step 3", [&](Progress&) {
            pause(300);
            throw std::runtime_error("Intentional failure");
        });
        console.progress("Step 4", [&](Progress&) { pause(300); });
    } catch (const ProgressAbort&) {
        console.perr("Something went wrong during one of the steps");
    }
}

// Asks for strings, numbers and yes/no answers.
void show_input(const Console& console) {
    auto note = [&](const std::string& text) { console.pstd(console.color().cyan(text)); };

    note("All values are returned as typed");
    console.pstd("Got value: '" + console.read("Enter some text:") + "'");

    note("This time we use a validator to make sure we get valid input");
    ReadOptions<int> above_twelve;
    above_twelve.clean = [](const std::string& s) { return safeint(s).value_or(0); };
    above_twelve.validate = [](const int& n) { return n > 12; };
    above_twelve.error = [](const int& n) { return std::to_string(n) + " is not greater than 12"; };
    console.pstd("Got value: " + std::to_string(console.rvpl("Enter a number greater than 12:", above_twelve)));

    note("We again use a validator, but we also provide a default");
    above_twelve.strict = false;
    above_twelve.default_value = 15;
    console.pstd("Got value: " + std::to_string(console.rvpl("Enter a number greater than 12 [15]:", above_twelve)));

    ReadOptions<std::string> with_intro;
    with_intro.intro = "This is the intro text. It is line-wrapped at terminal width.";
    console.pstd("Got value: '" + console.rvpl("Enter some value:", with_intro) + "'");

    console.pstd(std::string("Got value: ") + (console.yesno("Yes or no?") ? "yes" : "no"));

    YesNoOptions default_yes;
    default_yes.default_answer = true;
    console.pstd(std::string("Got value: ") + (console.yesno("Yes or no?", default_yes) ? "yes" : "no"));
}

// Shows menus with default and custom numbering.
void show_menu(const Console& console) {
    const std::vector<MenuChoice<std::string>> choices = {
        {"FO", "Foo"}, {"BA", "Bar"}, {"BZ", "Baz"}, {"FA", "Fam"}
    };
    auto show = [&](const std::string& value) { console.pstd("Got value " + value); };

    show(console.menu(choices));

    MenuOptions<std::string> custom;
    custom.prompt = "Tell us what you want [1-4]:";
    custom.intro = "Once upon a time, there was a menu.";
    show(console.menu(choices, custom));

    MenuOptions<std::string> lettered;
    lettered.numerator = [](std::size_t n) {
        std::vector<std::string> keys;
        for (std::size_t i = 0; i < n; ++i) keys.push_back(std::string(1, static_cast<char>('a' + i)));
        return keys;
    };
    lettered.clean = [](const std::string& s) { return trim(s); };
    lettered.formatter = [](const std::string& key, const std::string& label) {
        return "[" + key + "] " + label;
    };
    show(console.menu(choices, lettered));

    MenuOptions<std::string> defaulted;
    defaulted.strict = false;
    defaulted.default_value = "FO";
    defaulted.prompt = "Choose an item [1]:";
    show(console.menu(choices, defaulted));
}

// Echoes stdin in chunks of three lines.
void show_pipe(const Console& console) {
    int n = 0;
    console.read_pipe(3, [&](const std::vector<std::string>& lines) {
        console.pverr("chunk " + std::to_string(++n), std::to_string(lines.size()) + " line(s)");
        for (const auto& line : lines) {
            console.pstd(line, "");
        }
    });
}

// ========== Main Entry Point ==========

int main(int argc, char* argv[]) {
    CLI::App app{"Tour of the conz console helpers"};
    app.require_subcommand(1);

    bool verbose = false;
    app.add_flag("-v,--verbose", verbose, "Show progress banners");

    bool debug = false;
    app.add_flag("-d,--debug", debug, "Print traces of intercepted failures");

    std::string color = "";
    app.add_option("--color", color, "Color mode (auto, always, never)")
        ->check(CLI::IsMember({"auto", "always", "never"}));

    std::string config_path;
    app.add_option("-c,--config", config_path, "Config file (default: .conz.json)");

    auto* colors_cmd = app.add_subcommand("colors", "Show the color palette");
    auto* progress_cmd = app.add_subcommand("progress", "Run progress steps");
    auto* input_cmd = app.add_subcommand("input", "Ask for input");
    auto* menu_cmd = app.add_subcommand("menu", "Show menus");
    auto* pipe_cmd = app.add_subcommand("pipe", "Read stdin in chunks");

    CLI11_PARSE(app, argc, argv);

    Config config;
    try {
        if (config_path.empty()) {
            config = load_default_config();
        } else {
            config = apply_environment(load_config(config_path).value_or(Config{}));
        }
        if (!color.empty()) {
            config.color = parse_color_mode(color);
        }
    } catch (const ConfigError& e) {
        std::cerr << e.what() << std::endl;
        return 2;
    }
    config.verbose = config.verbose || verbose || progress_cmd->parsed();
    config.debug = config.debug || debug;

    Console console(config);
    console.register_signals();

    try {
        if (colors_cmd->parsed()) show_colors(console);
        if (progress_cmd->parsed()) show_progress(console);
        if (input_cmd->parsed()) show_input(console);
        if (menu_cmd->parsed()) show_menu(console);
        if (pipe_cmd->parsed()) show_pipe(console);
    } catch (const EndOfInput&) {
        console.perr();
        console.perr("No more input.");
        return 1;
    }

    return 0;
}
