#include "settings.hpp"
#include "errors.hpp"
#include "terminal.hpp"
#include "text.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace conz {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

bool env_flag(const char* value) {
    std::string v = to_lower(trim(value));
    return v == "1" || v == "true" || v == "yes";
}

} // namespace

ColorMode parse_color_mode(const std::string& value) {
    std::string v = to_lower(trim(value));
    if (v == "auto") return ColorMode::automatic;
    if (v == "always") return ColorMode::always;
    if (v == "never") return ColorMode::never;
    throw ConfigError("Invalid color mode: '" + value + "' (expected auto, always or never)");
}

std::string to_string(ColorMode mode) {
    switch (mode) {
        case ColorMode::always: return "always";
        case ColorMode::never: return "never";
        case ColorMode::automatic: break;
    }
    return "auto";
}

int Config::effective_width() const {
    return width > 0 ? width : terminal::get_width();
}

std::optional<Config> load_config(const std::string& path) {
    if (!fs::exists(path)) {
        return std::nullopt;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + path);
    }

    try {
        json j;
        file >> j;
        if (!j.is_object()) {
            throw ConfigError("Config file must contain a JSON object: " + path);
        }

        Config config;
        config.verbose = j.value("verbose", config.verbose);
        config.debug = j.value("debug", config.debug);
        if (j.contains("color")) {
            config.color = parse_color_mode(j["color"].get<std::string>());
        }
        config.width = j.value("width", config.width);
        if (config.width < 0) {
            throw ConfigError("Config width must not be negative: " + path);
        }

        if (j.contains("progress") && j["progress"].is_object()) {
            const auto& p = j["progress"];
            config.separator = p.value("separator", config.separator);
            config.done = p.value("done", config.done);
            config.fail = p.value("fail", config.fail);
            config.tick = p.value("tick", config.tick);
        }
        config.error_template = j.value("error_template", config.error_template);

        return config;
    } catch (const json::exception& e) {
        throw ConfigError("Malformed config file " + path + ": " + e.what());
    }
}

void save_config(const Config& config, const std::string& path) {
    json j;
    j["verbose"] = config.verbose;
    j["debug"] = config.debug;
    j["color"] = to_string(config.color);
    j["width"] = config.width;
    j["progress"] = {
        {"separator", config.separator},
        {"done", config.done},
        {"fail", config.fail},
        {"tick", config.tick}
    };
    j["error_template"] = config.error_template;

    std::ofstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Cannot write config file: " + path);
    }
    file << j.dump(2) << std::endl;
}

Config apply_environment(Config config) {
    if (const char* v = std::getenv("CONZ_VERBOSE")) {
        config.verbose = env_flag(v);
    }
    if (const char* v = std::getenv("CONZ_DEBUG")) {
        config.debug = env_flag(v);
    }
    if (const char* v = std::getenv("CONZ_COLOR")) {
        config.color = parse_color_mode(v);
    }
    if (std::getenv("ANSI_COLORS_DISABLED")) {
        config.color = ColorMode::never;
    }
    if (config.width == 0) {
        if (const char* v = std::getenv("COLUMNS")) {
            std::optional<int> columns = safeint(v);
            if (columns && *columns > 0) {
                config.width = *columns;
            }
        }
    }
    return config;
}

Config load_default_config() {
    const char* env_path = std::getenv(CONFIG_ENV);
    std::string path = (env_path && *env_path) ? env_path : CONFIG_FILE;
    return apply_environment(load_config(path).value_or(Config{}));
}

} // namespace conz
