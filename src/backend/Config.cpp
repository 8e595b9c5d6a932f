#include "backend/Config.hpp"
#include "config/KeyMap.hpp"
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>
#include "util/Logger.hpp"

namespace rondo::backend {

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

template <typename T, typename Parse>
void parse_number(const std::string& key, const std::string& value, T& out, Parse parse) {
    try {
        size_t used = 0;
        T parsed = parse(value, &used);
        if (used != value.size()) {
            throw std::invalid_argument("trailing characters");
        }
        out = parsed;
    } catch (const std::exception&) {
        util::Logger::warn("Config: Invalid value for " + key + ": \"" + value + "\", keeping default");
    }
}

}  // namespace

Config ConfigLoader::load_config() {
    util::Logger::info("Config: Loading configuration");

    auto config_file = get_config_file();
    if (std::filesystem::exists(config_file)) {
        return load_from_file(config_file);
    }

    Config cfg = create_default_config();
    if (!save_config(cfg, config_file)) {
        util::Logger::warn("Config: Could not write defaults to " + config_file.string());
    }
    return cfg;
}

Config ConfigLoader::load_from_file(const std::filesystem::path& path) {
    util::Logger::debug("Config: Loading from " + path.string());

    Config cfg = create_default_config();

    std::ifstream file(path);
    if (!file) {
        util::Logger::warn("Config: Cannot open " + path.string() + ", using defaults");
        return cfg;
    }

    std::string line, current_section;
    while (std::getline(file, line)) {
        line = trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') continue;

        // Section header
        if (line[0] == '[' && line.back() == ']') {
            current_section = line.substr(1, line.length() - 2);
            continue;
        }

        // Key = value
        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove quotes from strings
        if (value.length() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.length() - 2);
        }

        if (current_section == "playback") {
            if (key == "default_volume") {
                parse_number(key, value, cfg.default_volume,
                             [](const std::string& v, size_t* n) { return std::stoi(v, n); });
                if (cfg.default_volume < 0 || cfg.default_volume > 100) {
                    util::Logger::warn("Config: default_volume out of range, clamping");
                    cfg.default_volume = std::clamp(cfg.default_volume, 0, 100);
                }
            } else if (key == "progress_every") {
                int every = cfg.progress_every;
                parse_number(key, value, every,
                             [](const std::string& v, size_t* n) { return std::stoi(v, n); });
                if (every >= 1) {
                    cfg.progress_every = every;
                } else {
                    util::Logger::warn("Config: progress_every must be at least 1");
                }
            } else if (key == "seek_step") {
                double step = cfg.seek_step;
                parse_number(key, value, step,
                             [](const std::string& v, size_t* n) { return std::stod(v, n); });
                if (step > 0.0 && step <= 1.0) {
                    cfg.seek_step = step;
                } else {
                    util::Logger::warn("Config: seek_step must be in (0, 1]");
                }
            }
        }
        else if (current_section == "logging") {
            if (key == "level") cfg.log_level = value;
            else if (key == "file") cfg.log_file = std::filesystem::path(value);
        }
        else if (current_section == "keybinds") {
            cfg.keybinds[key] = value;
        }
        else if (current_section == "paths") {
            if (key == "music_directory") {
                cfg.music_directory = std::filesystem::path(value);
            }
        }
    }

    return cfg;
}

bool ConfigLoader::save_config(const Config& cfg, const std::filesystem::path& path) {
    util::Logger::info("Config: Saving configuration to " + path.string());

    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            util::Logger::error("Config: Cannot create " + path.parent_path().string() + ": " + ec.message());
            return false;
        }
    }

    std::ofstream file(path);
    if (!file) return false;

    file << "# RONDO Config\n\n";

    file << "[playback]\n";
    file << "# Default volume level (0-100)\n";
    file << "default_volume = " << cfg.default_volume << "\n";
    file << "# Progress updates every Nth audio period\n";
    file << "progress_every = " << cfg.progress_every << "\n";
    file << "# Seek step as a fraction of the track\n";
    file << "seek_step = " << cfg.seek_step << "\n\n";

    file << "[logging]\n";
    file << "# debug, info, warn, error\n";
    file << "level = \"" << cfg.log_level << "\"\n";
    file << "file = \"" << cfg.log_file.string() << "\"\n\n";

    file << "[keybinds]\n";
    for (const auto& action : config::KeyMap::actions()) {
        auto it = cfg.keybinds.find(action);
        if (it != cfg.keybinds.end()) {
            file << action << " = \"" << it->second << "\"\n";
        }
    }
    file << "\n";

    file << "[paths]\n";
    file << "# Directory opened at startup\n";
    file << "music_directory = \"" << cfg.music_directory.string() << "\"\n";

    return static_cast<bool>(file);
}

std::filesystem::path ConfigLoader::get_config_file() {
    auto home = std::getenv("HOME");
    if (home) {
        return std::filesystem::path(home) / ".config" / "rondo" / "config.toml";
    }
    return ".config/rondo/config.toml";
}

Config ConfigLoader::create_default_config() {
    Config cfg;
    config::KeyMap defaults;
    for (const auto& action : config::KeyMap::actions()) {
        cfg.keybinds[action] = defaults.key_for(action);
    }
    return cfg;
}

}  // namespace rondo::backend
