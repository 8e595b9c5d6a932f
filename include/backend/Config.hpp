#pragma once

#include <string>
#include <unordered_map>
#include <filesystem>

namespace rondo::backend {

struct Config {
    // Playback settings
    int default_volume = 100;     // Percent
    int progress_every = 2;       // Progress callback every Nth render period
    double seek_step = 0.05;      // Fraction of the track per seek key

    // Logging
    std::string log_level = "info";
    std::filesystem::path log_file = "/tmp/rondo_debug.log";

    // Keybinds: action -> key
    std::unordered_map<std::string, std::string> keybinds;

    // Directory settings
    std::filesystem::path music_directory = ".";
};

class ConfigLoader {
public:
    // Reads the user config, writing one with defaults first if none exists.
    static Config load_config();
    static Config load_from_file(const std::filesystem::path& path);
    static bool save_config(const Config& cfg, const std::filesystem::path& path);

    static std::filesystem::path get_config_file();
    static Config create_default_config();
};

}  // namespace rondo::backend
