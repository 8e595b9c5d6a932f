#include "../framework/SimpleTest.hpp"
#include "backend/Config.hpp"
#include "config/KeyMap.hpp"
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace rondo;
namespace fs = std::filesystem;

namespace {

fs::path temp_file(const std::string& name) {
    return fs::temp_directory_path() / ("rondo_test_" + std::to_string(::getpid()) + "_" + name);
}

fs::path write_file(const std::string& name, const std::string& content) {
    fs::path path = temp_file(name);
    std::ofstream out(path);
    out << content;
    return path;
}

} // namespace

TEST_CASE(test_defaults) {
    auto cfg = backend::ConfigLoader::create_default_config();
    ASSERT_EQ(cfg.default_volume, 100);
    ASSERT_EQ(cfg.progress_every, 2);
    ASSERT_EQ(cfg.seek_step, 0.05);
    ASSERT_EQ(cfg.log_level, std::string("info"));
    ASSERT_EQ(cfg.keybinds.at("play_pause"), std::string("space"));
    ASSERT_EQ(cfg.keybinds.at("quit"), std::string("q"));
}

TEST_CASE(test_load_sections) {
    auto path = write_file("sections.toml",
        "# comment\n"
        "[playback]\n"
        "default_volume = 40\n"
        "progress_every = 4\n"
        "seek_step = 0.1\n"
        "\n"
        "[logging]\n"
        "level = \"debug\"\n"
        "file = \"/tmp/elsewhere.log\"\n"
        "[keybinds]\n"
        "next = \"l\"\n"
        "[paths]\n"
        "music_directory = \"/srv/music\"\n");

    auto cfg = backend::ConfigLoader::load_from_file(path);
    fs::remove(path);

    ASSERT_EQ(cfg.default_volume, 40);
    ASSERT_EQ(cfg.progress_every, 4);
    ASSERT_EQ(cfg.seek_step, 0.1);
    ASSERT_EQ(cfg.log_level, std::string("debug"));
    ASSERT_EQ(cfg.log_file, fs::path("/tmp/elsewhere.log"));
    ASSERT_EQ(cfg.keybinds.at("next"), std::string("l"));
    ASSERT_EQ(cfg.music_directory, fs::path("/srv/music"));
}

TEST_CASE(test_invalid_numbers_keep_defaults) {
    auto path = write_file("invalid.toml",
        "[playback]\n"
        "default_volume = loud\n"
        "progress_every = 0\n"
        "seek_step = 12abc\n");

    auto cfg = backend::ConfigLoader::load_from_file(path);
    fs::remove(path);

    ASSERT_EQ(cfg.default_volume, 100);
    ASSERT_EQ(cfg.progress_every, 2);
    ASSERT_EQ(cfg.seek_step, 0.05);
}

TEST_CASE(test_volume_clamped_to_percent_range) {
    auto path = write_file("volume.toml", "[playback]\ndefault_volume = 250\n");
    auto cfg = backend::ConfigLoader::load_from_file(path);
    fs::remove(path);
    ASSERT_EQ(cfg.default_volume, 100);
}

TEST_CASE(test_missing_file_gives_defaults) {
    auto cfg = backend::ConfigLoader::load_from_file(temp_file("does_not_exist.toml"));
    ASSERT_EQ(cfg.default_volume, 100);
    ASSERT_EQ(cfg.music_directory, fs::path("."));
}

TEST_CASE(test_saved_config_reads_back) {
    auto cfg = backend::ConfigLoader::create_default_config();
    cfg.default_volume = 65;
    cfg.progress_every = 3;
    cfg.keybinds["stop"] = "x";
    cfg.music_directory = "/home/someone/Music";

    fs::path dir = temp_file("saved");
    fs::path path = dir / "config.toml";
    ASSERT_TRUE(backend::ConfigLoader::save_config(cfg, path));

    auto loaded = backend::ConfigLoader::load_from_file(path);
    fs::remove_all(dir);

    ASSERT_EQ(loaded.default_volume, 65);
    ASSERT_EQ(loaded.progress_every, 3);
    ASSERT_EQ(loaded.keybinds.at("stop"), std::string("x"));
    ASSERT_EQ(loaded.music_directory, fs::path("/home/someone/Music"));
}

TEST_CASE(test_keymap_defaults) {
    config::KeyMap keymap;
    ASSERT_EQ(keymap.lookup_action("space"), std::string("play_pause"));
    ASSERT_EQ(keymap.lookup_action("enter"), std::string("play_selected"));
    ASSERT_EQ(keymap.lookup_action("s"), std::string("stop"));
    ASSERT_EQ(keymap.lookup_action("n"), std::string("next"));
    ASSERT_EQ(keymap.lookup_action("left"), std::string("seek_backward"));
    ASSERT_EQ(keymap.lookup_action("right"), std::string("seek_forward"));
    ASSERT_EQ(keymap.lookup_action("r"), std::string("reload"));
    ASSERT_EQ(keymap.lookup_action("z"), std::string(""));

    for (const auto& action : config::KeyMap::actions()) {
        ASSERT_FALSE(keymap.key_for(action).empty());
    }
}

TEST_CASE(test_keymap_override_releases_old_key) {
    config::KeyMap keymap;
    keymap.apply({{"next", "l"}, {"bogus_action", "b"}});

    ASSERT_EQ(keymap.lookup_action("l"), std::string("next"));
    ASSERT_EQ(keymap.lookup_action("n"), std::string(""));
    ASSERT_EQ(keymap.lookup_action("b"), std::string(""));
    ASSERT_EQ(keymap.key_for("next"), std::string("l"));
}

int main() {
    return rondo::test::TestRunner::instance().run_all();
}
