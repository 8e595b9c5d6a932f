#include "../framework/SimpleTest.hpp"
#include "backend/DirectoryCatalog.hpp"
#include "util/DirectoryScanner.hpp"
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace rondo;
namespace fs = std::filesystem;

namespace {

// Scratch music directory, removed on scope exit
struct MusicDir {
    fs::path root;

    MusicDir() {
        root = fs::temp_directory_path() / ("rondo_catalog_" + std::to_string(::getpid()));
        fs::remove_all(root);
        fs::create_directories(root / "b_album");
        fs::create_directories(root / "a_album");
        touch("zeta.flac");
        touch("Alpha.MP3");
        touch("middle.ogg");
        touch("notes.txt");
        touch("cover.jpg");
        touch("a_album/inner.wav");
    }

    ~MusicDir() { fs::remove_all(root); }

    void touch(const std::string& rel) { std::ofstream(root / rel) << "x"; }
};

} // namespace

TEST_CASE(test_audio_extension_case_insensitive) {
    ASSERT_TRUE(util::DirectoryScanner::is_audio_extension("a.flac"));
    ASSERT_TRUE(util::DirectoryScanner::is_audio_extension("A.FLAC"));
    ASSERT_TRUE(util::DirectoryScanner::is_audio_extension("x.Aiff"));
    ASSERT_TRUE(util::DirectoryScanner::is_audio_extension("song.m4a"));
    ASSERT_FALSE(util::DirectoryScanner::is_audio_extension("cover.jpg"));
    ASSERT_FALSE(util::DirectoryScanner::is_audio_extension("flac"));
}

TEST_CASE(test_lists_tracks_and_directories_sorted) {
    MusicDir dir;
    backend::DirectoryCatalog catalog(dir.root);

    auto tracks = catalog.tracks();
    ASSERT_EQ(tracks.size(), 3u);
    ASSERT_EQ(tracks[0], (dir.root / "Alpha.MP3").string());
    ASSERT_EQ(tracks[1], (dir.root / "middle.ogg").string());
    ASSERT_EQ(tracks[2], (dir.root / "zeta.flac").string());

    auto dirs = catalog.directories();
    ASSERT_EQ(dirs.size(), 2u);
    ASSERT_EQ(dirs[0], (dir.root / "a_album").string());
    ASSERT_EQ(dirs[1], (dir.root / "b_album").string());

    ASSERT_EQ(catalog.current_length(), 3u);
}

TEST_CASE(test_resolve_and_index_of) {
    MusicDir dir;
    backend::DirectoryCatalog catalog(dir.root);

    ASSERT_EQ(catalog.resolve(1), (dir.root / "middle.ogg").string());
    ASSERT_THROWS(catalog.resolve(3), backend::CatalogIndexError);
    ASSERT_EQ(*catalog.index_of((dir.root / "zeta.flac").string()), 2u);
    ASSERT_FALSE(catalog.index_of("/nowhere.mp3").has_value());
}

TEST_CASE(test_step_in_and_out) {
    MusicDir dir;
    backend::DirectoryCatalog catalog(dir.root);

    catalog.step_in(0);
    ASSERT_EQ(catalog.current_directory(), dir.root / "a_album");
    ASSERT_EQ(catalog.current_length(), 1u);

    catalog.step_out();
    ASSERT_EQ(catalog.current_directory(), dir.root);
    ASSERT_EQ(catalog.current_length(), 3u);

    ASSERT_THROWS(catalog.step_in(5), backend::CatalogIndexError);
}

TEST_CASE(test_refresh_picks_up_changes) {
    MusicDir dir;
    backend::DirectoryCatalog catalog(dir.root);
    dir.touch("new.wav");

    ASSERT_EQ(catalog.current_length(), 3u);
    ASSERT_TRUE(catalog.refresh());
    ASSERT_EQ(catalog.current_length(), 4u);
}

TEST_CASE(test_step_out_at_root_is_noop) {
    backend::DirectoryCatalog catalog("/");
    catalog.step_out();
    ASSERT_EQ(catalog.current_directory(), fs::path("/"));
}

TEST_CASE(test_missing_directory_is_empty) {
    backend::DirectoryCatalog catalog("/definitely/not/here");
    ASSERT_EQ(catalog.current_length(), 0u);
    ASSERT_FALSE(catalog.refresh());
}

int main() {
    return rondo::test::TestRunner::instance().run_all();
}
