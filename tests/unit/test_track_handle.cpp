#include "../framework/SimpleTest.hpp"
#include "../framework/FakeAudio.hpp"
#include "playback/TrackHandle.hpp"
#include "playback/Errors.hpp"
#include <clocale>
#include <vector>

using namespace rondo;
using rondo::test::FakeDecoderFactory;
using rondo::test::FakeTrackProfile;

TEST_CASE(test_open_derives_metadata_from_decoder) {
    FakeDecoderFactory factory;
    auto track = playback::TrackHandle::open("/music/Some Song.flac", factory);

    ASSERT_EQ(track->sample_rate(), 48000);
    ASSERT_EQ(track->channels(), 2);
    ASSERT_EQ(track->total_frames(), 144000L);
    ASSERT_EQ(track->duration_seconds(), 3.0);
    ASSERT_EQ(track->title(), std::string("Some Song"));
    ASSERT_EQ(track->tell(), 0L);
    ASSERT_EQ(track->info().location, std::string("/music/Some Song.flac"));
}

TEST_CASE(test_tag_title_and_duration_preferred) {
    FakeDecoderFactory factory;
    FakeTrackProfile profile;
    profile.tag_title = "Tagged Title";
    profile.tag_duration = 215.44;
    factory.profiles["/music/a.mp3"] = profile;

    auto track = playback::TrackHandle::open("/music/a.mp3", factory);
    ASSERT_EQ(track->title(), std::string("Tagged Title"));
    ASSERT_EQ(track->duration_seconds(), 215.4);
}

TEST_CASE(test_unreadable_tags_fall_back) {
    FakeDecoderFactory factory;
    FakeTrackProfile profile;
    profile.total_frames = 100000;
    profile.sample_rate = 44100;
    profile.tags_throw = true;
    factory.profiles["/music/broken.ogg"] = profile;

    auto track = playback::TrackHandle::open("/music/broken.ogg", factory);
    ASSERT_EQ(track->title(), std::string("broken"));
    // 100000 / 44100 = 2.2675...
    ASSERT_EQ(track->duration_seconds(), 2.3);
}

TEST_CASE(test_zero_sample_rate_gives_zero_duration) {
    FakeDecoderFactory factory;
    FakeTrackProfile profile;
    profile.sample_rate = 0;
    factory.profiles["/music/odd.wav"] = profile;

    auto track = playback::TrackHandle::open("/music/odd.wav", factory);
    ASSERT_EQ(track->duration_seconds(), 0.0);
}

TEST_CASE(test_round_duration_one_decimal) {
    ASSERT_EQ(playback::TrackHandle::round_duration(3.0), 3.0);
    ASSERT_EQ(playback::TrackHandle::round_duration(2.96), 3.0);
    ASSERT_EQ(playback::TrackHandle::round_duration(215.44), 215.4);
    // Exact binary halves go to the even digit
    ASSERT_EQ(playback::TrackHandle::round_duration(0.25), 0.2);
    ASSERT_EQ(playback::TrackHandle::round_duration(0.75), 0.8);
}

TEST_CASE(test_round_duration_ignores_comma_decimal_locale) {
    const char* candidates[] = {"de_DE.UTF-8", "de_DE.utf8", "fr_FR.UTF-8", "fr_FR.utf8"};
    for (const char* name : candidates) {
        if (std::setlocale(LC_ALL, name)) break;
    }

    double rounded = playback::TrackHandle::round_duration(215.44);
    double whole = playback::TrackHandle::round_duration(2.96);
    std::setlocale(LC_ALL, "C");

    ASSERT_EQ(rounded, 215.4);
    ASSERT_EQ(whole, 3.0);
}

TEST_CASE(test_open_failure_raises_decode_error) {
    FakeDecoderFactory factory;
    factory.failing.insert("/music/corrupt.flac");

    bool caught = false;
    try {
        playback::TrackHandle::open("/music/corrupt.flac", factory);
    } catch (const playback::DecodeError& e) {
        caught = true;
        ASSERT_EQ(e.resource(), std::string("/music/corrupt.flac"));
        ASSERT_EQ(e.cause(), std::string("corrupt data"));
    }
    ASSERT_TRUE(caught);
    ASSERT_EQ(factory.live_sessions(), 0);
}

TEST_CASE(test_unsupported_format_raises_decode_error) {
    FakeDecoderFactory factory;
    factory.unsupported.insert("/music/readme.txt");
    ASSERT_THROWS(playback::TrackHandle::open("/music/readme.txt", factory), playback::DecodeError);
}

TEST_CASE(test_read_and_seek_track_position) {
    FakeDecoderFactory factory;
    auto track = playback::TrackHandle::open("/music/a.flac", factory);

    std::vector<float> buffer(512 * 2);
    ASSERT_EQ(track->read(buffer.data(), 512), 512);
    ASSERT_EQ(track->tell(), 512L);

    track->seek(1000);
    ASSERT_EQ(track->tell(), 1000L);

    // Clamped into [0, total_frames]
    track->seek(-50);
    ASSERT_EQ(track->tell(), 0L);
    track->seek(10000000);
    ASSERT_EQ(track->tell(), 144000L);

    ASSERT_EQ(track->read(buffer.data(), 512), 0);
    ASSERT_EQ(track->tell(), 144000L);
}

TEST_CASE(test_close_releases_session) {
    FakeDecoderFactory factory;
    auto track = playback::TrackHandle::open("/music/a.flac", factory);
    ASSERT_EQ(factory.live_sessions(), 1);

    track->close();
    ASSERT_FALSE(track->is_open());
    ASSERT_EQ(factory.live_sessions(), 0);

    std::vector<float> buffer(64);
    ASSERT_THROWS(track->read(buffer.data(), 32), playback::DecodeError);
    ASSERT_THROWS(track->seek(0), playback::DecodeError);
}

TEST_CASE(test_destruction_releases_session) {
    FakeDecoderFactory factory;
    {
        auto track = playback::TrackHandle::open("/music/a.flac", factory);
        ASSERT_EQ(factory.live_sessions(), 1);
    }
    ASSERT_EQ(factory.live_sessions(), 0);
}

int main() {
    return rondo::test::TestRunner::instance().run_all();
}
