#include "../framework/SimpleTest.hpp"
#include "../framework/FakeAudio.hpp"
#include "playback/PlaybackStateMachine.hpp"
#include "playback/StreamCallback.hpp"
#include "playback/Errors.hpp"
#include <array>
#include <atomic>
#include <string>

using namespace rondo;
using model::PlaybackState;

namespace {

struct Rig {
    test::FakeDecoderFactory decoders;
    test::FakeOutputDevice device;
    std::atomic<float> volume{1.0f};
    std::atomic<bool> suppress{false};
    int finished = 0;
    playback::PlaybackStateMachine machine;

    Rig()
        : machine(decoders, device,
                  [this](playback::TrackHandle& track) {
                      return std::make_unique<playback::StreamCallback>(track, volume, suppress, nullptr);
                  },
                  [this](audio::FinishReason, const std::string&) { ++finished; }) {}

    void enter(PlaybackState state) {
        if (state == PlaybackState::Unloaded) return;
        machine.load("/music/a.flac");
        if (state == PlaybackState::Stopped) return;
        machine.start();
        if (state == PlaybackState::Playing) return;
        machine.pause_or_resume();
    }
};

enum class Op { Load, Start, Stop, PauseOrResume };

// Resulting state name, or the error kind raised
std::string apply(Rig& rig, Op op) {
    try {
        switch (op) {
            case Op::Load: rig.machine.load("/music/b.flac"); break;
            case Op::Start: rig.machine.start(); break;
            case Op::Stop: rig.machine.stop(); break;
            case Op::PauseOrResume: rig.machine.pause_or_resume(); break;
        }
    } catch (const playback::NoTrackLoaded&) {
        return "NoTrackLoaded";
    } catch (const playback::StreamNotActive&) {
        return "StreamNotActive";
    } catch (const playback::StreamAlreadyRunning&) {
        return "StreamAlreadyRunning";
    } catch (const playback::StreamIsPaused&) {
        return "StreamIsPaused";
    }
    return model::to_string(rig.machine.state());
}

} // namespace

TEST_CASE(test_transition_table_all_combinations) {
    const std::array<PlaybackState, 4> states = {
        PlaybackState::Unloaded, PlaybackState::Stopped, PlaybackState::Playing, PlaybackState::Paused};
    const std::array<Op, 4> ops = {Op::Load, Op::Start, Op::Stop, Op::PauseOrResume};
    const std::array<std::array<std::string, 4>, 4> expected = {{
        {"Stopped", "NoTrackLoaded", "NoTrackLoaded", "NoTrackLoaded"},
        {"Stopped", "Playing", "StreamNotActive", "StreamNotActive"},
        {"Stopped", "StreamAlreadyRunning", "Stopped", "Paused"},
        {"Stopped", "StreamIsPaused", "Stopped", "Playing"},
    }};

    for (std::size_t s = 0; s < states.size(); ++s) {
        for (std::size_t o = 0; o < ops.size(); ++o) {
            Rig rig;
            rig.enter(states[s]);
            ASSERT_TRUE(rig.machine.state() == states[s]);

            std::string outcome = apply(rig, ops[o]);
            if (outcome != expected[s][o]) {
                throw test::AssertionFailure(std::string("from ") + model::to_string(states[s]) +
                                             " op " + std::to_string(o) + ": got " + outcome +
                                             ", expected " + expected[s][o]);
            }
            // Errors leave the state alone
            if (outcome.find("Stream") == 0 || outcome == "NoTrackLoaded") {
                ASSERT_TRUE(rig.machine.state() == states[s]);
            }
            // Playing must agree with the device
            ASSERT_EQ(rig.machine.stream_active(), rig.machine.state() == PlaybackState::Playing);
        }
    }
}

TEST_CASE(test_stop_twice_is_stream_not_active) {
    Rig rig;
    rig.enter(PlaybackState::Stopped);
    ASSERT_THROWS(rig.machine.stop(), playback::StreamNotActive);
    ASSERT_THROWS(rig.machine.stop(), playback::StreamNotActive);
    ASSERT_TRUE(rig.machine.state() == PlaybackState::Stopped);
}

TEST_CASE(test_pause_resume_keeps_position) {
    Rig rig;
    rig.enter(PlaybackState::Playing);
    for (int i = 0; i < 3; ++i) {
        rig.device.current()->render_once(1024);
    }
    long before = rig.machine.track()->tell();
    ASSERT_EQ(before, 3072L);

    rig.machine.pause_or_resume();
    ASSERT_TRUE(rig.machine.state() == PlaybackState::Paused);
    ASSERT_FALSE(rig.machine.stream_active());
    rig.machine.pause_or_resume();

    ASSERT_TRUE(rig.machine.state() == PlaybackState::Playing);
    ASSERT_EQ(rig.machine.track()->tell(), before);
}

TEST_CASE(test_stop_resets_position) {
    Rig rig;
    rig.enter(PlaybackState::Playing);
    rig.device.current()->render_once(4096);
    rig.machine.stop();

    ASSERT_TRUE(rig.machine.state() == PlaybackState::Stopped);
    ASSERT_EQ(rig.machine.track()->tell(), 0L);
    ASSERT_FALSE(rig.machine.stream_active());
}

TEST_CASE(test_stop_from_paused_resets_position) {
    Rig rig;
    rig.enter(PlaybackState::Playing);
    rig.device.current()->render_once(4096);
    rig.machine.pause_or_resume();
    rig.machine.stop();

    ASSERT_TRUE(rig.machine.state() == PlaybackState::Stopped);
    ASSERT_EQ(rig.machine.track()->tell(), 0L);
}

TEST_CASE(test_load_while_playing_replaces_stream_and_session) {
    Rig rig;
    rig.enter(PlaybackState::Playing);
    rig.device.current()->render_once(1024);

    rig.machine.load("/music/b.flac");

    ASSERT_TRUE(rig.machine.state() == PlaybackState::Stopped);
    ASSERT_EQ(rig.machine.track()->location(), std::string("/music/b.flac"));
    ASSERT_EQ(rig.machine.track()->tell(), 0L);
    ASSERT_EQ(rig.device.live_streams(), 1u);
    ASSERT_EQ(rig.decoders.live_sessions(), 1);
}

TEST_CASE(test_failed_load_keeps_previous_track) {
    Rig rig;
    rig.enter(PlaybackState::Playing);
    rig.device.current()->render_once(1024);
    rig.decoders.failing.insert("/music/bad.flac");

    ASSERT_THROWS(rig.machine.load("/music/bad.flac"), playback::DecodeError);

    ASSERT_TRUE(rig.machine.state() == PlaybackState::Stopped);
    ASSERT_EQ(rig.machine.track()->location(), std::string("/music/a.flac"));
    ASSERT_EQ(rig.machine.track()->tell(), 0L);
    ASSERT_EQ(rig.decoders.live_sessions(), 1);

    rig.machine.start();
    ASSERT_TRUE(rig.machine.state() == PlaybackState::Playing);
}

TEST_CASE(test_device_open_failure_on_first_load) {
    Rig rig;
    rig.device.fail_open = true;

    ASSERT_THROWS(rig.machine.load("/music/a.flac"), playback::DeviceError);
    ASSERT_TRUE(rig.machine.state() == PlaybackState::Unloaded);
    ASSERT_EQ(rig.decoders.live_sessions(), 0);
}

TEST_CASE(test_activation_failure_forces_stopped) {
    Rig rig;
    rig.enter(PlaybackState::Stopped);
    rig.device.fail_activate = true;

    ASSERT_THROWS(rig.machine.start(), playback::DeviceError);
    ASSERT_TRUE(rig.machine.state() == PlaybackState::Stopped);
    ASSERT_FALSE(rig.machine.stream_active());
}

TEST_CASE(test_seek_while_playing_keeps_playing) {
    Rig rig;
    rig.enter(PlaybackState::Playing);
    rig.machine.seek(48000);

    ASSERT_TRUE(rig.machine.state() == PlaybackState::Playing);
    ASSERT_TRUE(rig.machine.stream_active());
    ASSERT_EQ(rig.machine.track()->tell(), 48000L);
}

TEST_CASE(test_seek_requires_track) {
    Rig rig;
    ASSERT_THROWS(rig.machine.seek(0), playback::NoTrackLoaded);
}

TEST_CASE(test_reconcile_after_natural_end) {
    Rig rig;
    rig.decoders.default_profile.total_frames = 2048;
    rig.enter(PlaybackState::Playing);

    auto* stream = rig.device.current();
    ASSERT_TRUE(stream->render_once(1024) == audio::RenderResult::Continue);
    ASSERT_TRUE(stream->render_once(1024) == audio::RenderResult::Continue);
    ASSERT_TRUE(stream->render_once(1024) == audio::RenderResult::Abort);
    ASSERT_FALSE(rig.machine.stream_active());

    ASSERT_TRUE(rig.machine.reconcile_finished());
    ASSERT_TRUE(rig.machine.state() == PlaybackState::Stopped);
    ASSERT_EQ(rig.machine.track()->tell(), 0L);

    // Only once
    ASSERT_FALSE(rig.machine.reconcile_finished());

    ASSERT_EQ(rig.device.deliver_pending(), 1);
    ASSERT_EQ(rig.finished, 1);
}

TEST_CASE(test_reconcile_ignores_own_deactivation) {
    Rig rig;
    rig.enter(PlaybackState::Playing);
    rig.machine.pause_or_resume();

    ASSERT_EQ(rig.device.pending_count(), 1u);
    ASSERT_FALSE(rig.machine.reconcile_finished());
    ASSERT_TRUE(rig.machine.state() == PlaybackState::Paused);
}

TEST_CASE(test_shutdown_releases_everything) {
    Rig rig;
    rig.enter(PlaybackState::Playing);
    rig.machine.shutdown();

    ASSERT_TRUE(rig.machine.state() == PlaybackState::Unloaded);
    ASSERT_EQ(rig.device.live_streams(), 0u);
    ASSERT_EQ(rig.decoders.live_sessions(), 0);
    ASSERT_TRUE(rig.machine.track() == nullptr);
}

int main() {
    return rondo::test::TestRunner::instance().run_all();
}
