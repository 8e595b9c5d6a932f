#include "audio/DecoderFactory.hpp"
#include "audio/PipeWireContext.hpp"
#include "backend/Config.hpp"
#include "backend/DirectoryCatalog.hpp"
#include "config/KeyMap.hpp"
#include "playback/Errors.hpp"
#include "playback/PlaybackController.hpp"
#include "ui/Formatting.hpp"
#include "ui/Terminal.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <atomic>
#include <csignal>
#include <filesystem>
#include <format>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace {

std::atomic<bool> g_shutdown{false};

void signal_handler(int) {
    g_shutdown.store(true);
}

// Written by the progress and error callbacks, read by the UI loop
struct StatusBoard {
    std::mutex mutex;
    std::optional<rondo::model::TrackInfo> track;
    long frame = 0;
    std::string message;
};

// One row of the listing: "..", a sub-directory, or a track
struct Entry {
    enum class Kind { Parent, Directory, Track } kind;
    std::string label;
    std::size_t index = 0;  // Into directories() or tracks()
};

std::vector<Entry> build_entries(const rondo::backend::DirectoryCatalog& catalog) {
    std::vector<Entry> entries;
    entries.push_back({Entry::Kind::Parent, "../", 0});

    auto dirs = catalog.directories();
    for (std::size_t i = 0; i < dirs.size(); ++i) {
        entries.push_back({Entry::Kind::Directory,
                           std::filesystem::path(dirs[i]).filename().string() + "/", i});
    }

    auto tracks = catalog.tracks();
    for (std::size_t i = 0; i < tracks.size(); ++i) {
        entries.push_back({Entry::Kind::Track,
                           std::filesystem::path(tracks[i]).filename().string(), i});
    }
    return entries;
}

class App {
public:
    App(rondo::backend::DirectoryCatalog& catalog,
        rondo::playback::PlaybackController& controller,
        rondo::config::KeyMap& keymap,
        StatusBoard& board)
        : catalog_(catalog), controller_(controller), keymap_(keymap), board_(board),
          terminal_(rondo::ui::Terminal::instance()) {
        entries_ = build_entries(catalog_);
    }

    void run() {
        render_listing();
        while (!g_shutdown.load()) {
            auto event = terminal_.read_input(33);  // ~30fps status refresh

            if (event.type == rondo::ui::InputEvent::Type::Resize) {
                render_listing();
            } else if (event.type == rondo::ui::InputEvent::Type::KeyPress) {
                std::string action = keymap_.lookup_action(event.key_name);
                if (!action.empty()) {
                    rondo::util::Logger::debug("Main: Key " + event.key_name + " -> " + action);
                    if (action == "quit") break;
                    dispatch(action);
                }
            }
            render_status();
        }
    }

private:
    std::optional<std::size_t> selected_track() const {
        if (selected_ < entries_.size() && entries_[selected_].kind == Entry::Kind::Track) {
            return entries_[selected_].index;
        }
        return std::nullopt;
    }

    void dispatch(const std::string& action) {
        try {
            if (action == "play_pause") {
                auto target = selected_track();
                if (!target) target = controller_.current_index();
                if (!target && catalog_.current_length() > 0) target = 0;
                if (target) controller_.toggle_play_pause(*target);
            } else if (action == "play_selected") {
                activate_selection();
            } else if (action == "stop") {
                controller_.stop(false);
            } else if (action == "next") {
                controller_.skip_next();
            } else if (action == "seek_forward") {
                controller_.seek_forward();
            } else if (action == "seek_backward") {
                controller_.seek_backward();
            } else if (action == "volume_up") {
                controller_.set_volume(controller_.volume() + 0.05f);
            } else if (action == "volume_down") {
                controller_.set_volume(controller_.volume() - 0.05f);
            } else if (action == "select_up") {
                if (selected_ > 0) --selected_;
                render_listing();
            } else if (action == "select_down") {
                if (selected_ + 1 < entries_.size()) ++selected_;
                render_listing();
            } else if (action == "reload") {
                catalog_.refresh();
                reload_entries();
            }
        } catch (const rondo::playback::NoTrackLoaded&) {
            // Nothing to act on yet
        } catch (const rondo::playback::PlaybackError& e) {
            post_message(e.what());
        } catch (const rondo::backend::CatalogIndexError& e) {
            post_message(e.what());
        }
    }

    void activate_selection() {
        if (selected_ >= entries_.size()) return;
        const Entry& entry = entries_[selected_];
        switch (entry.kind) {
            case Entry::Kind::Parent:
                catalog_.step_out();
                reload_entries();
                break;
            case Entry::Kind::Directory:
                catalog_.step_in(entry.index);
                reload_entries();
                break;
            case Entry::Kind::Track:
                controller_.play(entry.index);
                break;
        }
    }

    void reload_entries() {
        entries_ = build_entries(catalog_);
        selected_ = std::min(selected_, entries_.size() - 1);
        post_message(std::format("Found {} file(s).", catalog_.current_length()));
        render_listing();
    }

    void post_message(const std::string& text) {
        std::lock_guard<std::mutex> lock(board_.mutex);
        board_.message = text;
    }

    void render_listing() {
        int width = terminal_.get_terminal_width();
        int height = terminal_.get_terminal_height();
        int rows = std::max(height - 4, 1);

        if (selected_ < top_) top_ = selected_;
        if (selected_ >= top_ + static_cast<std::size_t>(rows)) top_ = selected_ - rows + 1;

        terminal_.clear_screen();
        terminal_.print(0, 0, rondo::ui::trunc_pad(
            std::format("rondo - {} ({} tracks)", catalog_.current_directory().string(),
                        catalog_.current_length()), width));

        for (int row = 0; row < rows; ++row) {
            std::size_t i = top_ + static_cast<std::size_t>(row);
            if (i >= entries_.size()) break;
            std::string marker = i == selected_ ? "> " : "  ";
            std::string line = marker + entries_[i].label;
            if (i == selected_) {
                terminal_.print(0, row + 1, "\033[7m" + rondo::ui::trunc_pad(line, width) + "\033[0m");
            } else {
                terminal_.print(0, row + 1, rondo::ui::trunc_pad(line, width));
            }
        }
    }

    void render_status() {
        int width = terminal_.get_terminal_width();
        int height = terminal_.get_terminal_height();

        std::optional<rondo::model::TrackInfo> track;
        long frame = 0;
        std::string message;
        {
            std::lock_guard<std::mutex> lock(board_.mutex);
            track = board_.track;
            frame = board_.frame;
            message = board_.message;
        }

        auto state = controller_.current_state();
        std::string status;
        if (track && (state == rondo::model::PlaybackState::Playing ||
                      state == rondo::model::PlaybackState::Paused)) {
            status = rondo::ui::format_progress_line(*track, frame, width,
                                                     state == rondo::model::PlaybackState::Paused);
        } else {
            status = rondo::ui::trunc_pad(std::string(rondo::model::to_string(state)), width);
        }

        std::string footer = std::format("vol {:3d}%  {}",
                                         static_cast<int>(controller_.volume() * 100.0f + 0.5f),
                                         message);

        terminal_.print(0, height - 2, status);
        terminal_.print(0, height - 1, rondo::ui::trunc_pad(footer, width));
    }

    rondo::backend::DirectoryCatalog& catalog_;
    rondo::playback::PlaybackController& controller_;
    rondo::config::KeyMap& keymap_;
    StatusBoard& board_;
    rondo::ui::Terminal& terminal_;

    std::vector<Entry> entries_;
    std::size_t selected_ = 0;
    std::size_t top_ = 0;
};

}  // namespace

int main(int argc, char** argv) {
    try {
        rondo::util::Logger::init();
        rondo::util::Logger::info("RONDO starting...");

        auto config = rondo::backend::ConfigLoader::load_config();
        if (config.log_file != "/tmp/rondo_debug.log") {
            rondo::util::Logger::init(config.log_file.string(),
                                      rondo::util::Logger::parse_level(config.log_level));
        } else {
            rondo::util::Logger::set_level(rondo::util::Logger::parse_level(config.log_level));
        }
        rondo::util::Logger::info("Configuration loaded");

        std::filesystem::path start_dir = argc > 1 ? std::filesystem::path(argv[1]) : config.music_directory;
        rondo::backend::DirectoryCatalog catalog(start_dir);

        rondo::config::KeyMap keymap;
        keymap.apply(config.keybinds);

        StatusBoard board;

        // Device outlives the controller and its streams
        rondo::audio::PipeWireContext device;
        if (!device.init()) {
            throw std::runtime_error("Cannot connect to PipeWire");
        }
        rondo::audio::FormatDecoderFactory decoders;

        rondo::playback::ControllerOptions options;
        options.initial_volume = static_cast<float>(config.default_volume) / 100.0f;
        options.progress_every = config.progress_every;
        options.seek_step = config.seek_step;

        rondo::playback::PlaybackController controller(
            catalog, decoders, device,
            [&board](const rondo::model::TrackInfo& info, long frame) {
                std::lock_guard<std::mutex> lock(board.mutex);
                if (!board.track || board.track->location != info.location) {
                    board.track = info;
                }
                board.frame = frame;
            },
            options);

        controller.set_error_callback([&board](const std::string& message) {
            std::lock_guard<std::mutex> lock(board.mutex);
            board.message = "ERR: " + message;
        });

        auto& terminal = rondo::ui::Terminal::instance();
        terminal.init();

        // Install signal handlers for graceful shutdown (AFTER terminal init!)
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        App app(catalog, controller, keymap, board);
        app.run();

        terminal.shutdown();
        rondo::util::Logger::info("RONDO shutdown");
        return 0;
    } catch (const std::exception& e) {
        // Restore terminal even on exception
        rondo::ui::Terminal::instance().shutdown();
        rondo::util::Logger::error("Fatal error: " + std::string(e.what()));
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
