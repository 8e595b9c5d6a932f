#pragma once

#include "ui/InputEvent.hpp"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <termios.h>

namespace rondo::ui {

// Raw-mode terminal with an asynchronous stdout writer. Restores the
// original terminal settings on shutdown.
class Terminal {
public:
    static Terminal& instance();

    void init();
    void shutdown();
    bool is_initialized() const;

    void clear_screen();
    void print(int x, int y, const std::string& text);
    void clear_line(int y);

    // Enqueue raw data for asynchronous writing to stdout
    void write_raw(const std::string& text);

    // Waits up to timeout_ms for a key. Type::None on timeout.
    InputEvent read_input(int timeout_ms);

    int get_terminal_width() const;
    int get_terminal_height() const;

private:
    Terminal();
    ~Terminal();

    void writer_loop();
    bool read_byte(char& c);

    bool initialized_ = false;

    // Async writer components
    std::thread writer_thread_;
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<std::string> write_queue_;
    std::atomic<bool> running_{false};

    ::termios original_termios_{};
};

}  // namespace rondo::ui
