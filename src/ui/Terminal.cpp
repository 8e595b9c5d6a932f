#include "ui/Terminal.hpp"
#include "util/Logger.hpp"
#include <unistd.h>
#include <sys/ioctl.h>
#include <fcntl.h>
#include <cstring>
#include <csignal>
#include <cerrno>
#include <poll.h>
#include <format>

namespace rondo::ui {

// Never call ioctl in a handler
static volatile std::sig_atomic_t g_resize_pending = 0;

static void sigwinch_handler(int) {
    g_resize_pending = 1;
}

std::string key_name_for(char c) {
    switch (c) {
        case ' ': return "space";
        case '\n':
        case '\r': return "enter";
        case 127:
        case '\b': return "backspace";
        case '\t': return "tab";
        default: return std::string(1, c);
    }
}

Terminal& Terminal::instance() {
    static Terminal instance;
    return instance;
}

Terminal::Terminal() {}
Terminal::~Terminal() {
    shutdown();
}

void Terminal::init() {
    if (initialized_) return;

    tcgetattr(STDIN_FILENO, &original_termios_);

    ::termios raw = original_termios_;
    raw.c_lflag &= ~(ECHO | ICANON);
    raw.c_iflag &= ~(IXON | ICRNL); // Disable flow control and CR->NL
    raw.c_cc[VMIN] = 0;
    raw.c_cc[VTIME] = 0;
    tcsetattr(STDIN_FILENO, TCSAFLUSH, &raw);

    std::signal(SIGWINCH, sigwinch_handler);

    running_ = true;
    writer_thread_ = std::thread(&Terminal::writer_loop, this);

    write_raw("\033[?1049h"); // Enter alternate screen buffer
    write_raw("\033[?25l");   // Hide cursor
    initialized_ = true;
}

void Terminal::shutdown() {
    if (!initialized_) return;

    write_raw("\033[?25h");   // Show cursor
    write_raw("\033[?1049l"); // Exit alternate screen buffer

    // Writer drains the queue before exiting
    running_ = false;
    queue_cv_.notify_all();
    if (writer_thread_.joinable()) {
        writer_thread_.join();
    }

    tcsetattr(STDIN_FILENO, TCSAFLUSH, &original_termios_);
    initialized_ = false;
}

bool Terminal::is_initialized() const {
    return initialized_;
}

void Terminal::writer_loop() {
    while (true) {
        std::string chunk;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return !write_queue_.empty() || !running_; });

            if (write_queue_.empty()) {
                break;  // Stopped and drained
            }
            chunk = std::move(write_queue_.front());
            write_queue_.pop_front();
        }

        size_t written = 0;
        while (written < chunk.size()) {
            ssize_t n = write(STDOUT_FILENO, chunk.data() + written, chunk.size() - written);
            if (n > 0) {
                written += static_cast<size_t>(n);
            } else if (n < 0) {
                if (errno == EINTR) continue;

                if (errno == EAGAIN || errno == EWOULDBLOCK) {
                    struct pollfd pfd = {STDOUT_FILENO, POLLOUT, 0};
                    poll(&pfd, 1, 100); // Wait up to 100ms
                    continue;
                }

                util::Logger::error("Terminal: Writer error: " + std::string(strerror(errno)));
                break;
            }
        }
    }
}

void Terminal::write_raw(const std::string& text) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        write_queue_.push_back(text);
    }
    queue_cv_.notify_one();
}

void Terminal::clear_screen() {
    write_raw("\033[2J\033[H");
}

void Terminal::print(int x, int y, const std::string& text) {
    // One chunk for cursor move and text so they are never split
    write_raw(std::format("\033[{};{}H{}", y + 1, x + 1, text));
}

void Terminal::clear_line(int y) {
    write_raw(std::format("\033[{};1H\033[2K", y + 1));
}

bool Terminal::read_byte(char& c) {
    ssize_t n;
    do {
        n = read(STDIN_FILENO, &c, 1);
    } while (n < 0 && errno == EINTR);
    return n == 1;
}

InputEvent Terminal::read_input(int timeout_ms) {
    if (g_resize_pending) {
        g_resize_pending = 0;
        return {InputEvent::Type::Resize, 0, "resize"};
    }

    struct pollfd pfd = {STDIN_FILENO, POLLIN, 0};
    int ready = poll(&pfd, 1, timeout_ms);
    if (ready <= 0) {
        if (ready < 0 && errno != EINTR) {
            util::Logger::debug(std::format("Terminal: poll failed, errno={}", errno));
        }
        return {};
    }

    char c;
    if (!read_byte(c)) {
        return {};
    }

    if (c == '\033') {
        char seq[2];
        if (read_byte(seq[0]) && seq[0] == '[' && read_byte(seq[1])) {
            switch (seq[1]) {
                case 'A': return {InputEvent::Type::KeyPress, 0, "up"};
                case 'B': return {InputEvent::Type::KeyPress, 0, "down"};
                case 'C': return {InputEvent::Type::KeyPress, 0, "right"};
                case 'D': return {InputEvent::Type::KeyPress, 0, "left"};
            }
        }
        return {InputEvent::Type::KeyPress, 27, "escape"};
    }

    return {InputEvent::Type::KeyPress, c, key_name_for(c)};
}

int Terminal::get_terminal_width() const {
    winsize w{};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) < 0 || w.ws_col == 0) return 80;
    return w.ws_col;
}

int Terminal::get_terminal_height() const {
    winsize w{};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) < 0 || w.ws_row == 0) return 24;
    return w.ws_row;
}

}  // namespace rondo::ui
