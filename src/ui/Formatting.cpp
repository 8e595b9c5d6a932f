#include "ui/Formatting.hpp"
#include <algorithm>
#include <format>

namespace rondo::ui {

namespace {

struct Token {
    size_t length;
    bool visible;
};

// One CSI escape (zero width) or one UTF-8 code point (one column).
Token scan_token(const std::string& s, size_t i) {
    if (s[i] == '\x1B' && i + 1 < s.size() && s[i + 1] == '[') {
        size_t j = i + 2;
        while (j < s.size() && (s[j] < '@' || s[j] > '~')) ++j;
        if (j < s.size()) ++j;  // final byte
        return {j - i, false};
    }

    unsigned char lead = static_cast<unsigned char>(s[i]);
    size_t len = 1;
    if ((lead & 0xE0) == 0xC0) len = 2;
    else if ((lead & 0xF0) == 0xE0) len = 3;
    else if ((lead & 0xF8) == 0xF0) len = 4;
    return {std::min(len, s.size() - i), true};
}

}  // namespace

int display_cols(const std::string& s) {
    int cols = 0;
    for (size_t i = 0; i < s.size(); ) {
        Token t = scan_token(s, i);
        if (t.visible) ++cols;
        i += t.length;
    }
    return cols;
}

std::string take_cols(const std::string& s, int cols) {
    if (cols <= 0) return "";

    std::string out;
    int seen = 0;
    for (size_t i = 0; i < s.size() && seen < cols; ) {
        Token t = scan_token(s, i);
        out.append(s, i, t.length);
        if (t.visible) ++seen;
        i += t.length;
    }
    return out;
}

std::string trunc_pad(const std::string& s, int w) {
    if (w <= 0) return "";

    int cols = display_cols(s);
    if (cols <= w) return s + std::string(w - cols, ' ');
    if (w == 1) return take_cols(s, 1);
    return take_cols(s, w - 1) + "\u2026";
}

std::string progress_bar(double ratio, int width) {
    if (width < 2) return "";

    int inner = width - 2;
    ratio = std::clamp(ratio, 0.0, 1.0);
    int filled = static_cast<int>(ratio * inner);
    return "[" + std::string(filled, '#') + std::string(inner - filled, '-') + "]";
}

std::string format_time_string(const model::TrackInfo& info, long current_frame) {
    std::string duration = std::format("{:.1f}", info.duration_seconds);
    double elapsed = info.total_frames > 0
        ? static_cast<double>(current_frame) * info.duration_seconds / static_cast<double>(info.total_frames)
        : 0.0;
    return std::format("|{:0{}.1f}/{}", elapsed, duration.size(), duration);
}

std::string format_progress_line(const model::TrackInfo& info, long current_frame,
                                 int width, bool paused) {
    if (width <= 0) return "";

    std::string time_string = format_time_string(info, current_frame);
    double ratio = info.total_frames > 0
        ? static_cast<double>(current_frame) / static_cast<double>(info.total_frames)
        : 0.0;
    int bar_width = std::clamp(width / 3, 10, 40);

    std::string line = time_string + " " + progress_bar(ratio, bar_width) + " " +
                       (paused ? "Paused" : "Playing now") + " - " + info.title;
    return trunc_pad(line, width);
}

} // namespace rondo::ui
