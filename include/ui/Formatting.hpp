#pragma once

#include "model/Track.hpp"
#include <string>

namespace rondo::ui {

/**
 * Calculate the display width of a string, accounting for:
 * - ANSI escape sequences (which don't take visual space)
 * - UTF-8 multi-byte characters (each counts as 1 display column)
 */
int display_cols(const std::string& s);

/**
 * Truncate a string to fit exactly `width` display columns.
 * Handles ANSI codes and UTF-8 correctly.
 */
std::string take_cols(const std::string& s, int width);

/**
 * Truncate string if too long, pad with spaces if too short.
 * Result will be exactly `width` display columns.
 */
std::string trunc_pad(const std::string& s, int width);

/**
 * Bar of exactly `width` columns: "[####------]". Ratio is clamped to [0, 1].
 */
std::string progress_bar(double ratio, int width);

/**
 * Elapsed time over duration, zero-padded to the duration's width:
 * "|01.5/3.0", "|042.0/215.4".
 */
std::string format_time_string(const model::TrackInfo& info, long current_frame);

/**
 * Status line of exactly `width` columns:
 * "|01.5/3.0 [#####-----] Playing now - Title"
 */
std::string format_progress_line(const model::TrackInfo& info, long current_frame,
                                 int width, bool paused = false);

} // namespace rondo::ui
