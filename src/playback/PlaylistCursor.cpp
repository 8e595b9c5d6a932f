#include "playback/PlaylistCursor.hpp"

namespace rondo::playback {

std::optional<std::size_t> PlaylistCursor::next(std::size_t length, std::optional<std::size_t> current) {
    if (length == 0) {
        return std::nullopt;
    }

    if (!initialized_ || length != length_) {
        length_ = length;
        position_ = current ? *current % length : length - 1;
        initialized_ = true;
    }

    position_ = (position_ + 1) % length_;
    return position_;
}

}  // namespace rondo::playback
