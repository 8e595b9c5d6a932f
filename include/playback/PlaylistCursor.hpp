#pragma once

#include <cstddef>
#include <optional>

namespace rondo::playback {

// Restartable circular cursor over [0, length).
class PlaylistCursor {
public:
    // Index after `current`, wrapping. Without a current index the cycle
    // starts at 0. Re-seeds itself when uninitialized or the length changed.
    // Returns nullopt for an empty catalog.
    std::optional<std::size_t> next(std::size_t length, std::optional<std::size_t> current);

    void invalidate() { initialized_ = false; }
    bool initialized() const { return initialized_; }

private:
    bool initialized_ = false;
    std::size_t length_ = 0;
    std::size_t position_ = 0;
};

}  // namespace rondo::playback
