#include "backend/DirectoryCatalog.hpp"
#include "util/DirectoryScanner.hpp"
#include "util/Logger.hpp"
#include <algorithm>

namespace rondo::backend {

DirectoryCatalog::DirectoryCatalog(const std::filesystem::path& start)
    : current_(std::filesystem::absolute(start).lexically_normal()) {
    // lexically_normal keeps a trailing separator for "dir/"
    if (current_.has_parent_path() && current_.filename().empty()) {
        current_ = current_.parent_path();
    }
    refresh_locked();
}

bool DirectoryCatalog::refresh() {
    std::lock_guard<std::mutex> lock(mutex_);
    return refresh_locked();
}

bool DirectoryCatalog::refresh_locked() {
    auto listing = util::DirectoryScanner::list_directory(current_);
    if (!listing) {
        directories_.clear();
        tracks_.clear();
        return false;
    }

    directories_ = std::move(listing->directories);
    tracks_ = std::move(listing->audio_files);
    util::Logger::info("DirectoryCatalog: " + current_.string() + " has " +
                       std::to_string(tracks_.size()) + " tracks");
    return true;
}

void DirectoryCatalog::step_in(std::size_t dir_index) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (dir_index >= directories_.size()) {
        throw CatalogIndexError(dir_index, directories_.size());
    }
    current_ = directories_[dir_index];
    refresh_locked();
}

void DirectoryCatalog::step_out() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (current_ == current_.parent_path()) {
        return;
    }
    current_ = current_.parent_path();
    refresh_locked();
}

std::filesystem::path DirectoryCatalog::current_directory() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

std::vector<std::string> DirectoryCatalog::directories() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return directories_;
}

std::vector<std::string> DirectoryCatalog::tracks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tracks_;
}

std::size_t DirectoryCatalog::current_length() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tracks_.size();
}

std::string DirectoryCatalog::resolve(std::size_t index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (index >= tracks_.size()) {
        throw CatalogIndexError(index, tracks_.size());
    }
    return tracks_[index];
}

std::optional<std::size_t> DirectoryCatalog::index_of(const std::string& location) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find(tracks_.begin(), tracks_.end(), location);
    if (it == tracks_.end()) return std::nullopt;
    return static_cast<std::size_t>(it - tracks_.begin());
}

}  // namespace rondo::backend
