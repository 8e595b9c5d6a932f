#pragma once

#include "backend/TrackCatalog.hpp"
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace rondo::backend {

// Catalog over the audio files of one directory. Indices address tracks()
// only; directories() lists what step_in() can enter.
class DirectoryCatalog : public TrackCatalog {
public:
    explicit DirectoryCatalog(const std::filesystem::path& start);

    // Re-reads the current directory. Returns false if it cannot be listed;
    // the lists are then empty.
    bool refresh();

    // Throws CatalogIndexError
    void step_in(std::size_t dir_index);

    // No-op at the filesystem root
    void step_out();

    std::filesystem::path current_directory() const;
    std::vector<std::string> directories() const;
    std::vector<std::string> tracks() const;

    std::size_t current_length() const override;
    std::string resolve(std::size_t index) const override;
    std::optional<std::size_t> index_of(const std::string& location) const override;

private:
    bool refresh_locked();

    mutable std::mutex mutex_;
    std::filesystem::path current_;
    std::vector<std::string> directories_;
    std::vector<std::string> tracks_;
};

}  // namespace rondo::backend
