#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

namespace rondo::backend {

class CatalogIndexError : public std::out_of_range {
public:
    CatalogIndexError(std::size_t index, std::size_t length)
        : std::out_of_range("Track index " + std::to_string(index) +
                            " out of range (" + std::to_string(length) + " tracks)"),
          index_(index) {}

    std::size_t index() const { return index_; }

private:
    std::size_t index_;
};

// Ordered, indexable list of playable track locations.
class TrackCatalog {
public:
    virtual ~TrackCatalog() = default;

    virtual std::size_t current_length() const = 0;

    // Throws CatalogIndexError
    virtual std::string resolve(std::size_t index) const = 0;

    virtual std::optional<std::size_t> index_of(const std::string& location) const = 0;
};

}  // namespace rondo::backend
