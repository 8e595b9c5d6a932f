#pragma once

#include <array>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rondo::util {

/**
 * DirectoryScanner: single-directory listing using the getdents64 syscall.
 *
 * Uses one large buffer per call to batch entries and the d_type field to
 * avoid stat() calls; falls back to fstatat() on filesystems that report
 * DT_UNKNOWN.
 */
class DirectoryScanner {
public:
    /**
     * Entries of one directory, each list sorted by name.
     */
    struct Listing {
        std::vector<std::string> directories;  // Absolute paths, without . and ..
        std::vector<std::string> audio_files;  // Absolute paths
    };

    /**
     * Lists a directory without descending into it.
     *
     * @param dir Directory to list
     * @return The listing, or nullopt if the directory cannot be opened
     */
    [[nodiscard]] static std::optional<Listing> list_directory(const std::filesystem::path& dir);

    /**
     * Checks if a filename has a playable extension (case-insensitive).
     *
     * @param filename Filename to check
     * @return true for the extensions FormatDecoderFactory can decode
     */
    [[nodiscard]] static bool is_audio_extension(std::string_view filename);

private:
    static constexpr size_t BUFFER_SIZE = 64 * 1024;

    static constexpr std::array<std::string_view, 9> AUDIO_EXTENSIONS = {
        ".flac", ".m4a", ".aac", ".mp3", ".ogg", ".oga", ".wav", ".aiff", ".aif"
    };
};

}  // namespace rondo::util
