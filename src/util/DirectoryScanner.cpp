#include "util/DirectoryScanner.hpp"
#include "util/Logger.hpp"
#include <fcntl.h>
#include <unistd.h>
#include <sys/syscall.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <dirent.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstring>

namespace rondo::util {

// Linux dirent64 structure for getdents64 syscall
struct linux_dirent64 {
    uint64_t d_ino;           // Inode number
    int64_t  d_off;           // Offset to next structure
    uint16_t d_reclen;        // Size of this dirent
    uint8_t  d_type;          // File type
    char     d_name[];        // Filename (null-terminated)
};

bool DirectoryScanner::is_audio_extension(std::string_view filename) {
    auto dot = filename.rfind('.');
    if (dot == std::string_view::npos) return false;

    std::string ext(filename.substr(dot));
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (const auto& ae : AUDIO_EXTENSIONS) {
        if (ae == ext) return true;
    }
    return false;
}

std::optional<DirectoryScanner::Listing> DirectoryScanner::list_directory(
    const std::filesystem::path& dir
) {
    // Normalize: strip trailing slashes to prevent // in paths
    std::string dir_path = dir.string();
    while (dir_path.length() > 1 && dir_path.back() == '/') {
        dir_path.pop_back();
    }
    const std::string prefix = dir_path == "/" ? dir_path : dir_path + "/";

    int fd = open(dir_path.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        util::Logger::warn("DirectoryScanner: Failed to open directory: " + dir_path +
                           " (" + std::strerror(errno) + ")");
        return std::nullopt;
    }

    Listing listing;
    std::vector<char> buffer(BUFFER_SIZE);

    while (true) {
        long nread = syscall(SYS_getdents64, fd, buffer.data(), buffer.size());

        if (nread == -1) {
            util::Logger::error("DirectoryScanner: getdents64 failed for " + dir_path);
            break;
        }

        if (nread == 0) {
            // End of directory
            break;
        }

        for (long pos = 0; pos < nread;) {
            auto* d = reinterpret_cast<linux_dirent64*>(buffer.data() + pos);
            pos += d->d_reclen;

            if (strcmp(d->d_name, ".") == 0 || strcmp(d->d_name, "..") == 0) {
                continue;
            }

            bool is_dir = d->d_type == DT_DIR;
            bool is_reg = d->d_type == DT_REG;
            if (d->d_type == DT_UNKNOWN || d->d_type == DT_LNK) {
                // No d_type, or a symlink: ask the filesystem what it points at
                struct stat entry_stat;
                if (fstatat(fd, d->d_name, &entry_stat, 0) == 0) {
                    is_dir = S_ISDIR(entry_stat.st_mode);
                    is_reg = S_ISREG(entry_stat.st_mode);
                }
            }

            if (is_dir) {
                listing.directories.push_back(prefix + d->d_name);
            } else if (is_reg && is_audio_extension(d->d_name)) {
                listing.audio_files.push_back(prefix + d->d_name);
            }
        }
    }

    close(fd);

    std::sort(listing.directories.begin(), listing.directories.end());
    std::sort(listing.audio_files.begin(), listing.audio_files.end());

    util::Logger::debug("DirectoryScanner: " + dir_path + ": " +
                        std::to_string(listing.directories.size()) + " directories, " +
                        std::to_string(listing.audio_files.size()) + " audio files");
    return listing;
}

}  // namespace rondo::util
