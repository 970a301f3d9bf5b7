#ifndef JRUNNER_UTILS_H_
#define JRUNNER_UTILS_H_

#include <string>
#include <filesystem>

#include <jrunner/utils.h>

namespace fs = std::filesystem;

constexpr fs::perms kPerm666 =
    fs::perms::owner_read | fs::perms::owner_write |
    fs::perms::group_read | fs::perms::group_write |
    fs::perms::others_read | fs::perms::others_write;

int CloseFrom(int minfd);

bool MountTmpfs(const fs::path&, long size_kib);
bool Umount(const fs::path&);
bool CreateDirs(const fs::path&, fs::perms = fs::perms::unknown);
bool RemoveAll(const fs::path&);

// These functions resolve symlinks; Move allows cross-device move
bool Move(const fs::path& from, const fs::path& to, fs::perms = fs::perms::unknown);
bool Copy(const fs::path& from, const fs::path& to, fs::perms = fs::perms::unknown);
bool Touch(const fs::path&, fs::perms = fs::perms::unknown);

// Read at most max_len bytes from the beginning of a file; truncated is set if there is more
std::string ReadHead(const fs::path&, size_t max_len, bool* truncated = nullptr);
// -1 if not a regular file
long FileSize(const fs::path&);

// Look up an executable in $PATH; empty if not found
fs::path FindInPath(const std::string& name);

#endif  // JRUNNER_UTILS_H_
