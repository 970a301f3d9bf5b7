#include "utils.h"

#include <fcntl.h>
#include <unistd.h>
#include <sys/mount.h>
#include <atomic>
#include <cstring>
#include <fstream>

#include <spdlog/spdlog.h>

namespace {

std::atomic_long submission_internal_id_seq = 0;

} // namespace

#if __has_include(<linux/close_range.h>)
#include <linux/close_range.h>
int CloseFrom(int minfd) {
  return close_range(minfd, ~0U, 0);
}
#else
#include <dirent.h>
int CloseFrom(int minfd) {
  DIR *fddir = opendir("/proc/self/fd");
  if (!fddir) goto error;
  {
    int dfd = dirfd(fddir);
    for (struct dirent *dent; (dent = readdir(fddir));) {
      if (!strcmp(dent->d_name, ".") || !strcmp(dent->d_name, "..")) continue;
      int fd = strtol(dent->d_name, NULL, 10);
      if (fd >= minfd && fd != dfd) {
        if (close(fd) && errno != EBADF) goto error_dir;
      }
    }
  }
  closedir(fddir);
  return 0;

error_dir:
  closedir(fddir);
error:
  return -1;
}
#endif // has_include(<linux/close_range.h>)

long GetUniqueSubmissionInternalId() {
  return ++submission_internal_id_seq;
}

#define ENUM_SWITCH_FUNCTION(DEF, typ, mac) \
  DEF(typ param) { \
    switch (param) { \
      mac \
    } \
    __builtin_unreachable(); \
  }
#define X_RETURN_ARG1(cls, x, ...) case cls::x: return #x;
#define X_RETURN_ARG2(cls, x, y, ...) case cls::x: return y;
#define X_RETURN_ARG3(cls, x, y, z, ...) case cls::x: return z;

#define X(...) X_RETURN_ARG3(Verdict, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* VerdictToDesc, Verdict, ENUM_VERDICT_)
#undef X

static const char* kVerdictAbrTable[] = {
#define X(name, abr, desc) abr,
  ENUM_VERDICT_
#undef X
};

const char* VerdictToAbr(Verdict verdict) {
  return kVerdictAbrTable[(int)verdict];
}

Verdict AbrToVerdict(const std::string& str) {
  for (int i = (int)Verdict::AC; i <= (int)Verdict::AB; i++) {
    if (str == kVerdictAbrTable[i]) return (Verdict)i;
  }
  return Verdict::NUL;
}

int VerdictSeverity(Verdict verdict) {
  switch (verdict) {
    case Verdict::NUL: return -1;
    case Verdict::AC: return 0;
    case Verdict::WA: return 1;
    case Verdict::TLE: [[fallthrough]];
    case Verdict::MLE: [[fallthrough]];
    case Verdict::OLE: return 2;
    case Verdict::RE: return 3;
    case Verdict::CE: return 4;
    case Verdict::IE: return 5;
    case Verdict::AB: return 6;
  }
  __builtin_unreachable();
}

#define X(...) X_RETURN_ARG2(Language, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* LanguageName, Language, ENUM_LANGUAGE_)
#undef X

static const char* kLanguageNameTable[] = {
#define X(name, langname) langname,
  ENUM_LANGUAGE_
#undef X
};

std::optional<Language> GetLanguage(const std::string& str) {
  for (size_t i = 0; i < sizeof(kLanguageNameTable) / sizeof(kLanguageNameTable[0]); i++) {
    if (str == kLanguageNameTable[i]) return (Language)i;
  }
  return std::nullopt;
}

#define X(...) X_RETURN_ARG2(CompareMode, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* CompareModeName, CompareMode, ENUM_COMPARE_MODE_)
#undef X

static const char* kCompareModeNameTable[] = {
#define X(name, modename) modename,
  ENUM_COMPARE_MODE_
#undef X
};

std::optional<CompareMode> GetCompareMode(const std::string& str) {
  for (size_t i = 0; i < sizeof(kCompareModeNameTable) / sizeof(kCompareModeNameTable[0]); i++) {
    if (str == kCompareModeNameTable[i]) return (CompareMode)i;
  }
  return std::nullopt;
}

#define X(...) X_RETURN_ARG2(FloatMode, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* FloatModeName, FloatMode, ENUM_FLOAT_MODE_)
#undef X

static const char* kFloatModeNameTable[] = {
#define X(name, modename) modename,
  ENUM_FLOAT_MODE_
#undef X
};

std::optional<FloatMode> GetFloatMode(const std::string& str) {
  for (size_t i = 0; i < sizeof(kFloatModeNameTable) / sizeof(kFloatModeNameTable[0]); i++) {
    if (str == kFloatModeNameTable[i]) return (FloatMode)i;
  }
  return std::nullopt;
}

std::string ScoreToString(int64_t score) {
  std::string frac = std::to_string(score % 1'000'000);
  frac = std::string(6 - frac.size(), '0') + frac;
  return std::to_string(score / 1'000'000) + "." + frac;
}

#define X(...) X_RETURN_ARG1(CompileSubtask, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* CompileSubtaskName, CompileSubtask, ENUM_COMPILE_SUBTASK_)
#undef X

#define X(...) X_RETURN_ARG1(CheckerType, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* CheckerTypeName, CheckerType, ENUM_CHECKER_TYPE_)
#undef X

#undef ENUM_SWITCH_FUNCTION
#undef X_RETURN_ARG1
#undef X_RETURN_ARG2
#undef X_RETURN_ARG3

bool MountTmpfs(const fs::path& path, long size_kib) {
  spdlog::debug("Mount tmpfs on {}, size {}", path.c_str(), size_kib);
  bool ret = 0 == mount("tmpfs", path.c_str(), "tmpfs", 0,
                        ("size=" + std::to_string(size_kib) + 'k').c_str());
  if (!ret) spdlog::warn("Failed mounting tmpfs on {}: {}", path.c_str(), strerror(errno));
  return ret;
}

bool Umount(const fs::path& path) {
  spdlog::debug("Umount {}", path.c_str());
  bool ret = 0 == umount2(path.c_str(), MNT_DETACH);
  if (!ret) spdlog::warn("Failed unmounting {}: {}", path.c_str(), strerror(errno));
  return ret;
}

bool CreateDirs(const fs::path& path, fs::perms perms) {
  spdlog::debug("Create directories {}", path.c_str());
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) goto err;
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed creating directory {}: {}", path.c_str(), strerror(ec.value()));
  return false;
}

bool RemoveAll(const fs::path& path) {
  spdlog::debug("Delete {}", path.c_str());
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed deleting {}: {}", path.c_str(), strerror(ec.value()));
  return false;
}

bool Move(const fs::path& from, const fs::path& to, fs::perms perms) {
  spdlog::debug("Move file {} -> {}", from.c_str(), to.c_str());
  std::error_code ec;
  fs::rename(from, to, ec);
  if (ec) {
    if (ec.value() != EXDEV) goto err;
    fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
    if (ec) goto err;
    fs::remove(from, ec);
  }
  if (perms == fs::perms::unknown) return true;
  fs::permissions(to, perms, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed moving {} -> {}: {}", from.c_str(), to.c_str(), strerror(ec.value()));
  return false;
}

bool Copy(const fs::path& from, const fs::path& to, fs::perms perms) {
  spdlog::debug("Copy file {} -> {}", from.c_str(), to.c_str());
  std::error_code ec;
  fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
  if (ec) goto err;
  if (perms == fs::perms::unknown) return true;
  fs::permissions(to, perms, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed copying {} -> {}: {}", from.c_str(), to.c_str(), strerror(ec.value()));
  return false;
}

bool Touch(const fs::path& path, fs::perms perms) {
  std::error_code ec;
  {
    std::ofstream fout(path, std::ios::app);
    if (!fout) {
      spdlog::warn("Failed creating {}", path.c_str());
      return false;
    }
  }
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) {
    spdlog::warn("Failed setting permissions of {}: {}", path.c_str(), strerror(ec.value()));
    return false;
  }
  return true;
}

std::string ReadHead(const fs::path& path, size_t max_len, bool* truncated) {
  std::string ret(max_len, '\0');
  std::ifstream fin(path, std::ios::binary);
  fin.read(ret.data(), max_len);
  ret.resize(fin.gcount());
  if (truncated) *truncated = fin && fin.peek() != std::ifstream::traits_type::eof();
  return ret;
}

long FileSize(const fs::path& path) {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) return -1;
  auto size = fs::file_size(path, ec);
  return ec ? -1 : (long)size;
}

fs::path FindInPath(const std::string& name) {
  const char* env = getenv("PATH");
  std::string path_env = env ? env : "/usr/local/bin:/usr/bin:/bin";
  size_t pos = 0;
  while (pos <= path_env.size()) {
    size_t nxt = path_env.find(':', pos);
    if (nxt == std::string::npos) nxt = path_env.size();
    fs::path candidate = fs::path(path_env.substr(pos, nxt - pos)) / name;
    if (nxt > pos && access(candidate.c_str(), X_OK) == 0) return candidate;
    pos = nxt + 1;
  }
  return {};
}
