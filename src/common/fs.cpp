#include "ethos/common/fs.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <regex>
#include <sstream>

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>

namespace ethos::common {

std::string trim(const std::string &input) {
  auto first = std::find_if_not(input.begin(), input.end(), [](unsigned char c) {
    return std::isspace(c) != 0;
  });
  auto last = std::find_if_not(input.rbegin(), input.rend(), [](unsigned char c) {
    return std::isspace(c) != 0;
  }).base();

  if (first >= last) {
    return "";
  }
  return std::string(first, last);
}

bool starts_with(const std::string &value, const std::string &prefix) {
  return value.rfind(prefix, 0) == 0;
}

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

std::string expand_path(std::string value) {
  if (value.empty()) {
    return value;
  }

  if (value[0] == '~') {
    if (const char *home = std::getenv("HOME"); home != nullptr && *home != '\0') {
      value.replace(0, 1, home);
    }
  }

  std::regex env_pattern(R"(\$\{?([A-Za-z_][A-Za-z0-9_]*)\}?)");
  std::smatch match;
  std::string expanded;
  std::string remaining = value;

  while (std::regex_search(remaining, match, env_pattern)) {
    expanded += match.prefix().str();
    const std::string var_name = match[1].str();
    if (const char *var = std::getenv(var_name.c_str()); var != nullptr) {
      expanded += var;
    }
    remaining = match.suffix().str();
  }

  expanded += remaining;
  return expanded;
}

Result<std::string> read_file(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return Result<std::string>::failure(ErrorKind::Io, "file not found: " + path.string());
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return Result<std::string>::failure(ErrorKind::Io, "unable to open " + path.string());
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    return Result<std::string>::failure(ErrorKind::Io, "failed reading " + path.string());
  }
  return Result<std::string>::success(buffer.str());
}

namespace {

int open_exclusive(const std::filesystem::path &path) {
  return ::open(path.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, 0600);
}

bool is_process_running(const long pid) {
  if (pid <= 0) {
    return false;
  }
  // EPERM means the process exists under another user.
  return ::kill(static_cast<pid_t>(pid), 0) == 0 || errno == EPERM;
}

/// A lock left behind by a process that no longer exists. Lock files without
/// a readable pid are treated as held, since the owner may not have written it yet.
bool is_stale_lock(const std::filesystem::path &lock_path) {
  std::ifstream in(lock_path);
  long owner = 0;
  if (!(in >> owner)) {
    return false;
  }
  return owner > 0 && !is_process_running(owner);
}

} // namespace

FileLock::FileLock(std::filesystem::path target)
    : lock_path_(target.string() + ".lock") {}

FileLock::~FileLock() { release(); }

Status FileLock::acquire() {
  if (fd_ >= 0) {
    return Status::success();
  }
  fd_ = open_exclusive(lock_path_);
  if (fd_ < 0 && errno == EEXIST && is_stale_lock(lock_path_)) {
    std::error_code ec;
    std::filesystem::remove(lock_path_, ec);
    fd_ = open_exclusive(lock_path_);
  }
  if (fd_ < 0) {
    if (errno == EEXIST) {
      return Status::error(ErrorKind::Io, "destination is locked by another writer: " +
                                              lock_path_.string());
    }
    return Status::error(ErrorKind::Io, "failed to create lock " + lock_path_.string() + ": " +
                                            std::strerror(errno));
  }
  const std::string pid = std::to_string(static_cast<long>(::getpid())) + "\n";
  if (::write(fd_, pid.data(), pid.size()) < 0) {
    const std::string reason = std::strerror(errno);
    release();
    return Status::error(ErrorKind::Io, "failed to write lock " + lock_path_.string() + ": " +
                                            reason);
  }
  return Status::success();
}

void FileLock::release() {
  if (fd_ < 0) {
    return;
  }
  ::close(fd_);
  fd_ = -1;
  std::error_code ec;
  std::filesystem::remove(lock_path_, ec);
}

Status write_file_atomic(const std::filesystem::path &path, const std::string &content,
                         const WriteOptions &options) {
  std::error_code ec;
  const auto parent = path.parent_path();
  if (!parent.empty() && !std::filesystem::is_directory(parent, ec)) {
    return Status::error(ErrorKind::Io, "directory does not exist: " + parent.string());
  }

  FileLock lock(path);
  if (auto locked = lock.acquire(); !locked.ok()) {
    return locked;
  }

  if (!options.overwrite && std::filesystem::exists(path, ec)) {
    return Status::error(ErrorKind::Io, "refusing to overwrite existing file: " + path.string());
  }

  const std::filesystem::path tmp_path =
      path.string() + ".tmp." + std::to_string(static_cast<long>(::getpid()));
  {
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out) {
      return Status::error(ErrorKind::Io, "unable to write " + tmp_path.string());
    }
    out << content;
    out.close();
    if (!out) {
      std::filesystem::remove(tmp_path, ec);
      return Status::error(ErrorKind::Io, "failed writing " + tmp_path.string());
    }
  }

  if (options.permissions != std::filesystem::perms::none) {
    std::filesystem::permissions(tmp_path, options.permissions,
                                 std::filesystem::perm_options::replace, ec);
    if (ec) {
      std::error_code ignored;
      std::filesystem::remove(tmp_path, ignored);
      return Status::error(ErrorKind::Io, "failed to set permissions on " + tmp_path.string() +
                                              ": " + ec.message());
    }
  }

  if (!options.overwrite) {
    // link() fails with EEXIST instead of replacing a file created after the check above.
    if (::link(tmp_path.c_str(), path.c_str()) != 0) {
      const int error = errno;
      std::error_code ignored;
      std::filesystem::remove(tmp_path, ignored);
      if (error == EEXIST) {
        return Status::error(ErrorKind::Io,
                             "refusing to overwrite existing file: " + path.string());
      }
      return Status::error(ErrorKind::Io, "failed to move " + path.string() + " into place: " +
                                              std::strerror(error));
    }
    std::filesystem::remove(tmp_path, ec);
    return Status::success();
  }

  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(tmp_path, ignored);
    return Status::error(ErrorKind::Io, "failed to move " + path.string() + " into place: " +
                                            ec.message());
  }
  return Status::success();
}

} // namespace ethos::common
