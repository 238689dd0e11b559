#pragma once

#include "ethos/common/result.hpp"

#include <filesystem>
#include <string>

namespace ethos::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] std::string expand_path(std::string value);

[[nodiscard]] Result<std::string> read_file(const std::filesystem::path &path);

struct WriteOptions {
  bool overwrite = false;
  /// Applied to the file before it is moved into place (0 keeps the umask default).
  std::filesystem::perms permissions = std::filesystem::perms::none;
};

/// Holds `<target>.lock` for the lifetime of the object. The lock file is
/// created with O_EXCL and records the owner's pid, so a second holder fails
/// instead of waiting. A lock whose recorded owner has exited is reclaimed.
class FileLock {
public:
  explicit FileLock(std::filesystem::path target);
  ~FileLock();

  FileLock(const FileLock &) = delete;
  FileLock &operator=(const FileLock &) = delete;

  [[nodiscard]] Status acquire();
  void release();

  [[nodiscard]] const std::filesystem::path &lock_path() const { return lock_path_; }

private:
  std::filesystem::path lock_path_;
  int fd_ = -1;
};

/// Writes `content` to `path` through a temporary sibling and a rename, under
/// a FileLock. Fails with ErrorKind::Io if `path` exists and overwrite is off;
/// without overwrite the file is published with link(), which never replaces.
[[nodiscard]] Status write_file_atomic(const std::filesystem::path &path,
                                       const std::string &content,
                                       const WriteOptions &options = {});

} // namespace ethos::common
