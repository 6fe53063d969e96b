#include "pmatch/storage/file_match_repository.h"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <fstream>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

namespace pmatch::storage {

namespace fs = std::filesystem;

namespace {

// Owns a POSIX file descriptor.
class FileDescriptor {
 public:
  explicit FileDescriptor(int fd) : fd_(fd) {}
  ~FileDescriptor() {
    if (fd_ >= 0) {
      ::close(fd_);
    }
  }
  FileDescriptor(const FileDescriptor&) = delete;
  FileDescriptor& operator=(const FileDescriptor&) = delete;

  [[nodiscard]] bool is_valid() const { return fd_ >= 0; }
  [[nodiscard]] int get() const { return fd_; }

  // Closes now; false when close() reports a deferred write error.
  bool close() {
    const int fd = fd_;
    fd_ = -1;
    return ::close(fd) == 0;
  }

 private:
  int fd_;
};

std::string errno_message() {
  return std::error_code(errno, std::generic_category()).message();
}

bool write_all(int fd, const std::string& data) {
  const char* p = data.data();
  std::size_t left = data.size();
  while (left > 0) {
    const ssize_t n = ::write(fd, p, left);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    p += n;
    left -= static_cast<std::size_t>(n);
  }
  return true;
}

}  // namespace

core::Result<bool, std::string> FileMatchRepository::save(const std::string& run_id,
                                                          const domain::MatchArtifact& artifact) {
  const std::string document = domain::serialize_match_artifact(artifact);

  const fs::path dir = path_.has_parent_path() ? path_.parent_path() : fs::path(".");
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    return core::Result<bool, std::string>::err("output directory does not exist: " +
                                                dir.string());
  }

  const fs::path tmp = dir / ("." + path_.filename().string() + "." + run_id + ".tmp");
  {
    FileDescriptor fd(::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
    if (!fd.is_valid()) {
      return core::Result<bool, std::string>::err("cannot create temporary file: " +
                                                  tmp.string() + ": " + errno_message());
    }
    // The content must be on disk before the rename can expose it under the final name.
    if (!write_all(fd.get(), document) || ::fsync(fd.get()) != 0 || !fd.close()) {
      const std::string message = errno_message();
      fs::remove(tmp, ec);
      return core::Result<bool, std::string>::err("failed writing temporary file: " +
                                                  tmp.string() + ": " + message);
    }
  }

  fs::rename(tmp, path_, ec);
  if (ec) {
    const std::string message = ec.message();
    fs::remove(tmp, ec);
    return core::Result<bool, std::string>::err("failed to move artifact into place at " +
                                                path_.string() + ": " + message);
  }

  // Persist the rename itself. The new artifact is already in place, so a directory that
  // cannot be synced (some filesystems reject fsync on directories) does not fail the save.
  FileDescriptor dir_fd(::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
  if (dir_fd.is_valid()) {
    static_cast<void>(::fsync(dir_fd.get()));
  }
  return core::Result<bool, std::string>::ok(true);
}

core::Result<std::optional<domain::MatchArtifact>, std::string> FileMatchRepository::load_latest()
    const {
  using R = core::Result<std::optional<domain::MatchArtifact>, std::string>;
  std::error_code ec;
  if (!fs::exists(path_, ec)) {
    return R::ok(std::nullopt);
  }
  std::ifstream in(path_, std::ios::binary);
  if (!in) {
    return R::err("cannot open artifact: " + path_.string());
  }
  try {
    const auto j = nlohmann::json::parse(in);
    return R::ok(domain::match_artifact_from_json(j));
  } catch (const std::exception& e) {
    return R::err("invalid artifact at " + path_.string() + ": " + e.what());
  }
}

}  // namespace pmatch::storage
