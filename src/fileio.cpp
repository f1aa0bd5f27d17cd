#include "ace/fileio.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <random>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace ace {

namespace {

// Unique temporary name beside the target so rename() stays on one filesystem.
std::string make_tmp_name(const fs::path& dir, const std::string& stem) {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  std::uniform_int_distribution<uint64_t> dist;
  return (dir / (".tmp_" + stem + "_" + std::to_string(dist(rng)))).string();
}

void set_error(std::string* error, const std::string& msg) {
  if (error) *error = msg;
}

// Owns a temp file descriptor. Unless commit() is reached, the destructor
// closes the descriptor and unlinks the temp path.
class TempFile {
 public:
  explicit TempFile(std::string path) : path_(std::move(path)) {
    fd_ = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
  }

  ~TempFile() {
    if (fd_ >= 0) ::close(fd_);
    if (!committed_) ::unlink(path_.c_str());
  }

  TempFile(const TempFile&) = delete;
  TempFile& operator=(const TempFile&) = delete;

  bool ok() const { return fd_ >= 0; }
  const std::string& path() const { return path_; }

  bool write_all(const std::string& data) {
    const char* p = data.data();
    size_t left = data.size();
    while (left > 0) {
      const ssize_t n = ::write(fd_, p, left);
      if (n < 0) {
        if (errno == EINTR) continue;
        return false;
      }
      p += n;
      left -= static_cast<size_t>(n);
    }
    return true;
  }

  bool sync() { return ::fsync(fd_) == 0; }

  bool close() {
    const int rc = ::close(fd_);
    fd_ = -1;
    return rc == 0;
  }

  void commit() { committed_ = true; }

 private:
  std::string path_;
  int fd_{-1};
  bool committed_{false};
};

void fsync_dir(const fs::path& dir) {
  const int dfd = ::open(dir.empty() ? "." : dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (dfd < 0) return;
  (void)::fsync(dfd);  // best effort; some filesystems refuse directory fsync
  ::close(dfd);
}

}  // namespace

std::optional<std::string> read_file_bytes(const std::string& path, std::string* error) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) {
    set_error(error, "cannot open " + path);
    return std::nullopt;
  }
  std::string data((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
  if (ifs.bad()) {
    set_error(error, "read failed: " + path);
    return std::nullopt;
  }
  return data;
}

bool atomic_write(const std::string& path, const std::string& data, std::string* error) {
  const fs::path target(path);
  const fs::path dir = target.has_parent_path() ? target.parent_path() : fs::path(".");

  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) {
    set_error(error, "cannot create " + dir.string() + ": " + ec.message());
    return false;
  }

  TempFile tmp(make_tmp_name(dir, target.filename().string()));
  if (!tmp.ok()) {
    set_error(error, "cannot create temp file in " + dir.string() + ": " + std::strerror(errno));
    return false;
  }
  if (!tmp.write_all(data)) {
    set_error(error, "write failed for " + tmp.path() + ": " + std::strerror(errno));
    return false;
  }
  if (!tmp.sync()) {
    set_error(error, "fsync failed for " + tmp.path() + ": " + std::strerror(errno));
    return false;
  }
  if (!tmp.close()) {
    set_error(error, "close failed for " + tmp.path() + ": " + std::strerror(errno));
    return false;
  }
  if (::rename(tmp.path().c_str(), target.c_str()) != 0) {
    set_error(error, "rename to " + path + " failed: " + std::strerror(errno));
    return false;
  }
  tmp.commit();
  fsync_dir(dir);
  return true;
}

std::string detect_newline_style(const std::string& content) {
  bool crlf = false, lf = false, cr = false;
  for (size_t i = 0; i < content.size(); ++i) {
    if (content[i] == '\r') {
      if (i + 1 < content.size() && content[i + 1] == '\n') {
        crlf = true;
        ++i;
      } else {
        cr = true;
      }
    } else if (content[i] == '\n') {
      lf = true;
    }
  }
  const int styles = static_cast<int>(crlf) + static_cast<int>(lf) + static_cast<int>(cr);
  if (styles == 0) return "LF";
  if (styles > 1) return "MIXED";
  if (crlf) return "CRLF";
  if (lf) return "LF";
  return "CR";
}

std::string normalize_newlines(const std::string& content, const std::string& style) {
  const std::string nl = (style == "CRLF") ? "\r\n" : "\n";
  std::string out;
  out.reserve(content.size());
  for (size_t i = 0; i < content.size(); ++i) {
    const char c = content[i];
    if (c == '\r') {
      if (i + 1 < content.size() && content[i + 1] == '\n') ++i;
      out += nl;
    } else if (c == '\n') {
      out += nl;
    } else {
      out += c;
    }
  }
  return out;
}

}  // namespace ace
