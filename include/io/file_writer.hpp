#pragma once

#include <cerrno>
#include <fcntl.h>
#include <string>
#include <sys/uio.h>
#include <thread>
#include <unistd.h>

namespace io {

// Owning wrapper around an O_APPEND descriptor. Writes retry on
// EINTR/EAGAIN until every byte is out or a hard error occurs.
class AppendFile {
public:
  AppendFile() = default;
  explicit AppendFile(const std::string &path) { Open(path); }
  ~AppendFile() { Close(); }

  AppendFile(const AppendFile &) = delete;
  AppendFile &operator=(const AppendFile &) = delete;
  AppendFile(AppendFile &&other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
  AppendFile &operator=(AppendFile &&other) noexcept {
    if (this != &other) {
      Close();
      fd_ = other.fd_;
      other.fd_ = -1;
    }
    return *this;
  }

  bool Open(const std::string &path) {
    Close();
    fd_ = ::open(path.c_str(), O_CREAT | O_WRONLY | O_APPEND | O_CLOEXEC, 0644);
    return fd_ != -1;
  }

  bool IsOpen() const { return fd_ != -1; }

  void Close() {
    if (fd_ != -1) {
      ::close(fd_);
      fd_ = -1;
    }
  }

  // Returns false on a hard write error.
  bool WritevAll(struct iovec *iov, int cnt) {
    while (cnt > 0) {
      ssize_t n = ::writev(fd_, iov, cnt);
      if (n < 0) {
        if (errno == EINTR) {
          continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
          std::this_thread::yield();
          continue;
        }
        return false;
      }
      ssize_t consumed = n;
      while (consumed > 0 && cnt > 0) {
        if (consumed >= static_cast<ssize_t>(iov[0].iov_len)) {
          consumed -= static_cast<ssize_t>(iov[0].iov_len);
          ++iov;
          --cnt;
        } else {
          iov[0].iov_base = static_cast<char *>(iov[0].iov_base) + consumed;
          iov[0].iov_len -= static_cast<size_t>(consumed);
          consumed = 0;
        }
      }
    }
    return true;
  }

private:
  int fd_ = -1;
};

} // namespace io
