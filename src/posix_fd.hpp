#pragma once
#include <fcntl.h>
#include <unistd.h>

// owning file descriptor; closed on destruction
class UniqueFd {
public:
  UniqueFd() : fd_(-1) {}
  explicit UniqueFd(int fd) : fd_(fd) {}
  UniqueFd(const UniqueFd&) = delete;
  UniqueFd& operator=(const UniqueFd&) = delete;
  UniqueFd(UniqueFd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
  UniqueFd& operator=(UniqueFd&& other) noexcept {
    if (this != &other) { reset(); fd_ = other.fd_; other.fd_ = -1; }
    return *this;
  }
  ~UniqueFd() { if (fd_ >= 0) ::close(fd_); }
  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }
  // duplicate onto target (e.g. STDOUT_FILENO); false on failure
  bool dup_onto(int target) const { return fd_ >= 0 && ::dup2(fd_, target) >= 0; }
  void reset() { if (fd_ >= 0) ::close(fd_); fd_ = -1; }
  static UniqueFd open_dev_null() { return UniqueFd(::open("/dev/null", O_RDWR | O_CLOEXEC)); }
  // both ends close on exec
  static bool make_pipe(UniqueFd& read_end, UniqueFd& write_end) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) < 0) return false;
    read_end = UniqueFd(fds[0]);
    write_end = UniqueFd(fds[1]);
    return true;
  }
private:
  int fd_;
};
