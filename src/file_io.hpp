#pragma once
/*
 * FileIO
 *
 * Purpose: whole-file read via mmap (CRLF normalized) and atomic write
 * (write .tmp -> fdatasync -> rename).
 * Usage: both return false with a status message in `msg` on failure.
 */
#include <string>
#include <string_view>
#include <filesystem>
#include <unistd.h>

class UniqueFd {
public:
  UniqueFd() : fd_(-1) {}
  explicit UniqueFd(int fd) : fd_(fd) {}
  UniqueFd(const UniqueFd&) = delete;
  UniqueFd& operator=(const UniqueFd&) = delete;
  UniqueFd(UniqueFd&& other) noexcept : fd_(other.release()) {}
  UniqueFd& operator=(UniqueFd&& other) noexcept {
    if (this != &other) reset(other.release());
    return *this;
  }
  ~UniqueFd() { reset(); }
  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }
  int release() { int fd = fd_; fd_ = -1; return fd; }
  void reset(int fd = -1) { if (fd_ >= 0) ::close(fd_); fd_ = fd; }
private:
  int fd_;
};

bool mmap_read_text(const std::filesystem::path& path, std::string& out, std::string& msg);
bool write_file_atomic(const std::filesystem::path& path, std::string_view data, std::string& msg);
