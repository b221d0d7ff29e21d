#include "evstream/storage/append_file.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <system_error>
#include <utility>

namespace evstream {

namespace {

[[noreturn]] void throw_errno(const char* what) {
  throw std::system_error(errno, std::generic_category(), what);
}

}  // namespace

AppendFile::~AppendFile() { close(); }

AppendFile::AppendFile(AppendFile&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)) {}

AppendFile& AppendFile::operator=(AppendFile&& other) noexcept {
  if (this != &other) {
    close();
    fd_ = std::exchange(other.fd_, -1);
  }
  return *this;
}

void AppendFile::open(const std::filesystem::path& path) {
  close();
  int fd = ::open(path.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644);
  if (fd < 0) {
    throw_errno("open segment");
  }
  fd_ = fd;
}

void AppendFile::write_all(std::string_view data) {
  if (fd_ < 0) {
    throw std::system_error(EBADF, std::generic_category(), "write segment");
  }
  const char* ptr = data.data();
  std::size_t remaining = data.size();
  while (remaining > 0) {
    ssize_t written = ::write(fd_, ptr, remaining);
    if (written < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw_errno("write segment");
    }
    ptr += written;
    remaining -= static_cast<std::size_t>(written);
  }
}

void AppendFile::sync() {
  if (fd_ < 0) {
    throw std::system_error(EBADF, std::generic_category(), "fsync segment");
  }
  if (::fsync(fd_) != 0) {
    throw_errno("fsync segment");
  }
}

std::uintmax_t AppendFile::size() const {
  struct stat st {};
  if (fd_ < 0 || ::fstat(fd_, &st) != 0) {
    throw std::system_error(fd_ < 0 ? EBADF : errno, std::generic_category(),
                            "stat segment");
  }
  return static_cast<std::uintmax_t>(st.st_size);
}

void AppendFile::close() noexcept {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

}  // namespace evstream
