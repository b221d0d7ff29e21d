#pragma once

#include <cstdint>
#include <filesystem>
#include <string_view>

namespace evstream {

// -----------------------------------------------------------------------------
// AppendFile: RAII owner of one append-only file descriptor
// -----------------------------------------------------------------------------
//
// @brief  Opens a file with O_APPEND | O_CREAT, writes whole buffers, and can
//         force them to stable storage with fsync(2).
//
// @details
// std::ofstream cannot fsync, and the writer's direct mode promises that an
// event is durable before emit() returns, so the segment is written through
// a POSIX descriptor instead.
//
// Errors are reported by throwing std::system_error carrying errno. The
// EventWriter catches them at its boundary.
//
// Thread model: Not thread-safe. Owned and used by exactly one writer (the
// caller's thread in direct mode, the consumer thread in concurrent mode).
// -----------------------------------------------------------------------------
class AppendFile {
 public:
  AppendFile() = default;
  ~AppendFile();

  AppendFile(const AppendFile&) = delete;
  AppendFile& operator=(const AppendFile&) = delete;
  AppendFile(AppendFile&& other) noexcept;
  AppendFile& operator=(AppendFile&& other) noexcept;

  // Opens (creating if needed) `path` for appending. Closes any file that
  // was open before. Throws std::system_error on failure.
  void open(const std::filesystem::path& path);

  // Writes all of `data`, retrying short writes and EINTR. Throws
  // std::system_error on failure.
  void write_all(std::string_view data);

  // fsync(2). Throws std::system_error on failure.
  void sync();

  // Current size of the open file in bytes. Throws std::system_error.
  std::uintmax_t size() const;

  // Closes the descriptor. Errors from close(2) are ignored: the data has
  // already been handed to the kernel by write_all().
  void close() noexcept;

  bool is_open() const { return fd_ >= 0; }

 private:
  int fd_{-1};
};

}  // namespace evstream
