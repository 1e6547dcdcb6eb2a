#ifndef CLOUDSYNC_UTILS_POSITIONAL_FILE_HPP
#define CLOUDSYNC_UTILS_POSITIONAL_FILE_HPP

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace cloudsync::utils {

class FileError : public std::runtime_error {
public:
  explicit FileError(const std::string& message)
    : std::runtime_error("File error: " + message) {}
};

struct FileStat {
  uint64_t size = 0;
  // Seconds since the epoch
  int64_t mtime = 0;
};

FileStat stat_file(const std::filesystem::path& path);
void set_file_mtime(const std::filesystem::path& path, int64_t mtime);

/*
 * File descriptor opened once and accessed with pread/pwrite, so concurrent
 * workers never share a cursor.
 */
class PositionalFile {
public:
  enum class Access {
    Read,
    ReadWrite  // creates the file if missing, never truncates
  };

  PositionalFile(const std::filesystem::path& path, Access access);
  ~PositionalFile();

  PositionalFile(const PositionalFile&) = delete;
  PositionalFile& operator=(const PositionalFile&) = delete;

  // Reads up to `size` bytes; fewer only at end of file
  std::vector<uint8_t> read_at(uint64_t offset, std::size_t size) const;
  // Writes all of `size` bytes at `offset`
  void write_at(uint64_t offset, const uint8_t* data, std::size_t size);
  void truncate(uint64_t size);
  uint64_t size() const;
  void sync();

  const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
  int fd_ = -1;
};

} // namespace cloudsync::utils

#endif // CLOUDSYNC_UTILS_POSITIONAL_FILE_HPP
