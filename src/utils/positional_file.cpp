#include "utils/positional_file.hpp"
#include <boost/log/trivial.hpp>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace cloudsync::utils {

namespace {

std::string describe(const std::filesystem::path& path, const char* what) {
  return std::string(what) + " '" + path.string() + "': " + std::strerror(errno);
}

} // namespace

FileStat stat_file(const std::filesystem::path& path) {
  struct stat sb;
  if (::stat(path.c_str(), &sb) < 0) {
    throw FileError(describe(path, "Cannot stat"));
  }
  FileStat result;
  result.size = static_cast<uint64_t>(sb.st_size);
  result.mtime = static_cast<int64_t>(sb.st_mtime);
  return result;
}

void set_file_mtime(const std::filesystem::path& path, int64_t mtime) {
  struct timespec times[2];
  times[0].tv_sec = static_cast<time_t>(mtime);
  times[0].tv_nsec = 0;
  times[1] = times[0];
  if (::utimensat(AT_FDCWD, path.c_str(), times, 0) < 0) {
    throw FileError(describe(path, "Cannot set mtime of"));
  }
}

PositionalFile::PositionalFile(const std::filesystem::path& path, Access access) : path_(path) {
  int flags = access == Access::Read ? O_RDONLY : (O_RDWR | O_CREAT);
  flags |= O_CLOEXEC;

  do {
    fd_ = ::open(path_.c_str(), flags, 0644);
  } while (fd_ < 0 && errno == EINTR);

  if (fd_ < 0) {
    throw FileError(describe(path_, "Cannot open"));
  }
  BOOST_LOG_TRIVIAL(trace) << "Positional file: Opened '" << path_.string() << "'";
}

PositionalFile::~PositionalFile() {
  if (fd_ >= 0) {
    ::close(fd_);
  }
}

std::vector<uint8_t> PositionalFile::read_at(uint64_t offset, std::size_t size) const {
  std::vector<uint8_t> buffer(size);
  std::size_t done = 0;

  while (done < size) {
    ssize_t ret = ::pread(fd_, buffer.data() + done, size - done, static_cast<off_t>(offset + done));
    if (ret < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw FileError(describe(path_, "Cannot read"));
    }
    if (ret == 0) {
      break;
    }
    done += static_cast<std::size_t>(ret);
  }

  buffer.resize(done);
  return buffer;
}

void PositionalFile::write_at(uint64_t offset, const uint8_t* data, std::size_t size) {
  std::size_t done = 0;

  while (done < size) {
    ssize_t ret = ::pwrite(fd_, data + done, size - done, static_cast<off_t>(offset + done));
    if (ret < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw FileError(describe(path_, "Cannot write"));
    }
    done += static_cast<std::size_t>(ret);
  }
}

void PositionalFile::truncate(uint64_t size) {
  if (::ftruncate(fd_, static_cast<off_t>(size)) < 0) {
    throw FileError(describe(path_, "Cannot resize"));
  }
}

uint64_t PositionalFile::size() const {
  struct stat sb;
  if (::fstat(fd_, &sb) < 0) {
    throw FileError(describe(path_, "Cannot stat"));
  }
  return static_cast<uint64_t>(sb.st_size);
}

void PositionalFile::sync() {
  if (::fsync(fd_) < 0) {
    throw FileError(describe(path_, "Cannot flush"));
  }
}

} // namespace cloudsync::utils
