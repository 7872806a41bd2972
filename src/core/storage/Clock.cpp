#include "Clock.hpp"

#include <cerrno>
#include <cstring>
#include <ctime>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "core/storage/StoreError.hpp"

namespace vf {

Timestamp SystemClock::now() const {
  return static_cast<Timestamp>(std::time(nullptr));
}

Timestamp StoreClock::now() const {
  int fd = ::open(stampPath_.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0644);
  if (fd < 0) {
    throw StoreError(ErrorCode::Io, "clock stamp " + stampPath_ + ": " + std::strerror(errno));
  }
  // UTIME_NOW makes the filesystem stamp the file with its own time
  const struct timespec times[2] = {{0, UTIME_NOW}, {0, UTIME_NOW}};
  if (::futimens(fd, times) != 0) {
    int err = errno;
    ::close(fd);
    throw StoreError(ErrorCode::Io, "clock stamp touch: " + std::string(std::strerror(err)));
  }
  struct stat st{};
  if (::fstat(fd, &st) != 0) {
    int err = errno;
    ::close(fd);
    throw StoreError(ErrorCode::Io, "clock stamp stat: " + std::string(std::strerror(err)));
  }
  ::close(fd);
  return static_cast<Timestamp>(st.st_mtim.tv_sec);
}

} // namespace vf
