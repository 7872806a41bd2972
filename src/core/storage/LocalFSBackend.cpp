#include "LocalFSBackend.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

#include "core/model/Ids.hpp"
#include "core/storage/Collections.hpp"
#include "core/storage/StoreError.hpp"

namespace fs = std::filesystem;

namespace vf {

// -------- helpers --------

static const char* extension_for(const std::string& collection) {
  return collection == kUpdates ? ".json" : ".md";
}

static StoreError io_error(const std::string& what, int err) {
  return StoreError(ErrorCode::Io, what + ": " + std::strerror(err));
}

static void fsync_dir(const std::string& dir) {
  int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (fd < 0) {
    spdlog::warn("cannot open {} for fsync: {}", dir, std::strerror(errno));
    return;
  }
  if (::fsync(fd) != 0) spdlog::warn("fsync {} failed: {}", dir, std::strerror(errno));
  ::close(fd);
}

static void write_all(int fd, const std::string& content, const std::string& path) {
  const char* p = content.data();
  size_t left = content.size();
  while (left > 0) {
    ssize_t n = ::write(fd, p, left);
    if (n < 0) {
      if (errno == EINTR) continue;
      throw io_error("write " + path, errno);
    }
    p += n;
    left -= static_cast<size_t>(n);
  }
}

// -------- LocalFSBackend --------

LocalFSBackend::LocalFSBackend(std::string root, std::shared_ptr<Clock> clock)
  : root_(std::move(root)), clock_(std::move(clock)) {
  std::error_code ec;
  fs::create_directories(fs::path(root_) / kStateDir / "tmp", ec);
  if (ec) throw StoreError(ErrorCode::Io, "cannot create store root " + root_ + ": " + ec.message());
  if (!clock_) {
    clock_ = std::make_shared<StoreClock>((fs::path(root_) / kStateDir / "clock").string());
  }
}

std::string LocalFSBackend::dirOf(const std::string& collection) const {
  if (!is_valid_collection(collection)) {
    throw StoreError(ErrorCode::InvalidId, "invalid collection '" + collection + "'");
  }
  return (fs::path(root_) / collection).string();
}

std::string LocalFSBackend::pathOf(const std::string& collection, const std::string& id) const {
  if (!is_valid_id(id)) throw StoreError(ErrorCode::InvalidId, "invalid id '" + id + "'");
  return (fs::path(dirOf(collection)) / (id + extension_for(collection))).string();
}

std::string LocalFSBackend::ensureDir(const std::string& collection) const {
  const std::string dir = dirOf(collection);
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) throw StoreError(ErrorCode::Io, "cannot create " + dir + ": " + ec.message());
  return dir;
}

std::string LocalFSBackend::stage(const std::string& id, const std::string& content) const {
  const std::string tmp =
    (fs::path(root_) / kStateDir / "tmp" / (id + "." + uuid4() + ".tmp")).string();
  int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
  if (fd < 0) throw io_error("create " + tmp, errno);
  try {
    write_all(fd, content, tmp);
    if (::fsync(fd) != 0) throw io_error("fsync " + tmp, errno);
  } catch (...) {
    ::close(fd);
    ::unlink(tmp.c_str());
    throw;
  }
  ::close(fd);
  return tmp;
}

void LocalFSBackend::createExclusive(const std::string& collection,
                                     const std::string& id,
                                     const std::string& content) {
  const std::string dst = pathOf(collection, id);
  const std::string dir = ensureDir(collection);
  const std::string tmp = stage(id, content);

  // link(2) fails with EEXIST atomically; a reader sees the whole file or nothing.
  int rc = ::link(tmp.c_str(), dst.c_str());
  int err = errno;
  ::unlink(tmp.c_str());
  if (rc != 0) {
    if (err == EEXIST) {
      throw StoreError(ErrorCode::AlreadyExists, collection + "/" + id);
    }
    throw io_error("link " + dst, err);
  }
  fsync_dir(dir);
  spdlog::debug("created {}/{}", collection, id);
}

void LocalFSBackend::moveAtomic(const std::string& from,
                                const std::string& to,
                                const std::string& id) {
  const std::string src = pathOf(from, id);
  const std::string dst = pathOf(to, id);
  const std::string dstDir = ensureDir(to);

  if (::renameat2(AT_FDCWD, src.c_str(), AT_FDCWD, dst.c_str(), RENAME_NOREPLACE) != 0) {
    int err = errno;
    if (err == ENOENT) throw StoreError(ErrorCode::NotFound, from + "/" + id);
    if (err == EEXIST) throw StoreError(ErrorCode::AlreadyExists, to + "/" + id);
    if (err == EINVAL) {
      throw io_error("filesystem under " + root_ + " does not support RENAME_NOREPLACE", err);
    }
    throw io_error("rename " + src + " -> " + dst, err);
  }
  fsync_dir(dstDir);
  fsync_dir(dirOf(from));
  spdlog::debug("moved {} {} -> {}", id, from, to);
}

std::vector<std::string> LocalFSBackend::list(const std::string& collection) const {
  std::vector<std::string> ids;
  const std::string dir = dirOf(collection);
  const std::string ext = extension_for(collection);
  std::error_code ec;
  fs::directory_iterator it(dir, ec), end;
  if (ec) {
    if (ec == std::errc::no_such_file_or_directory) return ids;
    throw StoreError(ErrorCode::Io, "cannot list " + dir + ": " + ec.message());
  }
  for (; it != end; it.increment(ec)) {
    if (ec) throw StoreError(ErrorCode::Io, "cannot list " + dir + ": " + ec.message());
    const std::string name = it->path().filename().string();
    if (name.size() <= ext.size() || name.compare(name.size() - ext.size(), ext.size(), ext) != 0) {
      continue;
    }
    std::string id = name.substr(0, name.size() - ext.size());
    if (is_valid_id(id) && it->is_regular_file(ec)) ids.push_back(std::move(id));
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

std::vector<std::string> LocalFSBackend::children(const std::string& parent) const {
  std::vector<std::string> out;
  const std::string dir = dirOf(parent);
  std::error_code ec;
  fs::directory_iterator it(dir, ec), end;
  if (ec) {
    if (ec == std::errc::no_such_file_or_directory) return out;
    throw StoreError(ErrorCode::Io, "cannot list " + dir + ": " + ec.message());
  }
  for (; it != end; it.increment(ec)) {
    if (ec) throw StoreError(ErrorCode::Io, "cannot list " + dir + ": " + ec.message());
    const std::string name = it->path().filename().string();
    if (is_valid_id(name) && it->is_directory(ec)) out.push_back(name);
  }
  std::sort(out.begin(), out.end());
  return out;
}

bool LocalFSBackend::exists(const std::string& collection, const std::string& id) const {
  struct stat st{};
  return ::stat(pathOf(collection, id).c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

std::string LocalFSBackend::readRaw(const std::string& collection, const std::string& id) const {
  const std::string path = pathOf(collection, id);
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    if (errno == ENOENT) throw StoreError(ErrorCode::NotFound, collection + "/" + id);
    throw io_error("open " + path, errno);
  }
  std::ostringstream buf;
  buf << in.rdbuf();
  return buf.str();
}

void LocalFSBackend::replaceRaw(const std::string& collection,
                                const std::string& id,
                                const std::string& content) {
  const std::string dst = pathOf(collection, id);
  const std::string tmp = stage(id, content);

  // EXCHANGE requires both paths to exist, so a record that moved away is
  // never recreated here.
  int rc = ::renameat2(AT_FDCWD, tmp.c_str(), AT_FDCWD, dst.c_str(), RENAME_EXCHANGE);
  int err = errno;
  ::unlink(tmp.c_str());
  if (rc != 0) {
    if (err == ENOENT) throw StoreError(ErrorCode::NotFound, collection + "/" + id);
    throw io_error("exchange " + dst, err);
  }
  fsync_dir(dirOf(collection));
}

Timestamp LocalFSBackend::modifiedAt(const std::string& collection, const std::string& id) const {
  const std::string path = pathOf(collection, id);
  struct stat st{};
  if (::stat(path.c_str(), &st) != 0) {
    if (errno == ENOENT) throw StoreError(ErrorCode::NotFound, collection + "/" + id);
    throw io_error("stat " + path, errno);
  }
  return static_cast<Timestamp>(st.st_ctim.tv_sec);
}

// -------- leases --------

std::string LocalFSBackend::leasePath(const std::string& owner) const {
  if (!is_valid_id(owner)) throw StoreError(ErrorCode::InvalidId, "invalid owner '" + owner + "'");
  return (fs::path(root_) / kStateDir / "leases" / owner).string();
}

void LocalFSBackend::touchLease(const std::string& owner, Timestamp at) {
  const std::string path = leasePath(owner);
  std::error_code ec;
  fs::create_directories(fs::path(path).parent_path(), ec);
  if (ec) throw StoreError(ErrorCode::Io, "cannot create lease dir: " + ec.message());

  int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0644);
  if (fd < 0) throw io_error("open " + path, errno);
  // the stamp is the caller's store time, not the local wall clock
  const struct timespec times[2] = {{static_cast<time_t>(at), 0}, {static_cast<time_t>(at), 0}};
  if (::futimens(fd, times) != 0) {
    int err = errno;
    ::close(fd);
    throw io_error("stamp " + path, err);
  }
  ::close(fd);
}

std::optional<Timestamp> LocalFSBackend::leaseAt(const std::string& owner) const {
  const std::string path = leasePath(owner);
  struct stat st{};
  if (::stat(path.c_str(), &st) != 0) {
    if (errno == ENOENT) return std::nullopt;
    throw io_error("stat " + path, errno);
  }
  return static_cast<Timestamp>(st.st_mtim.tv_sec);
}

} // namespace vf
