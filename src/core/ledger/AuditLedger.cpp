#include "AuditLedger.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

#include "core/storage/StoreError.hpp"

namespace fs = std::filesystem;
using nlohmann::json;

namespace vf {

namespace {

// Holds an flock for the lifetime of the object; closes the descriptor.
class LockedFile {
public:
  LockedFile(const std::string& path, int flags, int lockOp) {
    fd_ = ::open(path.c_str(), flags | O_CLOEXEC, 0644);
    if (fd_ < 0) return;
    while (::flock(fd_, lockOp) != 0) {
      if (errno == EINTR) continue;
      int err = errno;
      ::close(fd_);
      fd_ = -1;
      errno = err;
      return;
    }
  }
  ~LockedFile() {
    if (fd_ >= 0) ::close(fd_);  // releases the lock
  }
  LockedFile(const LockedFile&) = delete;
  LockedFile& operator=(const LockedFile&) = delete;

  int fd() const { return fd_; }

private:
  int fd_ = -1;
};

} // namespace

AuditLedger::AuditLedger(std::string dir, const Clock& clock)
  : dir_(std::move(dir)), clock_(clock) {
  std::error_code ec;
  fs::create_directories(dir_, ec);
  if (ec) throw StoreError(ErrorCode::Io, "cannot create ledger dir " + dir_ + ": " + ec.message());
}

std::string AuditLedger::pathOf(const std::string& partitionKey) const {
  if (!is_date_key(partitionKey)) {
    throw StoreError(ErrorCode::InvalidId, "invalid ledger partition '" + partitionKey + "'");
  }
  return (fs::path(dir_) / (partitionKey + ".jsonl")).string();
}

void AuditLedger::append(const std::string& partitionKey, const AuditLogEntry& entry) {
  const std::string path = pathOf(partitionKey);
  // invalid UTF-8 from hand-written records is replaced, never fatal
  std::string line = to_json(entry).dump(-1, ' ', false, json::error_handler_t::replace) + "\n";

  std::lock_guard<std::mutex> guard(mu_);
  LockedFile f(path, O_RDWR | O_APPEND | O_CREAT, LOCK_EX);
  if (f.fd() < 0) {
    throw StoreError(ErrorCode::Io, "ledger open " + path + ": " + std::strerror(errno));
  }

  // a writer that died mid-line left a torn tail; terminate it so this entry
  // starts on a line of its own
  struct stat st{};
  if (::fstat(f.fd(), &st) != 0) {
    throw StoreError(ErrorCode::Io, "ledger stat " + path + ": " + std::strerror(errno));
  }
  if (st.st_size > 0) {
    char last = '\n';
    if (::pread(f.fd(), &last, 1, st.st_size - 1) != 1) {
      throw StoreError(ErrorCode::Io, "ledger read " + path + ": " + std::strerror(errno));
    }
    if (last != '\n') line.insert(line.begin(), '\n');
  }

  const char* p = line.data();
  size_t left = line.size();
  while (left > 0) {
    ssize_t n = ::write(f.fd(), p, left);
    if (n < 0) {
      if (errno == EINTR) continue;
      throw StoreError(ErrorCode::Io, "ledger write " + path + ": " + std::strerror(errno));
    }
    p += n;
    left -= static_cast<size_t>(n);
  }
  if (::fdatasync(f.fd()) != 0) {
    throw StoreError(ErrorCode::Io, "ledger sync " + path + ": " + std::strerror(errno));
  }
}

void AuditLedger::append(const AuditLogEntry& entry) {
  append(date_key(entry.timestamp), entry);
}

AuditLogEntry AuditLedger::record(const std::string& actionType,
                                  const std::string& actor,
                                  const std::string& target,
                                  const std::map<std::string, std::string>& parameters,
                                  AuditResult result,
                                  const std::string& errorDetail) {
  AuditLogEntry e;
  e.timestamp = clock_.now();
  e.action_type = actionType;
  e.actor = actor;
  e.target = target;
  e.parameters = bound_parameters(parameters);
  e.result = result;
  e.error_detail = errorDetail;
  append(e);
  return e;
}

std::vector<AuditLogEntry> AuditLedger::read(const std::string& partitionKey) const {
  std::vector<AuditLogEntry> out;
  const std::string path = pathOf(partitionKey);

  std::string data;
  {
    LockedFile f(path, O_RDONLY, LOCK_SH);
    if (f.fd() < 0) {
      if (errno == ENOENT) return out;
      throw StoreError(ErrorCode::Io, "ledger open " + path + ": " + std::strerror(errno));
    }
    char buf[8192];
    for (;;) {
      ssize_t n = ::read(f.fd(), buf, sizeof(buf));
      if (n < 0) {
        if (errno == EINTR) continue;
        throw StoreError(ErrorCode::Io, "ledger read " + path + ": " + std::strerror(errno));
      }
      if (n == 0) break;
      data.append(buf, static_cast<size_t>(n));
    }
  }

  size_t pos = 0;
  size_t lineNo = 0;
  while (pos < data.size()) {
    size_t nl = data.find('\n', pos);
    ++lineNo;
    if (nl == std::string::npos) {
      spdlog::warn("ledger {}: ignoring unterminated trailing line {}", partitionKey, lineNo);
      break;
    }
    const std::string line = data.substr(pos, nl - pos);
    pos = nl + 1;
    if (line.empty()) continue;
    try {
      out.push_back(audit_entry_from_json(json::parse(line)));
    } catch (const json::exception& e) {
      spdlog::warn("ledger {}: skipping undecodable line {}: {}", partitionKey, lineNo, e.what());
    } catch (const std::invalid_argument& e) {
      spdlog::warn("ledger {}: skipping invalid line {}: {}", partitionKey, lineNo, e.what());
    }
  }
  return out;
}

std::vector<std::string> AuditLedger::partitions() const {
  std::vector<std::string> keys;
  std::error_code ec;
  fs::directory_iterator it(dir_, ec), end;
  if (ec) {
    if (ec == std::errc::no_such_file_or_directory) return keys;
    throw StoreError(ErrorCode::Io, "cannot list ledger " + dir_ + ": " + ec.message());
  }
  for (; it != end; it.increment(ec)) {
    if (ec) throw StoreError(ErrorCode::Io, "cannot list ledger " + dir_ + ": " + ec.message());
    const fs::path p = it->path();
    if (p.extension() == ".jsonl" && is_date_key(p.stem().string())) {
      keys.push_back(p.stem().string());
    }
  }
  std::sort(keys.begin(), keys.end());
  return keys;
}

std::vector<AuditLogEntry> AuditLedger::recent(size_t n) const {
  std::vector<AuditLogEntry> out;
  if (n == 0) return out;
  const auto keys = partitions();
  for (auto it = keys.rbegin(); it != keys.rend() && out.size() < n; ++it) {
    auto entries = read(*it);
    size_t take = std::min(n - out.size(), entries.size());
    out.insert(out.begin(), entries.end() - static_cast<std::ptrdiff_t>(take), entries.end());
  }
  return out;
}

} // namespace vf
