#include "store/store.hpp"

#include <dirent.h>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <system_error>

#include <kj/debug.h>
#include <kj/io.h>

#include "store/codec.hpp"
#include "util/file.hpp"

namespace {

bool ValidId(const std::string& id) {
  if (id.empty() || id.size() > 128) return false;
  for (char c : id) {
    if (!isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') {
      return false;
    }
  }
  return true;
}

bool EndsWith(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Exclusive flock on a lock file, released when the descriptor is closed.
// Descriptors opened separately exclude each other, in this process as well.
class RecordLock {
 public:
  explicit RecordLock(const std::string& path)
      : fd_(open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600)) {
    if (fd_.get() == -1) {
      throw std::system_error(errno, std::system_category(), "open " + path);
    }
    while (flock(fd_.get(), LOCK_EX) == -1) {
      if (errno == EINTR) continue;
      throw std::system_error(errno, std::system_category(), "flock " + path);
    }
  }
  KJ_DISALLOW_COPY(RecordLock);

 private:
  kj::AutoCloseFd fd_;
};

}  // namespace

namespace store {

FileSessionStore::FileSessionStore(std::string directory)
    : directory_(std::move(directory)) {
  util::File::MakeDirs(directory_);
}

std::string FileSessionStore::PathFor(const std::string& session_id) const {
  KJ_REQUIRE(ValidId(session_id), "Invalid session id", session_id);
  return util::File::JoinPath(directory_, session_id + kExtension);
}

uint64_t FileSessionStore::StoredVersion(const std::string& session_id) {
  std::string path = PathFor(session_id);
  if (!util::File::Exists(path)) return 0;
  return RecordVersion(util::File::ReadAll(path));
}

bool FileSessionStore::Get(const std::string& session_id,
                           StoredSession* out) {
  std::string path = PathFor(session_id);
  if (!util::File::Exists(path)) return false;
  out->session = Deserialize(util::File::ReadAll(path), &out->version);
  KJ_REQUIRE(out->session.session_id == session_id, "Mismatched record",
             path, out->session.session_id);
  return true;
}

uint64_t FileSessionStore::Put(const session::Session& session,
                               uint64_t expected_version) {
  std::string path = PathFor(session.session_id);
  RecordLock lock(util::File::JoinPath(directory_,
                                       session.session_id + kLockExtension));
  uint64_t actual = StoredVersion(session.session_id);
  if (actual != expected_version) {
    throw PersistenceConflict(session.session_id, expected_version, actual);
  }
  uint64_t version = expected_version + 1;
  util::File::WriteAll(path, Serialize(session, version));
  return version;
}

std::vector<std::string> FileSessionStore::List() {
  std::vector<std::string> ids;
  DIR* dir = opendir(directory_.c_str());
  if (dir == nullptr) {
    throw std::system_error(errno, std::system_category(),
                            "opendir " + directory_);
  }
  while (struct dirent* ent = readdir(dir)) {
    std::string name = ent->d_name;
    if (!EndsWith(name, kExtension)) continue;
    std::string id = name.substr(0, name.size() - strlen(kExtension));
    if (ValidId(id)) ids.push_back(id);
  }
  closedir(dir);
  std::sort(ids.begin(), ids.end());
  return ids;
}

}  // namespace store
