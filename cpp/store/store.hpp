#ifndef STORE_STORE_HPP
#define STORE_STORE_HPP

#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "session/model.hpp"

namespace store {

// A write based on a version that is no longer the stored one.
class PersistenceConflict : public std::runtime_error {
 public:
  PersistenceConflict(const std::string& session_id, uint64_t expected,
                      uint64_t actual)
      : std::runtime_error("Stale write to session " + session_id +
                           ": expected version " + std::to_string(expected) +
                           ", stored " + std::to_string(actual)) {}
};

struct StoredSession {
  uint64_t version = 0;
  session::Session session;
};

// Durable record of sessions, keyed by session id. Every successful write
// bumps the version of the record by one.
class SessionStore {
 public:
  // Returns false if there is no record for the id.
  virtual bool Get(const std::string& session_id, StoredSession* out) = 0;

  // Stores the session if the current version of its record is
  // expected_version (0 when the record does not exist yet), and returns the
  // new version. Throws PersistenceConflict otherwise.
  virtual uint64_t Put(const session::Session& session,
                       uint64_t expected_version) = 0;

  virtual std::vector<std::string> List() = 0;

  virtual ~SessionStore() = default;
};

class MemorySessionStore : public SessionStore {
 public:
  bool Get(const std::string& session_id, StoredSession* out) override;
  uint64_t Put(const session::Session& session,
               uint64_t expected_version) override;
  std::vector<std::string> List() override;

 private:
  std::mutex mutex_;
  std::map<std::string, StoredSession> sessions_;
};

// One file per session in a directory, replaced atomically on every write.
// Writes to different sessions proceed in parallel. Several stores, also in
// different processes, may share a directory: a write holds an flock on the
// lock file of its record and checks the version found on disk.
class FileSessionStore : public SessionStore {
 public:
  explicit FileSessionStore(std::string directory);

  bool Get(const std::string& session_id, StoredSession* out) override;
  uint64_t Put(const session::Session& session,
               uint64_t expected_version) override;
  std::vector<std::string> List() override;

 private:
  static const constexpr char* kExtension = ".session";
  static const constexpr char* kLockExtension = ".lock";

  std::string PathFor(const std::string& session_id) const;
  // Version on disk, 0 if the record does not exist.
  uint64_t StoredVersion(const std::string& session_id);

  std::string directory_;
};

}  // namespace store

#endif
