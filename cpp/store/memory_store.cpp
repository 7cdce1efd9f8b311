#include "store/store.hpp"

namespace store {

bool MemorySessionStore::Get(const std::string& session_id,
                             StoredSession* out) {
  std::lock_guard<std::mutex> lck(mutex_);
  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) return false;
  *out = it->second;
  return true;
}

uint64_t MemorySessionStore::Put(const session::Session& session,
                                 uint64_t expected_version) {
  std::lock_guard<std::mutex> lck(mutex_);
  StoredSession& stored = sessions_[session.session_id];
  if (stored.version != expected_version) {
    uint64_t actual = stored.version;
    if (actual == 0) sessions_.erase(session.session_id);
    throw PersistenceConflict(session.session_id, expected_version, actual);
  }
  stored.version++;
  stored.session = session;
  return stored.version;
}

std::vector<std::string> MemorySessionStore::List() {
  std::lock_guard<std::mutex> lck(mutex_);
  std::vector<std::string> ids;
  for (const auto& kv : sessions_) ids.push_back(kv.first);
  return ids;
}

}  // namespace store
