#include "SessionRegistry.hpp"

namespace pd {
void SessionRegistry::insert(shared_ptr<SessionRecord> record) {
  lock_guard<recursive_mutex> guard(registryMutex);
  records[record->getId()] = record;
}

shared_ptr<SessionRecord> SessionRegistry::get(const string& id) {
  lock_guard<recursive_mutex> guard(registryMutex);
  auto it = records.find(id);
  if (it == records.end()) {
    return shared_ptr<SessionRecord>();
  }
  return it->second;
}

bool SessionRegistry::removeIfSame(const string& id,
                                   const shared_ptr<SessionRecord>& expected) {
  lock_guard<recursive_mutex> guard(registryMutex);
  auto it = records.find(id);
  if (it == records.end() || it->second != expected) {
    return false;
  }
  records.erase(it);
  return true;
}

shared_ptr<SessionRecord> SessionRegistry::remove(const string& id) {
  lock_guard<recursive_mutex> guard(registryMutex);
  auto it = records.find(id);
  if (it == records.end()) {
    return shared_ptr<SessionRecord>();
  }
  auto record = it->second;
  records.erase(it);
  return record;
}

vector<shared_ptr<SessionRecord>> SessionRegistry::snapshot() {
  lock_guard<recursive_mutex> guard(registryMutex);
  vector<shared_ptr<SessionRecord>> s;
  s.reserve(records.size());
  for (const auto& it : records) {
    s.push_back(it.second);
  }
  return s;
}

int SessionRegistry::size() {
  lock_guard<recursive_mutex> guard(registryMutex);
  return int(records.size());
}
}  // namespace pd
