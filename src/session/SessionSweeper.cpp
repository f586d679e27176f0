#include "SessionSweeper.hpp"

namespace pd {
vector<ExpiredSession> SessionSweeper::collectExpired(
    const vector<shared_ptr<SessionRecord>>& records, int64_t nowMillis,
    const SweepPolicy& policy) {
  vector<ExpiredSession> expired;
  for (const auto& record : records) {
    SessionStatus status;
    int64_t idle;
    {
      lock_guard<recursive_mutex> guard(record->getMutex());
      status = record->getStatus();
      idle = nowMillis - record->getLastActivityAt();
    }
    if (SessionRecord::isTerminal(status)) {
      if (idle > policy.terminalRetentionMillis) {
        expired.push_back({record->getId(), record, "finished"});
      }
    } else if (record->getIsBackground()) {
      if (idle > policy.backgroundIdleMillis) {
        expired.push_back({record->getId(), record, "background idle"});
      }
    } else if (idle > policy.foregroundIdleMillis) {
      expired.push_back({record->getId(), record, "idle"});
    }
  }
  return expired;
}
}  // namespace pd
