#ifndef __PD_SESSION_SWEEPER__
#define __PD_SESSION_SWEEPER__

#include "Headers.hpp"
#include "SessionRecord.hpp"

namespace pd {
/**
 * @brief Retention limits for abandoned sessions, in milliseconds.
 */
struct SweepPolicy {
  int64_t foregroundIdleMillis = 2LL * 60 * 60 * 1000;
  int64_t backgroundIdleMillis = 24LL * 60 * 60 * 1000;
  /** @brief How long stopped/error records stay observable. */
  int64_t terminalRetentionMillis = 5LL * 60 * 1000;
};

struct ExpiredSession {
  string id;
  shared_ptr<SessionRecord> record;
  string reason;
};

class SessionSweeper {
 public:
  /**
   * @brief Picks the records that should be retired at `nowMillis`.
   *
   * Reads each record's status and activity time but changes nothing.
   */
  static vector<ExpiredSession> collectExpired(
      const vector<shared_ptr<SessionRecord>>& records, int64_t nowMillis,
      const SweepPolicy& policy);
};
}  // namespace pd

#endif  // __PD_SESSION_SWEEPER__
