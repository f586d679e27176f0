#ifndef __PD_SESSION_LEDGER__
#define __PD_SESSION_LEDGER__

#include "Headers.hpp"

namespace pd {
/**
 * @brief Durable store of every session ever created, used to resume
 * sessions across server restarts.
 *
 * Implementations report storage failures with std::runtime_error.
 */
class SessionLedger {
 public:
  virtual ~SessionLedger() {}
  /** @brief Inserts or replaces the entry with the record's id. */
  virtual void upsert(const LedgerRecord& record) = 0;
  virtual optional<LedgerRecord> get(const string& id) = 0;
  /** @return false if there was no such entry. */
  virtual bool remove(const string& id) = 0;
  virtual vector<LedgerRecord> list() = 0;
};
}  // namespace pd

#endif  // __PD_SESSION_LEDGER__
