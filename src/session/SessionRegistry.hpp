#ifndef __PD_SESSION_REGISTRY__
#define __PD_SESSION_REGISTRY__

#include "Headers.hpp"
#include "SessionRecord.hpp"

namespace pd {
/**
 * @brief Maps session ids to the live `SessionRecord` instances.
 *
 * The lock is held only for the map operation itself, never across process
 * or ledger I/O.
 */
class SessionRegistry {
 public:
  /** @brief Adds or replaces the record stored under its id. */
  void insert(shared_ptr<SessionRecord> record);
  /** @brief Returns the record for `id`, or null. */
  shared_ptr<SessionRecord> get(const string& id);
  /**
   * @brief Removes `id` only if it still maps to `expected`, so a stale
   * removal never deletes a newer record that reused the id.
   */
  bool removeIfSame(const string& id,
                    const shared_ptr<SessionRecord>& expected);
  /** @brief Removes and returns whatever is stored under `id`. */
  shared_ptr<SessionRecord> remove(const string& id);
  /** @brief Point-in-time copy of all records. */
  vector<shared_ptr<SessionRecord>> snapshot();
  int size();

 protected:
  unordered_map<string, shared_ptr<SessionRecord>> records;
  /** @brief Synchronizes access to `records`. */
  recursive_mutex registryMutex;
};
}  // namespace pd

#endif  // __PD_SESSION_REGISTRY__
