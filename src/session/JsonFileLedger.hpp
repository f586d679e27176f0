#ifndef __PD_JSON_FILE_LEDGER__
#define __PD_JSON_FILE_LEDGER__

#include "Headers.hpp"
#include "JsonLib.hpp"
#include "SessionLedger.hpp"

namespace pd {
/**
 * @brief Ledger persisted as one JSON array in a file.
 *
 * The whole file is rewritten on every change: first to a sibling
 * temporary file, which is then renamed over the original.
 */
class JsonFileLedger : public SessionLedger {
 public:
  /**
   * @brief Loads `_path` if it exists. A missing file is an empty ledger; an
   * unreadable one is logged and treated as empty.
   */
  explicit JsonFileLedger(const string& _path);

  virtual void upsert(const LedgerRecord& record);
  virtual optional<LedgerRecord> get(const string& id);
  virtual bool remove(const string& id);
  virtual vector<LedgerRecord> list();

  inline const string& getPath() const { return path; }

  /** @brief `<XDG data home>/ptydock/sessions.json`. */
  static string defaultPath();

  static json toJson(const LedgerRecord& record);
  /** @throws json::exception on malformed entries. */
  static LedgerRecord fromJson(const json& j);

 protected:
  void load();
  /** @throws std::runtime_error if the file cannot be replaced. */
  void persist();

  string path;
  /** @brief Entries in insertion order. */
  vector<LedgerRecord> entries;
  recursive_mutex ledgerMutex;
};
}  // namespace pd

#endif  // __PD_JSON_FILE_LEDGER__
