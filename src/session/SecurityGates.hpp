#ifndef __PD_SECURITY_GATES__
#define __PD_SECURITY_GATES__

#include "Headers.hpp"

namespace pd {
struct PathDecision {
  bool allowed;
  string reason;
};

/**
 * @brief Decides whether a session may be started in a directory.
 */
class PathValidator {
 public:
  virtual ~PathValidator() {}
  virtual PathDecision validate(const string& path, const string& ownerId) = 0;
};

struct InputDecision {
  bool allowed;
  /** @brief Categories of the patterns that matched, without duplicates. */
  vector<string> categories;
};

/**
 * @brief Screens keystrokes headed for a sandboxed session.
 *
 * `quickCheck` is a cheap pre-filter; `analyze` only runs when it flags
 * the input.
 */
class InputGate {
 public:
  virtual ~InputGate() {}
  /** @brief True when the input is clearly harmless. */
  virtual bool quickCheck(const string& input) = 0;
  /** @brief Full analysis. */
  virtual InputDecision analyze(const string& input) = 0;

  InputDecision evaluate(const string& input) {
    if (quickCheck(input)) {
      return {true, {}};
    }
    return analyze(input);
  }
};

/**
 * @brief A security-relevant decision, for the audit trail.
 */
struct AuditEvent {
  /** @brief For example "path_denied" or "input_rejected". */
  string type;
  string sessionId;
  string ownerId;
  string detail;
  vector<string> categories;
  int64_t timestamp = 0;
};

class AuditSink {
 public:
  virtual ~AuditSink() {}
  virtual void record(const AuditEvent& event) = 0;
};
}  // namespace pd

#endif  // __PD_SECURITY_GATES__
