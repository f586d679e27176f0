#ifndef __PD_LOG_AUDIT_SINK__
#define __PD_LOG_AUDIT_SINK__

#include "Headers.hpp"
#include "SecurityGates.hpp"

namespace pd {
/**
 * @brief Writes audit events as single JSON lines to the "audit" logger
 * (see `LogHandler::setupAuditLogger`).
 */
class LogAuditSink : public AuditSink {
 public:
  LogAuditSink();
  virtual void record(const AuditEvent& event);

  static string format(const AuditEvent& event);
};
}  // namespace pd

#endif  // __PD_LOG_AUDIT_SINK__
