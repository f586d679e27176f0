#include "LogAuditSink.hpp"

#include "JsonLib.hpp"

namespace pd {
LogAuditSink::LogAuditSink() {
  // Registers the logger with default settings if nobody configured it.
  el::Loggers::getLogger("audit");
}

string LogAuditSink::format(const AuditEvent& event) {
  json j;
  j["type"] = event.type;
  j["sessionId"] = event.sessionId;
  j["ownerId"] = event.ownerId;
  j["detail"] = event.detail;
  if (!event.categories.empty()) {
    j["categories"] = event.categories;
  }
  j["timestamp"] = event.timestamp;
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

void LogAuditSink::record(const AuditEvent& event) {
  CLOG(WARNING, "audit") << format(event);
}
}  // namespace pd
