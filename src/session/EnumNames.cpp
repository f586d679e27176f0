#include "EnumNames.hpp"

namespace pd {
string statusName(SessionStatus status) {
  switch (status) {
    case SESSION_STARTING:
      return "starting";
    case SESSION_RUNNING:
      return "running";
    case SESSION_BACKGROUND:
      return "background";
    case SESSION_STOPPED:
      return "stopped";
    case SESSION_ERROR:
      return "error";
  }
  return "unknown";
}

bool parseStatus(const string& name, SessionStatus* status) {
  static const map<string, SessionStatus> byName = {
      {"starting", SESSION_STARTING},
      {"running", SESSION_RUNNING},
      {"background", SESSION_BACKGROUND},
      {"stopped", SESSION_STOPPED},
      {"error", SESSION_ERROR},
  };
  auto it = byName.find(name);
  if (it == byName.end()) {
    return false;
  }
  *status = it->second;
  return true;
}

string eventTypeName(StreamEventType type) {
  switch (type) {
    case EVENT_CONNECTED:
      return "connected";
    case EVENT_STATUS:
      return "status";
    case EVENT_OUTPUT:
      return "output";
    case EVENT_RESUME_TOKEN_DISCOVERED:
      return "resumeTokenDiscovered";
    case EVENT_EXIT:
      return "exit";
    case EVENT_ERROR:
      return "error";
    case EVENT_COMPLETE:
      return "complete";
    case EVENT_KEEPALIVE:
      return "keepalive";
  }
  return "unknown";
}

string errorCodeName(ErrorCode code) {
  switch (code) {
    case ERR_NONE:
      return "none";
    case ERR_VALIDATION:
      return "validation";
    case ERR_PATH_DENIED:
      return "path-denied";
    case ERR_BINARY_NOT_FOUND:
      return "binary-not-found";
    case ERR_SPAWN_FAILED:
      return "spawn-failed";
    case ERR_NOT_FOUND:
      return "not-found";
    case ERR_GONE:
      return "gone";
    case ERR_NOT_RUNNING:
      return "not-running";
    case ERR_REJECTED:
      return "rejected";
    case ERR_RUNTIME:
      return "runtime";
  }
  return "unknown";
}
}  // namespace pd
