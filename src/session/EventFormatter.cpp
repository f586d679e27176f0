#include "EventFormatter.hpp"

#include "EnumNames.hpp"
#include "JsonFileLedger.hpp"

namespace pd {
json EventFormatter::toJson(const StreamEvent& event) {
  json j;
  j["type"] = eventTypeName(event.type());
  if (event.has_session_id()) {
    j["sessionId"] = event.session_id();
  }
  switch (event.type()) {
    case EVENT_CONNECTED:
      break;
    case EVENT_STATUS:
      j["status"] = statusName(event.status());
      break;
    case EVENT_OUTPUT:
      j["content"] = event.content();
      if (event.replayed()) {
        j["replayed"] = true;
      }
      break;
    case EVENT_RESUME_TOKEN_DISCOVERED:
      j["resumeToken"] = event.resume_token();
      break;
    case EVENT_EXIT:
      j["exitCode"] = event.exit_code();
      if (event.has_signal()) {
        j["signal"] = event.signal();
      }
      break;
    case EVENT_ERROR:
    case EVENT_COMPLETE:
      if (event.has_message()) {
        j["message"] = event.message();
      }
      break;
    case EVENT_KEEPALIVE:
      break;
  }
  return j;
}

json EventFormatter::toJson(const ErrorInfo& error) {
  json j;
  j["error"] = errorCodeName(error.code());
  j["message"] = error.message();
  j["status"] = error.http_status();
  if (error.pattern_categories_size() > 0) {
    vector<string> categories(error.pattern_categories().begin(),
                              error.pattern_categories().end());
    j["patterns"] = categories;
  }
  if (error.has_resume_token()) {
    j["resumeToken"] = error.resume_token();
  }
  return j;
}

json EventFormatter::toJson(const SessionSummary& summary) {
  json j = JsonFileLedger::toJson(summary.record());
  j["isActive"] = summary.is_active();
  if (summary.has_live_status()) {
    j["liveStatus"] = statusName(summary.live_status());
  } else {
    j["liveStatus"] = nullptr;
  }
  j["hasViewers"] = summary.has_viewers();
  return j;
}

string EventFormatter::dump(const json& j) {
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

string EventFormatter::toSse(const StreamEvent& event) {
  if (event.type() == EVENT_KEEPALIVE) {
    return ": keepalive\n\n";
  }
  return "data: " + dump(toJson(event)) + "\n\n";
}
}  // namespace pd
