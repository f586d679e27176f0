#ifndef __PD_EVENT_FORMATTER__
#define __PD_EVENT_FORMATTER__

#include "Headers.hpp"
#include "JsonLib.hpp"

namespace pd {
/**
 * @brief Renders engine messages in the JSON shapes used on the wire, and
 * stream events as server-sent-event frames.
 */
class EventFormatter {
 public:
  static json toJson(const StreamEvent& event);
  static json toJson(const ErrorInfo& error);
  static json toJson(const SessionSummary& summary);

  /**
   * @brief `data: <json>\n\n`, or the `: keepalive\n\n` comment frame for
   * keepalives.
   */
  static string toSse(const StreamEvent& event);

  /** @brief Compact serialization; invalid UTF-8 is replaced, not thrown. */
  static string dump(const json& j);
};
}  // namespace pd

#endif  // __PD_EVENT_FORMATTER__
