#ifndef __PD_ENUM_NAMES__
#define __PD_ENUM_NAMES__

#include "Headers.hpp"

namespace pd {
/** @brief Lowercase wire name of a status ("running", "stopped", ...). */
string statusName(SessionStatus status);
/** @brief Inverse of `statusName`. Returns false for unknown names. */
bool parseStatus(const string& name, SessionStatus* status);
/** @brief Camel-case wire name of an event type ("resumeTokenDiscovered"). */
string eventTypeName(StreamEventType type);
/** @brief Kebab-case wire name of an error code ("not-running"). */
string errorCodeName(ErrorCode code);
}  // namespace pd

#endif  // __PD_ENUM_NAMES__
