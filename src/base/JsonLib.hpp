#ifndef __PD_JSON_LIB__
#define __PD_JSON_LIB__

#include "nlohmann/json.hpp"

/**
 * @brief Lightweight wrapper that exposes `nlohmann::json` as `json`.
 */
using json = nlohmann::json;

namespace pd {
/** @brief Reads `key` from a json object, or returns `fallback`. */
template <typename T>
inline T jsonValueOr(const json& j, const char* key, const T& fallback) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return fallback;
  }
  return it->get<T>();
}
}  // namespace pd

#endif  // __PD_JSON_LIB__
