#ifndef __PD_SANDBOX_PATH_VALIDATOR__
#define __PD_SANDBOX_PATH_VALIDATOR__

#include "Headers.hpp"
#include "SecurityGates.hpp"

namespace pd {
/**
 * @brief Default path policy: no `..` traversal, nothing inside a protected
 * location, and (when a sandbox root is configured) nothing outside the
 * owner's own sandbox directory `<root>/<ownerId>`.
 */
class SandboxPathValidator : public PathValidator {
 public:
  /**
   * @param _protectedPaths Forbidden directories, "~" expanded. Their
   * subdirectories are forbidden too.
   * @param _sandboxRoot Empty to allow any unprotected path.
   */
  SandboxPathValidator(const vector<string>& _protectedPaths,
                       const string& _sandboxRoot);

  virtual PathDecision validate(const string& path, const string& ownerId);

  /** @brief Absolute, lexically normalized, no trailing slash. */
  static string normalize(const string& path);
  /** @brief True if `path` equals `root` or lies below it. */
  static bool isWithin(const string& path, const string& root);
  /** @brief Turns an owner id into a single safe path component. */
  static string sanitizeComponent(const string& component);

  static vector<string> defaultProtectedPaths();

 protected:
  vector<string> protectedPaths;
  string sandboxRoot;
};
}  // namespace pd

#endif  // __PD_SANDBOX_PATH_VALIDATOR__
