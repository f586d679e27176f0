#ifndef __PD_LAUNCH_ENVIRONMENT__
#define __PD_LAUNCH_ENVIRONMENT__

#include "Headers.hpp"

namespace pd {
/**
 * @brief Resolves the assistant binary and builds the environment it runs
 * in.
 *
 * The wrapped CLI is usually installed per-user and is frequently missing
 * from the PATH of whatever launched the server, so the install locations
 * are checked explicitly before falling back to a PATH search.
 */
class LaunchEnvironment {
 public:
  /**
   * @param _candidatePaths Ordered executable paths checked first ("~"
   * expanded).
   * @param _extraPathDirs Directories prepended to the inherited PATH.
   */
  LaunchEnvironment(const vector<string>& _candidatePaths,
                    const vector<string>& _extraPathDirs);

  /**
   * @brief Returns the first existing executable among the candidates, then
   * searches the extended PATH for `binaryName`.
   */
  optional<string> locateExecutable(const string& binaryName) const;

  /** @brief Searches only the extended PATH (or checks a path as given). */
  optional<string> findOnPath(const string& binaryName) const;

  /** @brief Inherited PATH with the extra directories in front. */
  string extendedPath() const;

  /**
   * @brief Copies the current environment and forces the terminal/locale
   * settings the wrapped CLI needs to render consistently.
   */
  map<string, string> buildChildEnvironment() const;

  /**
   * @brief Maps launch options onto the assistant's command line flags.
   */
  static vector<string> buildAssistantArgs(bool bypassPermissions,
                                           const string& resumeToken,
                                           bool continueLast);

  static bool isExecutableFile(const string& path);

 protected:
  vector<string> candidatePaths;
  vector<string> extraPathDirs;
};
}  // namespace pd

#endif  // __PD_LAUNCH_ENVIRONMENT__
