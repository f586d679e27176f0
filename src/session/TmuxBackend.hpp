#ifndef __PD_TMUX_BACKEND__
#define __PD_TMUX_BACKEND__

#include "Headers.hpp"
#include "MultiplexerBackend.hpp"
#include "SubprocessUtils.hpp"

namespace pd {
/**
 * @brief Multiplexer backend driving the `tmux` command line.
 */
class TmuxBackend : public MultiplexerBackend {
 public:
  /**
   * @param _tmuxPath Absolute path of the tmux binary, or empty if it could
   * not be found (which makes the backend unavailable).
   */
  TmuxBackend(shared_ptr<SubprocessUtils> _subprocess, const string& _tmuxPath);

  virtual bool isAvailable();
  virtual bool hasSession(const string& name);
  virtual ProcessLaunchSpec buildCreateSpec(const string& name,
                                            const ProcessLaunchSpec& inner);
  virtual ProcessLaunchSpec buildAttachSpec(const string& name,
                                            const ProcessLaunchSpec& base);
  virtual bool detachClients(const string& name);
  virtual bool killSession(const string& name);
  virtual string sessionNameFor(const string& sessionId);

  /** @brief Replaces characters tmux does not accept in session names. */
  static string sanitize(const string& s);

 protected:
  shared_ptr<SubprocessUtils> subprocess;
  string tmuxPath;
  /** @brief Result of the first availability check. */
  optional<bool> available;
  mutex checkMutex;
};
}  // namespace pd

#endif  // __PD_TMUX_BACKEND__
