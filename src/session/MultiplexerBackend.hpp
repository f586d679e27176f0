#ifndef __PD_MULTIPLEXER_BACKEND__
#define __PD_MULTIPLEXER_BACKEND__

#include "Headers.hpp"
#include "ProcessHandle.hpp"

namespace pd {
/**
 * @brief A terminal multiplexer that keeps programs alive independently of
 * the pty we attach to it, so a session can outlive this server.
 */
class MultiplexerBackend {
 public:
  virtual ~MultiplexerBackend() {}

  virtual bool isAvailable() = 0;
  virtual bool hasSession(const string& name) = 0;
  /**
   * @brief Wraps `inner` so that it runs inside a new multiplexer session
   * called `name` (or attaches if one already exists).
   */
  virtual ProcessLaunchSpec buildCreateSpec(const string& name,
                                            const ProcessLaunchSpec& inner) = 0;
  /** @brief A client process attached to the existing session `name`. */
  virtual ProcessLaunchSpec buildAttachSpec(const string& name,
                                            const ProcessLaunchSpec& base) = 0;
  /** @brief Disconnects all clients and leaves the session running. */
  virtual bool detachClients(const string& name) = 0;
  virtual bool killSession(const string& name) = 0;
  /** @brief Deterministic multiplexer session name for a session id. */
  virtual string sessionNameFor(const string& sessionId) = 0;
};
}  // namespace pd

#endif  // __PD_MULTIPLEXER_BACKEND__
