#ifndef __PD_CONSOLE_VIEWER__
#define __PD_CONSOLE_VIEWER__

#include "BroadcastHub.hpp"
#include "Console.hpp"
#include "Headers.hpp"

namespace pd {
/**
 * @brief Session viewer that renders a stream onto a console, either as raw
 * terminal output or (in events mode) as server-sent-event frames.
 */
class ConsoleViewer : public SessionViewer {
 public:
  ConsoleViewer(shared_ptr<Console> _console, bool _eventsMode);

  virtual bool onEvent(const StreamEvent& event);

  /** @brief True once the session exited or was torn down. */
  inline bool isDone() { return done; }
  inline int getExitCode() { return exitCode; }
  inline string getResumeToken() {
    lock_guard<mutex> guard(viewerMutex);
    return resumeToken;
  }

 protected:
  shared_ptr<Console> console;
  bool eventsMode;
  std::atomic<bool> done;
  std::atomic<int> exitCode;
  mutex viewerMutex;
  string resumeToken;
};
}  // namespace pd

#endif  // __PD_CONSOLE_VIEWER__
