#include "ConsoleViewer.hpp"

#include "EventFormatter.hpp"

namespace pd {
ConsoleViewer::ConsoleViewer(shared_ptr<Console> _console, bool _eventsMode)
    : console(_console), eventsMode(_eventsMode), done(false), exitCode(0) {}

bool ConsoleViewer::onEvent(const StreamEvent& event) {
  try {
    if (eventsMode) {
      console->write(EventFormatter::toSse(event));
    } else {
      switch (event.type()) {
        case EVENT_OUTPUT:
          console->write(event.content());
          break;
        case EVENT_ERROR:
          console->write("\r\n[ptydock] " + event.message() + "\r\n");
          break;
        default:
          break;
      }
    }
  } catch (const std::runtime_error& ex) {
    LOG(ERROR) << "Console write failed: " << ex.what();
    done = true;
    return false;
  }

  switch (event.type()) {
    case EVENT_RESUME_TOKEN_DISCOVERED: {
      lock_guard<mutex> guard(viewerMutex);
      resumeToken = event.resume_token();
      break;
    }
    case EVENT_EXIT:
      exitCode = event.exit_code();
      done = true;
      break;
    case EVENT_COMPLETE:
      done = true;
      break;
    default:
      break;
  }
  return true;
}
}  // namespace pd
