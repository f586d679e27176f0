#ifndef __PD_FAKE_COLLABORATORS__
#define __PD_FAKE_COLLABORATORS__

#include "BroadcastHub.hpp"
#include "Clock.hpp"
#include "Headers.hpp"
#include "MultiplexerBackend.hpp"
#include "SecurityGates.hpp"
#include "SubprocessUtils.hpp"

namespace pd {
class FakeClock : public Clock {
 public:
  explicit FakeClock(int64_t start = 1700000000000LL) : now(start) {}
  virtual int64_t nowMillis() { return now; }
  void advance(int64_t millis) { now += millis; }

  std::atomic<int64_t> now;
};

/**
 * @brief Viewer that keeps every event it receives.
 */
class RecordingViewer : public SessionViewer {
 public:
  RecordingViewer() : failing(false) {}

  virtual bool onEvent(const StreamEvent& event) {
    lock_guard<mutex> guard(viewerMutex);
    if (failing) {
      return false;
    }
    events.push_back(event);
    return true;
  }

  vector<StreamEvent> getEvents() {
    lock_guard<mutex> guard(viewerMutex);
    return events;
  }

  vector<StreamEventType> types() {
    lock_guard<mutex> guard(viewerMutex);
    vector<StreamEventType> t;
    for (const auto& it : events) {
      t.push_back(it.type());
    }
    return t;
  }

  int count(StreamEventType type) {
    lock_guard<mutex> guard(viewerMutex);
    return int(std::count_if(
        events.begin(), events.end(),
        [type](const StreamEvent& e) { return e.type() == type; }));
  }

  /** @brief Concatenated content of every output event. */
  string output() {
    lock_guard<mutex> guard(viewerMutex);
    string s;
    for (const auto& it : events) {
      if (it.type() == EVENT_OUTPUT) {
        s += it.content();
      }
    }
    return s;
  }

  std::atomic<bool> failing;

 protected:
  mutex viewerMutex;
  vector<StreamEvent> events;
};

class RecordingAuditSink : public AuditSink {
 public:
  virtual void record(const AuditEvent& event) {
    lock_guard<mutex> guard(sinkMutex);
    events.push_back(event);
  }

  vector<AuditEvent> getEvents() {
    lock_guard<mutex> guard(sinkMutex);
    return events;
  }

 protected:
  mutex sinkMutex;
  vector<AuditEvent> events;
};

/**
 * @brief In-memory multiplexer: sessions exist once a create spec was built
 * for them (or a test adds them).
 */
class FakeMultiplexer : public MultiplexerBackend {
 public:
  FakeMultiplexer() : available(true) {}

  virtual bool isAvailable() { return available; }

  virtual bool hasSession(const string& name) {
    lock_guard<mutex> guard(muxMutex);
    return sessions.count(name) > 0;
  }

  virtual ProcessLaunchSpec buildCreateSpec(const string& name,
                                            const ProcessLaunchSpec& inner) {
    lock_guard<mutex> guard(muxMutex);
    sessions.insert(name);
    ProcessLaunchSpec spec = inner;
    spec.executable = "/usr/bin/tmux";
    spec.args = {"new-session", "-A", "-s", name, inner.executable};
    spec.args.insert(spec.args.end(), inner.args.begin(), inner.args.end());
    return spec;
  }

  virtual ProcessLaunchSpec buildAttachSpec(const string& name,
                                            const ProcessLaunchSpec& base) {
    ProcessLaunchSpec spec = base;
    spec.executable = "/usr/bin/tmux";
    spec.args = {"attach-session", "-t", name};
    return spec;
  }

  virtual bool detachClients(const string& name) {
    lock_guard<mutex> guard(muxMutex);
    detached.push_back(name);
    return sessions.count(name) > 0;
  }

  virtual bool killSession(const string& name) {
    lock_guard<mutex> guard(muxMutex);
    killed.push_back(name);
    return sessions.erase(name) > 0;
  }

  virtual string sessionNameFor(const string& sessionId) {
    return "ptydock-" + sessionId;
  }

  void addSession(const string& name) {
    lock_guard<mutex> guard(muxMutex);
    sessions.insert(name);
  }

  vector<string> getDetached() {
    lock_guard<mutex> guard(muxMutex);
    return detached;
  }

  vector<string> getKilled() {
    lock_guard<mutex> guard(muxMutex);
    return killed;
  }

  bool available;

 protected:
  mutex muxMutex;
  set<string> sessions;
  vector<string> detached;
  vector<string> killed;
};

/**
 * @brief Returns canned results and records every invocation.
 */
class FakeSubprocessUtils : public SubprocessUtils {
 public:
  virtual SubprocessResult run(const string& command,
                               const vector<string>& args) {
    lock_guard<mutex> guard(fakeMutex);
    calls.push_back({command, args});
    string key = args.empty() ? string() : args[0];
    auto it = results.find(key);
    if (it == results.end()) {
      return {0, ""};
    }
    return it->second;
  }

  /** @brief Result for invocations whose first argument is `subcommand`. */
  void setResult(const string& subcommand, const SubprocessResult& result) {
    lock_guard<mutex> guard(fakeMutex);
    results[subcommand] = result;
  }

  vector<pair<string, vector<string>>> getCalls() {
    lock_guard<mutex> guard(fakeMutex);
    return calls;
  }

 protected:
  mutex fakeMutex;
  map<string, SubprocessResult> results;
  vector<pair<string, vector<string>>> calls;
};
}  // namespace pd

#endif  // __PD_FAKE_COLLABORATORS__
