#ifndef __PD_SESSION_RECORD__
#define __PD_SESSION_RECORD__

#include "BroadcastHub.hpp"
#include "Headers.hpp"
#include "OutputRingBuffer.hpp"
#include "ProcessHandle.hpp"

namespace pd {
/**
 * @brief Authoritative in-memory state of one session: its lifecycle
 * status, the process behind it, its replay buffer and its viewers.
 *
 * A record drives at most one process. Once it reaches `stopped` or `error`
 * it is finished; restarting a session creates a new record (possibly with
 * the same id and resume token).
 *
 * Every mutation, ring buffer append and publish happens under
 * `getMutex()`, which is what makes attach (replay + subscribe) atomic with
 * respect to the data path. Process I/O is never performed under it.
 */
class SessionRecord {
 public:
  SessionRecord(const string& _id, const StartRequest& request,
                int64_t _startedAt, size_t bufferCapacity);

  /** @brief True if `to` is reachable from `from` in one step. */
  static bool canTransition(SessionStatus from, SessionStatus to);
  static bool isTerminal(SessionStatus status);

  /**
   * @brief Moves to a new status and bumps the activity time.
   * @return false (and leaves the record untouched) for a refused
   * transition or a no-op.
   */
  bool transitionTo(SessionStatus next, int64_t nowMillis);
  /** @brief Records inbound or outbound traffic. */
  void touch(int64_t nowMillis);

  /**
   * @brief Sets the resume token if none is known yet.
   * @return true only for the first token.
   */
  bool setResumeToken(const string& token);

  /** @brief Binds the process that backs this record. */
  void attachProcess(shared_ptr<ProcessHandle> _process);
  /**
   * @brief Unbinds and returns the process. The caller owns its destruction,
   * which joins the reader thread, so it must happen outside `getMutex()`.
   */
  shared_ptr<ProcessHandle> detachProcess();

  /** @brief Durable projection for the ledger. */
  LedgerRecord toLedgerRecord();

  inline const string& getId() const { return id; }
  inline const string& getWorkingDirectory() const {
    return workingDirectory;
  }
  inline bool getBypassPermissions() const { return bypassPermissions; }
  inline bool getIsBackground() const { return isBackground; }
  inline bool isSandboxed() const { return sandboxed; }
  inline const string& getOwnerId() const { return ownerId; }
  inline const string& getProjectId() const { return projectId; }
  inline int64_t getStartedAt() const { return startedAt; }

  SessionStatus getStatus();
  /** @brief starting, running or background. */
  bool isLive();
  int64_t getLastActivityAt();
  string getResumeToken();
  bool hasResumeToken();
  pid_t getPid();
  shared_ptr<ProcessHandle> getProcess();
  string getMultiplexerHandle();
  void setMultiplexerHandle(const string& handle);

  inline recursive_mutex& getMutex() { return recordMutex; }
  /** @brief Only touch while holding `getMutex()`. */
  inline OutputRingBuffer& getBuffer() { return buffer; }
  inline BroadcastHub& getHub() { return hub; }

 protected:
  recursive_mutex recordMutex;
  const string id;
  const string workingDirectory;
  const bool bypassPermissions;
  const bool isBackground;
  const bool sandboxed;
  const string ownerId;
  const string projectId;
  const int64_t startedAt;

  SessionStatus status;
  int64_t lastActivityAt;
  string resumeToken;
  string multiplexerHandle;
  pid_t pid;
  shared_ptr<ProcessHandle> process;
  OutputRingBuffer buffer;
  BroadcastHub hub;
};
}  // namespace pd

#endif  // __PD_SESSION_RECORD__
