#ifndef __PD_SESSION_ORCHESTRATOR__
#define __PD_SESSION_ORCHESTRATOR__

#include <condition_variable>
#include <future>

#include "Clock.hpp"
#include "Headers.hpp"
#include "LaunchEnvironment.hpp"
#include "MultiplexerBackend.hpp"
#include "OrchestratorConfig.hpp"
#include "ProcessHandle.hpp"
#include "ResumeTokenExtractor.hpp"
#include "SecurityGates.hpp"
#include "SessionLedger.hpp"
#include "SessionRegistry.hpp"

namespace pd {
/**
 * @brief Everything the orchestrator talks to. `multiplexer` may be null,
 * which disables multiplexer mode.
 */
struct OrchestratorCollaborators {
  shared_ptr<SessionRegistry> registry;
  shared_ptr<SessionLedger> ledger;
  shared_ptr<ProcessLauncher> launcher;
  shared_ptr<LaunchEnvironment> launchEnvironment;
  shared_ptr<MultiplexerBackend> multiplexer;
  shared_ptr<PathValidator> pathValidator;
  shared_ptr<InputGate> inputGate;
  shared_ptr<AuditSink> auditSink;
  shared_ptr<ResumeTokenExtractor> resumeTokenExtractor;
  shared_ptr<Clock> clock;

  /** @brief Production implementations configured from `config`. */
  static OrchestratorCollaborators createDefault(
      const OrchestratorConfig& config);
};

/**
 * @brief Starts, supervises, streams and retires assistant sessions.
 *
 * All public operations report failures through the `ErrorInfo` in their
 * response and never throw. Process output arrives on per-process reader
 * threads; a maintenance thread (see `startMaintenance`) sends keepalives,
 * removes exited sessions after a short delay and sweeps abandoned ones.
 */
class SessionOrchestrator {
 public:
  /**
   * @brief Also marks ledger entries that a previous server left in a live
   * status as stopped.
   */
  SessionOrchestrator(const OrchestratorConfig& _config,
                      const OrchestratorCollaborators& _collaborators);
  virtual ~SessionOrchestrator();

  /**
   * @brief Launches (or resumes) a session.
   *
   * An id whose record is still live is returned as is with `resumed` set
   * and nothing is spawned.
   */
  StartResponse start(const StartRequest& request);

  /**
   * @brief Subscribes a viewer. The viewer first receives `connected`, the
   * current `status` and (if any) the buffered output as one replayed
   * chunk, then live events.
   * @return null on failure, with `error` describing it.
   */
  shared_ptr<Subscription> attach(const string& id,
                                  shared_ptr<SessionViewer> viewer,
                                  ErrorInfo* error);
  /** @brief Removes a viewer. Never affects the process. */
  void detach(const string& id, const shared_ptr<Subscription>& subscription);

  /** @brief Writes keystrokes, or applies `resize` when it is set. */
  OperationResponse sendInput(const InputRequest& request);
  OperationResponse resize(const string& id, int cols, int rows);
  OperationResponse stop(const StopRequest& request);
  ListResponse list();

  /** @brief Spawns the maintenance thread. */
  void startMaintenance();
  /**
   * @brief Stops maintenance and tears down every live session. Multiplexer
   * sessions are left running. Idempotent.
   */
  void shutdown();

  /** @brief One maintenance pass: keepalives, delayed removals, sweep. */
  void runMaintenance();
  /** @brief Sends a keepalive to every viewer of every session. */
  void sendKeepalives();
  /** @brief Tears down exited sessions whose removal delay has passed. */
  int processPendingRemovals();
  /** @brief Retires expired sessions. Returns how many were scheduled. */
  int sweep();
  /** @brief Blocks until all queued teardowns have finished. */
  void waitForTeardowns();

  string generateSessionId();
  inline const OrchestratorConfig& getConfig() const { return config; }
  inline shared_ptr<SessionRegistry> getRegistry() {
    return collaborators.registry;
  }

 protected:
  struct PendingRemoval {
    shared_ptr<SessionRecord> record;
    int64_t dueAt;
  };

  void handleData(const weak_ptr<SessionRecord>& weakRecord,
                  const string& chunk);
  void handleExit(const weak_ptr<SessionRecord>& weakRecord, int exitCode,
                  int signal);
  /** @brief Moves a record to `error` after an unrecoverable I/O failure. */
  void markError(const shared_ptr<SessionRecord>& record,
                 const string& message);

  /**
   * @brief Removes a record from the registry, emits `complete`, drops its
   * viewers and buffer and destroys its process. Must not be called from
   * the record's own reader thread.
   */
  void teardown(const shared_ptr<SessionRecord>& record, bool removeFromLedger,
                bool killMultiplexer, const string& reason);
  void scheduleTeardown(const shared_ptr<SessionRecord>& record,
                        const string& reason);
  void scheduleRemoval(const shared_ptr<SessionRecord>& record);
  void cancelRemoval(const shared_ptr<SessionRecord>& record);

  void reconcileLedger();
  /**
   * @brief Writes the record's state unless the registry already holds a
   * newer record with the same id.
   */
  void saveToLedger(const shared_ptr<SessionRecord>& record);
  /** @brief True if no other record is registered under this record's id. */
  bool isCurrent(const shared_ptr<SessionRecord>& record);
  optional<LedgerRecord> readLedger(const string& id);
  void removeFromLedger(const string& id);
  /** @brief Runs a multiplexer command, logging instead of throwing. */
  void releaseMultiplexer(const string& handle, bool kill);

  void audit(const string& type, const string& sessionId,
             const string& ownerId, const string& detail,
             const vector<string>& categories);

  /** @brief Publishes under the record lock so viewers see arrival order. */
  void publishLocked(const shared_ptr<SessionRecord>& record,
                     const StreamEvent& event);
  static StreamEvent makeEvent(StreamEventType type, const string& id);
  static void setError(ErrorInfo* error, ErrorCode code, int httpStatus,
                       const string& message);

  void maintenanceLoop();

  OrchestratorConfig config;
  OrchestratorCollaborators collaborators;

  /** @brief Serializes `start` calls. */
  mutex startMutex;

  /** @brief Makes the registry check and the ledger write in
   * `saveToLedger` atomic. */
  recursive_mutex ledgerMutex;

  /** @brief Guards `pendingRemovals` and `teardownFutures`. */
  recursive_mutex scheduleMutex;
  vector<PendingRemoval> pendingRemovals;
  vector<std::future<void>> teardownFutures;

  mutex maintenanceMutex;
  std::condition_variable maintenanceCv;
  bool halt;
  bool isShutdown;
  int64_t lastKeepaliveAt;
  int64_t lastSweepAt;
  std::thread maintenanceThread;

  /** @brief Declared last so queued teardowns finish before anything else
   * is destroyed. */
  unique_ptr<ThreadPool> teardownPool;
};
}  // namespace pd

#endif  // __PD_SESSION_ORCHESTRATOR__
