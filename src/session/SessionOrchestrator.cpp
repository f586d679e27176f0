#include "SessionOrchestrator.hpp"

#include "EnumNames.hpp"
#include "JsonFileLedger.hpp"
#include "LogAuditSink.hpp"
#include "PatternInputGate.hpp"
#include "PseudoTerminalProcess.hpp"
#include "SandboxPathValidator.hpp"
#include "SessionSweeper.hpp"
#include "TmuxBackend.hpp"

namespace pd {
OrchestratorCollaborators OrchestratorCollaborators::createDefault(
    const OrchestratorConfig& config) {
  OrchestratorCollaborators c;
  c.registry.reset(new SessionRegistry());
  c.ledger.reset(new JsonFileLedger(config.ledgerPath.empty()
                                        ? JsonFileLedger::defaultPath()
                                        : config.ledgerPath));
  c.launcher.reset(new PseudoTerminalLauncher());
  c.launchEnvironment.reset(
      new LaunchEnvironment(config.candidatePaths, config.extraPathDirs));
  auto tmuxPath = c.launchEnvironment->findOnPath(config.tmuxBinary);
  c.multiplexer.reset(new TmuxBackend(shared_ptr<SubprocessUtils>(
                                          new SubprocessUtils()),
                                      tmuxPath ? *tmuxPath : string()));
  c.pathValidator.reset(
      new SandboxPathValidator(config.protectedPaths, config.sandboxRoot));
  c.inputGate.reset(new PatternInputGate(config.strictInputFilter));
  c.auditSink.reset(new LogAuditSink());
  c.resumeTokenExtractor.reset(new ResumeTokenExtractor());
  c.clock.reset(new SystemClock());
  return c;
}

SessionOrchestrator::SessionOrchestrator(
    const OrchestratorConfig& _config,
    const OrchestratorCollaborators& _collaborators)
    : config(_config),
      collaborators(_collaborators),
      halt(false),
      isShutdown(false) {
  if (!collaborators.registry || !collaborators.ledger ||
      !collaborators.launcher || !collaborators.launchEnvironment ||
      !collaborators.pathValidator || !collaborators.inputGate ||
      !collaborators.auditSink || !collaborators.resumeTokenExtractor ||
      !collaborators.clock) {
    STFATAL << "SessionOrchestrator is missing a collaborator";
  }
  lastKeepaliveAt = lastSweepAt = collaborators.clock->nowMillis();
  teardownPool.reset(new ThreadPool(max(1, config.teardownThreads)));
  reconcileLedger();
}

SessionOrchestrator::~SessionOrchestrator() { shutdown(); }

string SessionOrchestrator::generateSessionId() {
  return string("session-") + to_string(collaborators.clock->nowMillis()) +
         "-" + genRandomAlphaNum(10);
}

StreamEvent SessionOrchestrator::makeEvent(StreamEventType type,
                                           const string& id) {
  StreamEvent event;
  event.set_type(type);
  event.set_session_id(id);
  return event;
}

void SessionOrchestrator::setError(ErrorInfo* error, ErrorCode code,
                                   int httpStatus, const string& message) {
  error->set_code(code);
  error->set_http_status(httpStatus);
  error->set_message(message);
}

void SessionOrchestrator::publishLocked(
    const shared_ptr<SessionRecord>& record, const StreamEvent& event) {
  lock_guard<recursive_mutex> guard(record->getMutex());
  record->getHub().publish(event);
}

void SessionOrchestrator::audit(const string& type, const string& sessionId,
                                const string& ownerId, const string& detail,
                                const vector<string>& categories) {
  AuditEvent event;
  event.type = type;
  event.sessionId = sessionId;
  event.ownerId = ownerId;
  event.detail = detail;
  event.categories = categories;
  event.timestamp = collaborators.clock->nowMillis();
  try {
    collaborators.auditSink->record(event);
  } catch (const std::exception& ex) {
    STERROR << "Audit sink failed: " << ex.what();
  }
}

bool SessionOrchestrator::isCurrent(const shared_ptr<SessionRecord>& record) {
  auto stored = collaborators.registry->get(record->getId());
  return !stored || stored == record;
}

// Ledger failures are logged and otherwise ignored: the live session is
// authoritative and the next state change rewrites the entry.
void SessionOrchestrator::saveToLedger(
    const shared_ptr<SessionRecord>& record) {
  lock_guard<recursive_mutex> guard(ledgerMutex);
  // start() registers a replacement before saving it, so a stale record
  // that loses this check can never overwrite the newer entry.
  if (!isCurrent(record)) {
    VLOG(1) << "Not saving replaced record of session " << record->getId();
    return;
  }
  try {
    collaborators.ledger->upsert(record->toLedgerRecord());
  } catch (const std::exception& ex) {
    LOG(ERROR) << "Could not save session " << record->getId()
               << " to the ledger: " << ex.what();
  }
}

optional<LedgerRecord> SessionOrchestrator::readLedger(const string& id) {
  try {
    return collaborators.ledger->get(id);
  } catch (const std::exception& ex) {
    LOG(ERROR) << "Could not read session " << id
               << " from the ledger: " << ex.what();
    return nullopt;
  }
}

void SessionOrchestrator::removeFromLedger(const string& id) {
  try {
    collaborators.ledger->remove(id);
  } catch (const std::exception& ex) {
    LOG(ERROR) << "Could not remove session " << id
               << " from the ledger: " << ex.what();
  }
}

void SessionOrchestrator::reconcileLedger() {
  vector<LedgerRecord> entries;
  try {
    entries = collaborators.ledger->list();
  } catch (const std::exception& ex) {
    LOG(ERROR) << "Could not read the ledger: " << ex.what();
    return;
  }
  int reconciled = 0;
  for (auto& entry : entries) {
    if (SessionRecord::isTerminal(entry.status())) {
      continue;
    }
    if (collaborators.registry->get(entry.id())) {
      continue;
    }
    entry.set_status(SESSION_STOPPED);
    try {
      collaborators.ledger->upsert(entry);
      reconciled++;
    } catch (const std::exception& ex) {
      LOG(ERROR) << "Could not reconcile session " << entry.id() << ": "
                 << ex.what();
    }
  }
  if (reconciled) {
    LOG(INFO) << "Marked " << reconciled
              << " sessions from a previous run as stopped";
  }
}

void SessionOrchestrator::releaseMultiplexer(const string& handle,
                                             bool kill) {
  if (handle.empty() || !collaborators.multiplexer) {
    return;
  }
  try {
    if (kill) {
      collaborators.multiplexer->killSession(handle);
    } else {
      collaborators.multiplexer->detachClients(handle);
    }
  } catch (const std::exception& ex) {
    LOG(WARNING) << "Could not " << (kill ? "kill" : "detach")
                 << " multiplexer session " << handle << ": " << ex.what();
  }
}

StartResponse SessionOrchestrator::start(const StartRequest& request) {
  lock_guard<mutex> startGuard(startMutex);
  StartResponse response;
  string id = request.id().empty() ? generateSessionId() : request.id();
  response.set_id(id);

  auto existing = collaborators.registry->get(id);
  if (existing && existing->isLive()) {
    LOG(INFO) << "Session " << id << " is already live, reattaching";
    response.set_resumed(true);
    response.set_pid(existing->getPid());
    response.set_is_background(existing->getIsBackground());
    return response;
  }

  const string& cwd = request.working_directory();
  if (cwd.empty()) {
    setError(response.mutable_error(), ERR_VALIDATION, 400,
             "workingDirectory is required");
    return response;
  }
  std::error_code ec;
  if (!fs::exists(cwd, ec)) {
    setError(response.mutable_error(), ERR_VALIDATION, 400,
             "Working directory does not exist: " + cwd);
    return response;
  }
  if (!fs::is_directory(cwd, ec)) {
    setError(response.mutable_error(), ERR_VALIDATION, 400,
             "Working directory is not a directory: " + cwd);
    return response;
  }
  PathDecision pathDecision =
      collaborators.pathValidator->validate(cwd, request.owner_id());
  if (!pathDecision.allowed) {
    LOG(WARNING) << "Refusing to start " << id << " in " << cwd << ": "
                 << pathDecision.reason;
    audit("path_denied", id, request.owner_id(),
          cwd + ": " + pathDecision.reason, {});
    setError(response.mutable_error(), ERR_PATH_DENIED, 403,
             pathDecision.reason);
    return response;
  }

  auto prior = readLedger(id);
  string resumeToken = request.resume_token();
  if (resumeToken.empty() && prior && prior->has_resume_token()) {
    resumeToken = prior->resume_token();
    VLOG(1) << "Reusing ledger resume token for " << id
            << (request.resume() ? " (resume requested)" : "");
  }

  ProcessLaunchSpec base;
  base.workingDirectory = cwd;
  base.environment = collaborators.launchEnvironment->buildChildEnvironment();
  base.cols = config.defaultCols;
  base.rows = config.defaultRows;
  if (request.has_size() && request.size().cols() > 0 &&
      request.size().rows() > 0) {
    base.cols = request.size().cols();
    base.rows = request.size().rows();
  }

  bool resumed = !resumeToken.empty();
  bool reattachMultiplexer = false;
  string multiplexerHandle;
  if (request.use_multiplexer()) {
    bool available = false;
    try {
      available = collaborators.multiplexer &&
                  collaborators.multiplexer->isAvailable();
    } catch (const std::exception& ex) {
      LOG(WARNING) << "Multiplexer availability check failed: " << ex.what();
    }
    if (available) {
      if (!request.reconnect_target().empty()) {
        multiplexerHandle = request.reconnect_target();
      } else if (prior && !prior->multiplexer_handle().empty()) {
        multiplexerHandle = prior->multiplexer_handle();
      } else {
        multiplexerHandle = collaborators.multiplexer->sessionNameFor(id);
      }
      try {
        reattachMultiplexer =
            collaborators.multiplexer->hasSession(multiplexerHandle);
      } catch (const std::exception& ex) {
        LOG(WARNING) << "Could not list multiplexer sessions: " << ex.what();
      }
    } else {
      LOG(WARNING) << "Multiplexer requested for " << id
                   << " but it is unavailable, spawning directly";
    }
  }

  ProcessLaunchSpec spec;
  if (reattachMultiplexer) {
    LOG(INFO) << "Reattaching " << id << " to multiplexer session "
              << multiplexerHandle;
    spec = collaborators.multiplexer->buildAttachSpec(multiplexerHandle, base);
    resumed = true;
  } else {
    auto binary = collaborators.launchEnvironment->locateExecutable(
        config.assistantBinary);
    if (!binary) {
      setError(response.mutable_error(), ERR_BINARY_NOT_FOUND, 500,
               "Could not find the " + config.assistantBinary + " binary");
      return response;
    }
    spec = base;
    spec.executable = *binary;
    spec.args = LaunchEnvironment::buildAssistantArgs(
        request.bypass_permissions(), resumeToken, request.continue_last());
    if (!multiplexerHandle.empty()) {
      spec = collaborators.multiplexer->buildCreateSpec(multiplexerHandle,
                                                        spec);
    }
  }

  int64_t now = collaborators.clock->nowMillis();
  auto record = make_shared<SessionRecord>(id, request, now,
                                           config.bufferCapacity);
  if (!resumeToken.empty()) {
    record->setResumeToken(resumeToken);
  }
  record->setMultiplexerHandle(multiplexerHandle);

  weak_ptr<SessionRecord> weakRecord(record);
  ProcessCallbacks callbacks;
  callbacks.onData = [this, weakRecord](const string& chunk) {
    handleData(weakRecord, chunk);
  };
  callbacks.onExit = [this, weakRecord](int exitCode, int signal) {
    handleExit(weakRecord, exitCode, signal);
  };

  shared_ptr<ProcessHandle> process;
  try {
    process = collaborators.launcher->launch(spec, callbacks);
  } catch (const std::runtime_error& ex) {
    LOG(ERROR) << "Could not spawn session " << id << ": " << ex.what();
    setError(response.mutable_error(), ERR_SPAWN_FAILED, 500, ex.what());
    return response;
  }
  record->attachProcess(process);
  collaborators.registry->insert(record);
  if (existing) {
    // The finished record under this id is no longer reachable; release its
    // viewers and process now.
    cancelRemoval(existing);
    scheduleTeardown(existing, "replaced");
  }
  saveToLedger(record);

  LOG(INFO) << "Started session " << id << " (pid " << record->getPid()
            << ", " << (request.is_background() ? "background" : "foreground")
            << (resumed ? ", resumed" : "") << ") in " << cwd;
  response.set_resumed(resumed);
  response.set_pid(record->getPid());
  response.set_is_background(request.is_background());
  return response;
}

void SessionOrchestrator::handleData(const weak_ptr<SessionRecord>& weakRecord,
                                     const string& chunk) {
  auto record = weakRecord.lock();
  if (!record) {
    return;
  }
  bool persist = false;
  {
    lock_guard<recursive_mutex> guard(record->getMutex());
    if (!record->isLive()) {
      return;
    }
    int64_t now = collaborators.clock->nowMillis();
    record->getBuffer().push(chunk);
    record->touch(now);
    if (record->getStatus() == SESSION_STARTING) {
      SessionStatus next =
          record->getIsBackground() ? SESSION_BACKGROUND : SESSION_RUNNING;
      if (record->transitionTo(next, now)) {
        StreamEvent status = makeEvent(EVENT_STATUS, record->getId());
        status.set_status(next);
        record->getHub().publish(status);
        persist = true;
      }
    }
    StreamEvent output = makeEvent(EVENT_OUTPUT, record->getId());
    output.set_content(chunk);
    record->getHub().publish(output);

    if (!record->hasResumeToken()) {
      auto token = collaborators.resumeTokenExtractor->extract(chunk);
      if (token && record->setResumeToken(*token)) {
        LOG(INFO) << "Discovered resume token for " << record->getId();
        StreamEvent discovered =
            makeEvent(EVENT_RESUME_TOKEN_DISCOVERED, record->getId());
        discovered.set_resume_token(*token);
        record->getHub().publish(discovered);
        persist = true;
      }
    }
  }
  if (persist) {
    saveToLedger(record);
  }
}

void SessionOrchestrator::handleExit(const weak_ptr<SessionRecord>& weakRecord,
                                     int exitCode, int signal) {
  auto record = weakRecord.lock();
  if (!record) {
    return;
  }
  {
    lock_guard<recursive_mutex> guard(record->getMutex());
    if (record->getHub().isClosed()) {
      // Already torn down; the ledger entry may belong to a newer record.
      return;
    }
    StreamEvent exitEvent = makeEvent(EVENT_EXIT, record->getId());
    exitEvent.set_exit_code(exitCode);
    if (signal) {
      exitEvent.set_signal(signal);
    }
    record->getHub().publish(exitEvent);
    if (record->transitionTo(SESSION_STOPPED,
                             collaborators.clock->nowMillis())) {
      StreamEvent status = makeEvent(EVENT_STATUS, record->getId());
      status.set_status(SESSION_STOPPED);
      record->getHub().publish(status);
    }
  }
  if (!isCurrent(record)) {
    // Replaced by a newer start; its teardown is already queued.
    return;
  }
  saveToLedger(record);
  scheduleRemoval(record);
}

void SessionOrchestrator::markError(const shared_ptr<SessionRecord>& record,
                                    const string& message) {
  {
    lock_guard<recursive_mutex> guard(record->getMutex());
    if (!record->transitionTo(SESSION_ERROR,
                              collaborators.clock->nowMillis())) {
      return;
    }
    StreamEvent error = makeEvent(EVENT_ERROR, record->getId());
    error.set_message(message);
    record->getHub().publish(error);
    StreamEvent status = makeEvent(EVENT_STATUS, record->getId());
    status.set_status(SESSION_ERROR);
    record->getHub().publish(status);
  }
  saveToLedger(record);
}

shared_ptr<Subscription> SessionOrchestrator::attach(
    const string& id, shared_ptr<SessionViewer> viewer, ErrorInfo* error) {
  auto record = collaborators.registry->get(id);
  if (!record) {
    auto prior = readLedger(id);
    if (prior) {
      setError(error, ERR_GONE, 410,
               "Session " + id + " has no running process");
      if (prior->has_resume_token()) {
        error->set_resume_token(prior->resume_token());
      }
    } else {
      setError(error, ERR_NOT_FOUND, 404, "Unknown session " + id);
    }
    return shared_ptr<Subscription>();
  }

  lock_guard<recursive_mutex> guard(record->getMutex());
  BroadcastHub& hub = record->getHub();
  if (hub.isClosed()) {
    setError(error, ERR_GONE, 410, "Session " + id + " is shutting down");
    if (record->hasResumeToken()) {
      error->set_resume_token(record->getResumeToken());
    }
    return shared_ptr<Subscription>();
  }
  // Publishing requires the record lock, so nothing can reach this viewer
  // between the replay and the live stream.
  auto subscription = hub.subscribe(viewer);
  hub.deliver(subscription, makeEvent(EVENT_CONNECTED, id));
  StreamEvent status = makeEvent(EVENT_STATUS, id);
  status.set_status(record->getStatus());
  hub.deliver(subscription, status);
  if (!record->getBuffer().empty()) {
    StreamEvent replay = makeEvent(EVENT_OUTPUT, id);
    replay.set_content(record->getBuffer().joined());
    replay.set_replayed(true);
    hub.deliver(subscription, replay);
  }
  LOG(INFO) << "Viewer attached to " << id << " ("
            << hub.subscriberCount() << " viewers)";
  return subscription;
}

void SessionOrchestrator::detach(const string& id,
                                 const shared_ptr<Subscription>& subscription) {
  auto record = collaborators.registry->get(id);
  if (!record) {
    return;
  }
  if (record->getHub().unsubscribe(subscription)) {
    LOG(INFO) << "Viewer detached from " << id;
  }
}

OperationResponse SessionOrchestrator::sendInput(const InputRequest& request) {
  if (request.has_resize()) {
    return resize(request.id(), request.resize().cols(),
                  request.resize().rows());
  }
  OperationResponse response;
  auto record = collaborators.registry->get(request.id());
  if (!record) {
    setError(response.mutable_error(), ERR_NOT_FOUND, 404,
             "Unknown session " + request.id());
    return response;
  }
  if (!record->isLive()) {
    setError(response.mutable_error(), ERR_NOT_RUNNING, 409,
             "Session " + request.id() + " is " +
                 statusName(record->getStatus()));
    return response;
  }
  if (record->isSandboxed()) {
    InputDecision decision =
        collaborators.inputGate->evaluate(request.data());
    if (!decision.allowed) {
      LOG(WARNING) << "Rejected input for sandboxed session " << request.id();
      audit("input_rejected", request.id(), record->getOwnerId(),
            request.data().substr(0, 500), decision.categories);
      setError(response.mutable_error(), ERR_REJECTED, 403,
               "Input rejected by the injection filter");
      for (const auto& category : decision.categories) {
        response.mutable_error()->add_pattern_categories(category);
      }
      return response;
    }
  }
  auto process = record->getProcess();
  if (!process) {
    setError(response.mutable_error(), ERR_NOT_RUNNING, 409,
             "Session " + request.id() + " has no process");
    return response;
  }
  try {
    process->write(request.data());
  } catch (const std::runtime_error& ex) {
    LOG(ERROR) << "Write to session " << request.id()
               << " failed: " << ex.what();
    markError(record, string("Write failed: ") + ex.what());
    setError(response.mutable_error(), ERR_RUNTIME, 500, ex.what());
    return response;
  }
  record->touch(collaborators.clock->nowMillis());
  return response;
}

OperationResponse SessionOrchestrator::resize(const string& id, int cols,
                                              int rows) {
  OperationResponse response;
  if (cols <= 0 || rows <= 0) {
    setError(response.mutable_error(), ERR_VALIDATION, 400,
             "cols and rows must be positive");
    return response;
  }
  auto record = collaborators.registry->get(id);
  if (!record) {
    setError(response.mutable_error(), ERR_NOT_FOUND, 404,
             "Unknown session " + id);
    return response;
  }
  auto process = record->getProcess();
  if (!record->isLive() || !process) {
    setError(response.mutable_error(), ERR_NOT_RUNNING, 409,
             "Session " + id + " is " + statusName(record->getStatus()));
    return response;
  }
  try {
    process->resize(cols, rows);
  } catch (const std::runtime_error& ex) {
    LOG(ERROR) << "Resize of session " << id << " failed: " << ex.what();
    if (!process->isRunning()) {
      markError(record, string("Resize failed: ") + ex.what());
    }
    setError(response.mutable_error(), ERR_RUNTIME, 500, ex.what());
    return response;
  }
  VLOG(1) << "Resized " << id << " to " << cols << "x" << rows;
  return response;
}

OperationResponse SessionOrchestrator::stop(const StopRequest& request) {
  OperationResponse response;
  const string& id = request.id();
  bool removeEntry = request.remove_from_ledger();
  bool killMultiplexer =
      request.kill_multiplexer() || removeEntry ||
      config.multiplexerStopPolicy == MultiplexerStopPolicy::KILL;

  auto record = collaborators.registry->get(id);
  if (!record) {
    auto prior = readLedger(id);
    if (!prior) {
      setError(response.mutable_error(), ERR_NOT_FOUND, 404,
               "Unknown session " + id);
      return response;
    }
    // No process here, but a tmux session from an earlier run may survive.
    releaseMultiplexer(prior->multiplexer_handle(), killMultiplexer);
    if (removeEntry) {
      removeFromLedger(id);
      LOG(INFO) << "Removed finished session " << id << " from the ledger";
    } else if (!SessionRecord::isTerminal(prior->status())) {
      prior->set_status(SESSION_STOPPED);
      lock_guard<recursive_mutex> guard(ledgerMutex);
      try {
        // A concurrent start owns the entry now
        if (!collaborators.registry->get(id)) {
          collaborators.ledger->upsert(*prior);
        }
      } catch (const std::exception& ex) {
        LOG(ERROR) << "Could not save session " << id
                   << " to the ledger: " << ex.what();
      }
    }
    LOG(INFO) << "Stopped session " << id << " known only to the ledger";
    return response;
  }

  if (removeEntry) {
    cancelRemoval(record);
    teardown(record, true, killMultiplexer, "removed");
    return response;
  }

  {
    lock_guard<recursive_mutex> guard(record->getMutex());
    if (record->transitionTo(SESSION_STOPPED,
                             collaborators.clock->nowMillis())) {
      StreamEvent status = makeEvent(EVENT_STATUS, id);
      status.set_status(SESSION_STOPPED);
      record->getHub().publish(status);
    }
  }
  auto process = record->getProcess();
  if (process) {
    process->kill();
  }
  releaseMultiplexer(record->getMultiplexerHandle(), killMultiplexer);
  saveToLedger(record);
  scheduleRemoval(record);
  LOG(INFO) << "Stopped session " << id;
  return response;
}

ListResponse SessionOrchestrator::list() {
  ListResponse response;
  vector<LedgerRecord> entries;
  try {
    entries = collaborators.ledger->list();
  } catch (const std::exception& ex) {
    LOG(ERROR) << "Could not read the ledger: " << ex.what();
  }
  set<string> seen;
  vector<SessionSummary> summaries;
  auto summarize = [](const shared_ptr<SessionRecord>& record,
                      const LedgerRecord& stored) {
    SessionSummary summary;
    if (record) {
      *summary.mutable_record() = record->toLedgerRecord();
      summary.set_is_active(record->isLive());
      summary.set_live_status(record->getStatus());
      summary.set_has_viewers(record->getHub().subscriberCount() > 0);
    } else {
      *summary.mutable_record() = stored;
    }
    return summary;
  };
  for (const auto& entry : entries) {
    seen.insert(entry.id());
    summaries.push_back(
        summarize(collaborators.registry->get(entry.id()), entry));
  }
  for (const auto& record : collaborators.registry->snapshot()) {
    if (seen.count(record->getId())) {
      continue;
    }
    summaries.push_back(summarize(record, LedgerRecord()));
  }
  std::stable_sort(summaries.begin(), summaries.end(),
                   [](const SessionSummary& a, const SessionSummary& b) {
                     return a.record().last_activity_at() >
                            b.record().last_activity_at();
                   });
  for (auto& it : summaries) {
    *response.add_sessions() = it;
  }
  return response;
}

void SessionOrchestrator::teardown(const shared_ptr<SessionRecord>& record,
                                   bool removeEntry, bool killMultiplexer,
                                   const string& reason) {
  const string id = record->getId();
  bool current = collaborators.registry->removeIfSame(id, record);
  shared_ptr<ProcessHandle> process;
  string multiplexerHandle;
  {
    lock_guard<recursive_mutex> guard(record->getMutex());
    int64_t now = collaborators.clock->nowMillis();
    if (record->transitionTo(SESSION_STOPPED, now)) {
      StreamEvent status = makeEvent(EVENT_STATUS, id);
      status.set_status(SESSION_STOPPED);
      record->getHub().publish(status);
    }
    StreamEvent complete = makeEvent(EVENT_COMPLETE, id);
    complete.set_message(reason);
    record->getHub().closeAll(complete);
    record->getBuffer().clear();
    process = record->detachProcess();
    multiplexerHandle = record->getMultiplexerHandle();
  }

  if (process) {
    process->kill();
    // Joins the reader thread
    process.reset();
  }
  if (killMultiplexer) {
    releaseMultiplexer(multiplexerHandle, true);
  }
  if (removeEntry) {
    removeFromLedger(id);
  } else if (current) {
    saveToLedger(record);
  }
  LOG(INFO) << "Tore down session " << id << " (" << reason << ")";
}

void SessionOrchestrator::scheduleTeardown(
    const shared_ptr<SessionRecord>& record, const string& reason) {
  lock_guard<recursive_mutex> guard(scheduleMutex);
  teardownFutures.erase(
      std::remove_if(teardownFutures.begin(), teardownFutures.end(),
                     [](const std::future<void>& f) {
                       return f.wait_for(std::chrono::seconds(0)) ==
                              std::future_status::ready;
                     }),
      teardownFutures.end());
  teardownFutures.push_back(teardownPool->enqueue([this, record, reason]() {
    try {
      teardown(record, false, false, reason);
    } catch (const std::exception& ex) {
      STERROR << "Teardown of " << record->getId() << " failed: " << ex.what();
    }
  }));
}

void SessionOrchestrator::scheduleRemoval(
    const shared_ptr<SessionRecord>& record) {
  lock_guard<recursive_mutex> guard(scheduleMutex);
  for (const auto& it : pendingRemovals) {
    if (it.record == record) {
      return;
    }
  }
  pendingRemovals.push_back(
      {record,
       collaborators.clock->nowMillis() + config.exitRemovalDelayMillis});
}

void SessionOrchestrator::cancelRemoval(
    const shared_ptr<SessionRecord>& record) {
  lock_guard<recursive_mutex> guard(scheduleMutex);
  pendingRemovals.erase(
      std::remove_if(pendingRemovals.begin(), pendingRemovals.end(),
                     [&record](const PendingRemoval& p) {
                       return p.record == record;
                     }),
      pendingRemovals.end());
}

int SessionOrchestrator::processPendingRemovals() {
  int64_t now = collaborators.clock->nowMillis();
  vector<shared_ptr<SessionRecord>> due;
  {
    lock_guard<recursive_mutex> guard(scheduleMutex);
    auto it = pendingRemovals.begin();
    while (it != pendingRemovals.end()) {
      if (it->dueAt <= now) {
        due.push_back(it->record);
        it = pendingRemovals.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (const auto& record : due) {
    scheduleTeardown(record, "exited");
  }
  return int(due.size());
}

void SessionOrchestrator::sendKeepalives() {
  for (const auto& record : collaborators.registry->snapshot()) {
    publishLocked(record, makeEvent(EVENT_KEEPALIVE, record->getId()));
  }
}

int SessionOrchestrator::sweep() {
  auto expired = SessionSweeper::collectExpired(
      collaborators.registry->snapshot(), collaborators.clock->nowMillis(),
      config.sweepPolicy);
  for (const auto& it : expired) {
    LOG(INFO) << "Retiring session " << it.id << " (" << it.reason << ")";
    cancelRemoval(it.record);
    scheduleTeardown(it.record, it.reason);
  }
  return int(expired.size());
}

void SessionOrchestrator::waitForTeardowns() {
  vector<std::future<void>> futures;
  {
    lock_guard<recursive_mutex> guard(scheduleMutex);
    futures.swap(teardownFutures);
  }
  for (auto& it : futures) {
    it.wait();
  }
}

void SessionOrchestrator::runMaintenance() {
  int64_t now = collaborators.clock->nowMillis();
  if (now - lastKeepaliveAt >= config.keepaliveIntervalMillis) {
    lastKeepaliveAt = now;
    sendKeepalives();
  }
  processPendingRemovals();
  if (now - lastSweepAt >= config.sweepIntervalMillis) {
    lastSweepAt = now;
    int retired = sweep();
    VLOG(1) << "Sweep retired " << retired << " sessions";
  }
}

void SessionOrchestrator::maintenanceLoop() {
  el::Helpers::setThreadName("pd-maintenance");
  unique_lock<mutex> lock(maintenanceMutex);
  while (!halt) {
    maintenanceCv.wait_for(lock, std::chrono::milliseconds(250));
    if (halt) {
      break;
    }
    lock.unlock();
    try {
      runMaintenance();
    } catch (const std::exception& ex) {
      STERROR << "Maintenance pass failed: " << ex.what();
    }
    lock.lock();
  }
}

void SessionOrchestrator::startMaintenance() {
  lock_guard<mutex> guard(maintenanceMutex);
  if (maintenanceThread.joinable() || isShutdown) {
    return;
  }
  maintenanceThread = std::thread(&SessionOrchestrator::maintenanceLoop, this);
}

void SessionOrchestrator::shutdown() {
  {
    lock_guard<mutex> guard(maintenanceMutex);
    if (isShutdown) {
      return;
    }
    isShutdown = true;
    halt = true;
  }
  maintenanceCv.notify_all();
  if (maintenanceThread.joinable()) {
    maintenanceThread.join();
  }
  waitForTeardowns();
  {
    lock_guard<recursive_mutex> guard(scheduleMutex);
    pendingRemovals.clear();
  }
  for (const auto& record : collaborators.registry->snapshot()) {
    teardown(record, false, false, "server shutting down");
  }
  LOG(INFO) << "Session orchestrator shut down";
}
}  // namespace pd
