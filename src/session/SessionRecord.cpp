#include "SessionRecord.hpp"

#include "EnumNames.hpp"

namespace pd {
SessionRecord::SessionRecord(const string& _id, const StartRequest& request,
                             int64_t _startedAt, size_t bufferCapacity)
    : id(_id),
      workingDirectory(request.working_directory()),
      bypassPermissions(request.bypass_permissions()),
      isBackground(request.is_background()),
      sandboxed(request.sandboxed()),
      ownerId(request.owner_id()),
      projectId(request.project_id()),
      startedAt(_startedAt),
      status(SESSION_STARTING),
      lastActivityAt(_startedAt),
      pid(-1),
      buffer(bufferCapacity) {}

bool SessionRecord::isTerminal(SessionStatus status) {
  return status == SESSION_STOPPED || status == SESSION_ERROR;
}

bool SessionRecord::canTransition(SessionStatus from, SessionStatus to) {
  switch (from) {
    case SESSION_STARTING:
      return to == SESSION_RUNNING || to == SESSION_BACKGROUND ||
             to == SESSION_STOPPED || to == SESSION_ERROR;
    case SESSION_RUNNING:
    case SESSION_BACKGROUND:
      return to == SESSION_STOPPED || to == SESSION_ERROR;
    case SESSION_STOPPED:
    case SESSION_ERROR:
      return false;
  }
  return false;
}

bool SessionRecord::transitionTo(SessionStatus next, int64_t nowMillis) {
  lock_guard<recursive_mutex> guard(recordMutex);
  if (!canTransition(status, next)) {
    VLOG(1) << "Session " << id << ": refusing " << statusName(status)
            << " -> " << statusName(next);
    return false;
  }
  LOG(INFO) << "Session " << id << ": " << statusName(status) << " -> "
            << statusName(next);
  status = next;
  lastActivityAt = max(lastActivityAt, nowMillis);
  return true;
}

void SessionRecord::touch(int64_t nowMillis) {
  lock_guard<recursive_mutex> guard(recordMutex);
  lastActivityAt = max(lastActivityAt, nowMillis);
}

bool SessionRecord::setResumeToken(const string& token) {
  lock_guard<recursive_mutex> guard(recordMutex);
  if (!resumeToken.empty() || token.empty()) {
    return false;
  }
  resumeToken = token;
  return true;
}

void SessionRecord::attachProcess(shared_ptr<ProcessHandle> _process) {
  lock_guard<recursive_mutex> guard(recordMutex);
  if (process) {
    STFATAL << "Session " << id << " already has a process";
  }
  process = _process;
  pid = process->getPid();
}

shared_ptr<ProcessHandle> SessionRecord::detachProcess() {
  lock_guard<recursive_mutex> guard(recordMutex);
  auto p = process;
  process.reset();
  return p;
}

LedgerRecord SessionRecord::toLedgerRecord() {
  lock_guard<recursive_mutex> guard(recordMutex);
  LedgerRecord r;
  r.set_id(id);
  r.set_working_directory(workingDirectory);
  r.set_bypass_permissions(bypassPermissions);
  r.set_started_at(startedAt);
  r.set_status(status);
  r.set_is_background(isBackground);
  if (!resumeToken.empty()) {
    r.set_resume_token(resumeToken);
  }
  r.set_last_activity_at(lastActivityAt);
  if (!ownerId.empty()) {
    r.set_owner_id(ownerId);
  }
  if (!multiplexerHandle.empty()) {
    r.set_multiplexer_handle(multiplexerHandle);
  }
  if (!projectId.empty()) {
    r.set_project_id(projectId);
  }
  r.set_sandboxed(sandboxed);
  return r;
}

SessionStatus SessionRecord::getStatus() {
  lock_guard<recursive_mutex> guard(recordMutex);
  return status;
}

bool SessionRecord::isLive() {
  lock_guard<recursive_mutex> guard(recordMutex);
  return !isTerminal(status);
}

int64_t SessionRecord::getLastActivityAt() {
  lock_guard<recursive_mutex> guard(recordMutex);
  return lastActivityAt;
}

string SessionRecord::getResumeToken() {
  lock_guard<recursive_mutex> guard(recordMutex);
  return resumeToken;
}

bool SessionRecord::hasResumeToken() {
  lock_guard<recursive_mutex> guard(recordMutex);
  return !resumeToken.empty();
}

pid_t SessionRecord::getPid() {
  lock_guard<recursive_mutex> guard(recordMutex);
  return pid;
}

shared_ptr<ProcessHandle> SessionRecord::getProcess() {
  lock_guard<recursive_mutex> guard(recordMutex);
  return process;
}

string SessionRecord::getMultiplexerHandle() {
  lock_guard<recursive_mutex> guard(recordMutex);
  return multiplexerHandle;
}

void SessionRecord::setMultiplexerHandle(const string& handle) {
  lock_guard<recursive_mutex> guard(recordMutex);
  multiplexerHandle = handle;
}
}  // namespace pd
