#include "SessionRecord.hpp"

#include "FakeProcessHandle.hpp"
#include "TestHeaders.hpp"

using namespace pd;

namespace {
StartRequest makeRequest() {
  StartRequest request;
  request.set_id("s1");
  request.set_working_directory("/tmp/project");
  request.set_bypass_permissions(true);
  request.set_owner_id("alice");
  request.set_project_id("proj-7");
  return request;
}
}  // namespace

TEST_CASE("SessionRecord starts in the starting state", "[SessionRecord]") {
  SessionRecord record("s1", makeRequest(), 1000, 10);
  REQUIRE(record.getStatus() == SESSION_STARTING);
  REQUIRE(record.isLive());
  REQUIRE(record.getStartedAt() == 1000);
  REQUIRE(record.getLastActivityAt() == 1000);
  REQUIRE(record.getPid() == -1);
  REQUIRE_FALSE(record.hasResumeToken());
  REQUIRE(record.getBuffer().getCapacity() == 10);
}

TEST_CASE("SessionRecord status lattice", "[SessionRecord]") {
  SECTION("Allowed transitions") {
    REQUIRE(SessionRecord::canTransition(SESSION_STARTING, SESSION_RUNNING));
    REQUIRE(
        SessionRecord::canTransition(SESSION_STARTING, SESSION_BACKGROUND));
    REQUIRE(SessionRecord::canTransition(SESSION_STARTING, SESSION_STOPPED));
    REQUIRE(SessionRecord::canTransition(SESSION_STARTING, SESSION_ERROR));
    REQUIRE(SessionRecord::canTransition(SESSION_RUNNING, SESSION_STOPPED));
    REQUIRE(SessionRecord::canTransition(SESSION_RUNNING, SESSION_ERROR));
    REQUIRE(SessionRecord::canTransition(SESSION_BACKGROUND, SESSION_STOPPED));
  }

  SECTION("Finished states are final") {
    for (auto to : {SESSION_STARTING, SESSION_RUNNING, SESSION_BACKGROUND,
                    SESSION_STOPPED, SESSION_ERROR}) {
      REQUIRE_FALSE(SessionRecord::canTransition(SESSION_STOPPED, to));
      REQUIRE_FALSE(SessionRecord::canTransition(SESSION_ERROR, to));
    }
  }

  SECTION("No way back to starting") {
    REQUIRE_FALSE(
        SessionRecord::canTransition(SESSION_RUNNING, SESSION_STARTING));
    REQUIRE_FALSE(
        SessionRecord::canTransition(SESSION_RUNNING, SESSION_BACKGROUND));
    REQUIRE_FALSE(
        SessionRecord::canTransition(SESSION_BACKGROUND, SESSION_RUNNING));
  }
}

TEST_CASE("SessionRecord transitionTo", "[SessionRecord]") {
  SessionRecord record("s1", makeRequest(), 1000, 10);

  REQUIRE(record.transitionTo(SESSION_RUNNING, 2000));
  REQUIRE(record.getStatus() == SESSION_RUNNING);
  REQUIRE(record.getLastActivityAt() == 2000);

  // A no-op is refused
  REQUIRE_FALSE(record.transitionTo(SESSION_RUNNING, 3000));
  REQUIRE(record.getLastActivityAt() == 2000);

  REQUIRE(record.transitionTo(SESSION_STOPPED, 2500));
  REQUIRE_FALSE(record.isLive());
  REQUIRE_FALSE(record.transitionTo(SESSION_RUNNING, 4000));
  REQUIRE_FALSE(record.transitionTo(SESSION_ERROR, 4000));
  REQUIRE(record.getStatus() == SESSION_STOPPED);
}

TEST_CASE("SessionRecord activity never moves backwards", "[SessionRecord]") {
  SessionRecord record("s1", makeRequest(), 1000, 10);
  record.touch(5000);
  record.touch(3000);
  REQUIRE(record.getLastActivityAt() == 5000);
}

TEST_CASE("SessionRecord resume token is write once", "[SessionRecord]") {
  SessionRecord record("s1", makeRequest(), 1000, 10);
  REQUIRE_FALSE(record.setResumeToken(""));
  REQUIRE(record.setResumeToken("token-aaaaaaaa"));
  REQUIRE_FALSE(record.setResumeToken("token-bbbbbbbb"));
  REQUIRE(record.getResumeToken() == "token-aaaaaaaa");
}

TEST_CASE("SessionRecord process binding", "[SessionRecord]") {
  SessionRecord record("s1", makeRequest(), 1000, 10);
  FakeProcessLauncher launcher;
  auto process = launcher.launch(ProcessLaunchSpec(), ProcessCallbacks());
  record.attachProcess(process);
  REQUIRE(record.getPid() == process->getPid());
  REQUIRE(record.getProcess() == process);

  auto detached = record.detachProcess();
  REQUIRE(detached == process);
  REQUIRE_FALSE(record.getProcess());
  // The pid stays known for reporting
  REQUIRE(record.getPid() == process->getPid());
}

TEST_CASE("SessionRecord ledger projection", "[SessionRecord]") {
  SessionRecord record("s1", makeRequest(), 1000, 10);
  record.setMultiplexerHandle("ptydock-s1");
  record.transitionTo(SESSION_RUNNING, 1500);
  record.setResumeToken("abcdefgh1234");

  LedgerRecord ledger = record.toLedgerRecord();
  REQUIRE(ledger.id() == "s1");
  REQUIRE(ledger.working_directory() == "/tmp/project");
  REQUIRE(ledger.bypass_permissions());
  REQUIRE(ledger.started_at() == 1000);
  REQUIRE(ledger.status() == SESSION_RUNNING);
  REQUIRE_FALSE(ledger.is_background());
  REQUIRE(ledger.resume_token() == "abcdefgh1234");
  REQUIRE(ledger.last_activity_at() == 1500);
  REQUIRE(ledger.owner_id() == "alice");
  REQUIRE(ledger.project_id() == "proj-7");
  REQUIRE(ledger.multiplexer_handle() == "ptydock-s1");
  REQUIRE_FALSE(ledger.sandboxed());
}

TEST_CASE("SessionRecord projection omits unset optional fields",
          "[SessionRecord]") {
  StartRequest request;
  request.set_working_directory("/tmp");
  SessionRecord record("s2", request, 10, 10);
  LedgerRecord ledger = record.toLedgerRecord();
  REQUIRE_FALSE(ledger.has_resume_token());
  REQUIRE_FALSE(ledger.has_owner_id());
  REQUIRE_FALSE(ledger.has_project_id());
  REQUIRE_FALSE(ledger.has_multiplexer_handle());
}
