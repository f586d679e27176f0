#include "FakeCollaborators.hpp"
#include "JsonFileLedger.hpp"
#include "LogAuditSink.hpp"
#include "PatternInputGate.hpp"
#include "PseudoTerminalProcess.hpp"
#include "SandboxPathValidator.hpp"
#include "SessionOrchestrator.hpp"
#include "TestHeaders.hpp"

using namespace pd;

namespace {
OrchestratorCollaborators realCollaborators(const OrchestratorConfig& config) {
  OrchestratorCollaborators c;
  c.registry = make_shared<SessionRegistry>();
  c.ledger = make_shared<JsonFileLedger>(config.ledgerPath);
  c.launcher = make_shared<PseudoTerminalLauncher>();
  c.launchEnvironment = make_shared<LaunchEnvironment>(config.candidatePaths,
                                                       config.extraPathDirs);
  c.pathValidator = make_shared<SandboxPathValidator>(config.protectedPaths,
                                                      config.sandboxRoot);
  c.inputGate = make_shared<PatternInputGate>(config.strictInputFilter);
  c.auditSink = make_shared<LogAuditSink>();
  c.resumeTokenExtractor = make_shared<ResumeTokenExtractor>();
  c.clock = make_shared<SystemClock>();
  return c;
}
}  // namespace

TEST_CASE("Session lifecycle over a real terminal", "[SessionLifecycle]") {
  TempDirectory dir;
  OrchestratorConfig config;
  // A plain shell stands in for the assistant
  config.candidatePaths = {"/bin/sh"};
  config.ledgerPath = dir.getPath() + "/sessions.json";
  config.exitRemovalDelayMillis = 0;
  auto collaborators = realCollaborators(config);
  SessionOrchestrator orchestrator(config, collaborators);

  StartRequest request;
  request.set_id("live");
  request.set_working_directory(dir.getPath());
  auto response = orchestrator.start(request);
  REQUIRE_FALSE(response.has_error());
  REQUIRE(response.pid() > 0);

  auto viewer = make_shared<RecordingViewer>();
  ErrorInfo error;
  auto subscription = orchestrator.attach("live", viewer, &error);
  REQUIRE(subscription);

  InputRequest input;
  input.set_id("live");
  input.set_data("echo pd-$((40 + 2))\n");
  REQUIRE_FALSE(orchestrator.sendInput(input).has_error());
  REQUIRE(waitUntil([&]() { return viewer->output().find("pd-42") !=
                                   string::npos; }));
  auto record = collaborators.registry->get("live");
  REQUIRE(record->getStatus() == SESSION_RUNNING);

  input.set_data("echo 'session id: 0123456789abcdef'; exit 5\n");
  REQUIRE_FALSE(orchestrator.sendInput(input).has_error());
  REQUIRE(waitUntil([&]() { return viewer->count(EVENT_EXIT) == 1; }));
  REQUIRE(record->getStatus() == SESSION_STOPPED);
  REQUIRE(record->getResumeToken() == "0123456789abcdef");

  auto events = viewer->getEvents();
  auto exitEvent = std::find_if(
      events.begin(), events.end(),
      [](const StreamEvent& e) { return e.type() == EVENT_EXIT; });
  REQUIRE(exitEvent->exit_code() == 5);

  // Removal is scheduled by the reader thread right after the exit event
  REQUIRE(waitUntil(
      [&]() { return orchestrator.processPendingRemovals() == 1; }));
  orchestrator.waitForTeardowns();
  REQUIRE_FALSE(collaborators.registry->get("live"));
  REQUIRE(viewer->getEvents().back().type() == EVENT_COMPLETE);

  auto stored = collaborators.ledger->get("live");
  REQUIRE(stored);
  REQUIRE(stored->status() == SESSION_STOPPED);
  REQUIRE(stored->resume_token() == "0123456789abcdef");
}

TEST_CASE("Stopping a real session kills its process", "[SessionLifecycle]") {
  TempDirectory dir;
  OrchestratorConfig config;
  config.candidatePaths = {"/bin/sh"};
  config.ledgerPath = dir.getPath() + "/sessions.json";
  auto collaborators = realCollaborators(config);
  SessionOrchestrator orchestrator(config, collaborators);

  StartRequest request;
  request.set_id("doomed");
  request.set_working_directory(dir.getPath());
  auto response = orchestrator.start(request);
  REQUIRE_FALSE(response.has_error());
  pid_t pid = response.pid();

  StopRequest stop;
  stop.set_id("doomed");
  stop.set_remove_from_ledger(true);
  REQUIRE_FALSE(orchestrator.stop(stop).has_error());
  REQUIRE_FALSE(collaborators.registry->get("doomed"));
  REQUIRE_FALSE(collaborators.ledger->get("doomed"));
  REQUIRE(waitUntil([pid]() { return ::kill(pid, 0) == -1; }));
}
