#include "OrchestratorConfig.hpp"

#include "TestHeaders.hpp"

using namespace pd;

TEST_CASE("OrchestratorConfig defaults", "[OrchestratorConfig]") {
  OrchestratorConfig config;
  REQUIRE(config.bufferCapacity == 200);
  REQUIRE(config.exitRemovalDelayMillis == 5000);
  REQUIRE(config.keepaliveIntervalMillis == 15000);
  REQUIRE(config.assistantBinary == "claude");
  REQUIRE(config.multiplexerStopPolicy == MultiplexerStopPolicy::DETACH);
  REQUIRE(config.sandboxRoot.empty());
  REQUIRE_FALSE(config.strictInputFilter);
}

TEST_CASE("OrchestratorConfig loads INI overrides", "[OrchestratorConfig]") {
  OrchestratorConfig config;
  REQUIRE(config.loadFromData(
      "[Sessions]\n"
      "buffer_capacity = 50\n"
      "exit_removal_delay_ms = 1000\n"
      "keepalive_interval_ms = 2000\n"
      "sweep_interval_ms = 3000\n"
      "foreground_idle_ms = 4000\n"
      "background_idle_ms = 5000\n"
      "finished_retention_ms = 6000\n"
      "binary = assistant\n"
      "candidate_paths = /opt/a/assistant , ~/bin/assistant\n"
      "extra_path_dirs = /opt/a\n"
      "ledger_path = /var/lib/ptydock/ledger.json\n"
      "teardown_threads = 0\n"
      "cols = 100\n"
      "rows = 30\n"
      "[Multiplexer]\n"
      "binary = /usr/local/bin/tmux\n"
      "stop_policy = kill\n"
      "[Security]\n"
      "protected_paths = /etc, /secrets\n"
      "sandbox_root = /srv/sandboxes\n"
      "strict_input_filter = 1\n"
      "[Debug]\n"
      "verbose = 3\n"
      "logsize = 1024\n"
      "logdir = /tmp/pdlogs\n"));

  REQUIRE(config.bufferCapacity == 50);
  REQUIRE(config.exitRemovalDelayMillis == 1000);
  REQUIRE(config.keepaliveIntervalMillis == 2000);
  REQUIRE(config.sweepIntervalMillis == 3000);
  REQUIRE(config.sweepPolicy.foregroundIdleMillis == 4000);
  REQUIRE(config.sweepPolicy.backgroundIdleMillis == 5000);
  REQUIRE(config.sweepPolicy.terminalRetentionMillis == 6000);
  REQUIRE(config.assistantBinary == "assistant");
  REQUIRE(config.candidatePaths ==
          vector<string>{"/opt/a/assistant", "~/bin/assistant"});
  REQUIRE(config.extraPathDirs == vector<string>{"/opt/a"});
  REQUIRE(config.ledgerPath == "/var/lib/ptydock/ledger.json");
  // Clamped to one worker
  REQUIRE(config.teardownThreads == 1);
  REQUIRE(config.defaultCols == 100);
  REQUIRE(config.defaultRows == 30);
  REQUIRE(config.tmuxBinary == "/usr/local/bin/tmux");
  REQUIRE(config.multiplexerStopPolicy == MultiplexerStopPolicy::KILL);
  REQUIRE(config.protectedPaths == vector<string>{"/etc", "/secrets"});
  REQUIRE(config.sandboxRoot == "/srv/sandboxes");
  REQUIRE(config.strictInputFilter);
  REQUIRE(config.verboseLevel == 3);
  REQUIRE(config.logSize == "1024");
  REQUIRE(config.logDirectory == "/tmp/pdlogs");
}

TEST_CASE("OrchestratorConfig keeps defaults for bad values",
          "[OrchestratorConfig]") {
  OrchestratorConfig config;
  REQUIRE(config.loadFromData(
      "[Sessions]\n"
      "buffer_capacity = 0\n"
      "keepalive_interval_ms = soon\n"
      "[Multiplexer]\n"
      "stop_policy = explode\n"));
  REQUIRE(config.bufferCapacity == 200);
  REQUIRE(config.keepaliveIntervalMillis == 15000);
  REQUIRE(config.multiplexerStopPolicy == MultiplexerStopPolicy::DETACH);
}

TEST_CASE("OrchestratorConfig loads files", "[OrchestratorConfig]") {
  TempDirectory dir;
  string path = dir.getPath() + "/ptydock.cfg";
  {
    ofstream out(path);
    out << "[Sessions]\nbuffer_capacity = 7\n";
  }
  OrchestratorConfig config;
  REQUIRE(config.loadFromFile(path));
  REQUIRE(config.bufferCapacity == 7);
  REQUIRE_FALSE(config.loadFromFile(dir.getPath() + "/missing.cfg"));
}

TEST_CASE("OrchestratorConfig stop policy names", "[OrchestratorConfig]") {
  MultiplexerStopPolicy policy = MultiplexerStopPolicy::DETACH;
  REQUIRE(OrchestratorConfig::parseStopPolicy("kill", &policy));
  REQUIRE(policy == MultiplexerStopPolicy::KILL);
  REQUIRE(OrchestratorConfig::stopPolicyName(policy) == "kill");
  REQUIRE_FALSE(OrchestratorConfig::parseStopPolicy("KILL", &policy));
  REQUIRE(OrchestratorConfig::stopPolicyName(MultiplexerStopPolicy::DETACH) ==
          "detach");
}
