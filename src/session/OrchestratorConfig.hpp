#ifndef __PD_ORCHESTRATOR_CONFIG__
#define __PD_ORCHESTRATOR_CONFIG__

#include "Headers.hpp"
#include "SessionSweeper.hpp"
#include "SimpleIni.h"

namespace pd {
/** @brief What `stop` does to a surviving tmux session by default. */
enum class MultiplexerStopPolicy { DETACH, KILL };

/**
 * @brief Tunables of the session engine, with built-in defaults that an
 * INI file may override:
 *
 * [Sessions] buffer_capacity, exit_removal_delay_ms, keepalive_interval_ms,
 * sweep_interval_ms, foreground_idle_ms, background_idle_ms,
 * finished_retention_ms, binary, candidate_paths, extra_path_dirs,
 * ledger_path, teardown_threads, cols, rows
 *
 * [Multiplexer] binary, stop_policy (detach|kill)
 *
 * [Security] protected_paths, sandbox_root, strict_input_filter
 *
 * [Debug] verbose, silent, logsize, logdir
 *
 * Lists are comma separated.
 */
struct OrchestratorConfig {
  size_t bufferCapacity = 200;
  int64_t exitRemovalDelayMillis = 5000;
  int64_t keepaliveIntervalMillis = 15000;
  int64_t sweepIntervalMillis = 60000;
  SweepPolicy sweepPolicy;

  string assistantBinary = "claude";
  vector<string> candidatePaths = {"~/.local/bin/claude",
                                   "/usr/local/bin/claude", "/usr/bin/claude"};
  vector<string> extraPathDirs = {"~/.local/bin", "/usr/local/bin",
                                  "/usr/bin"};
  /** @brief Empty means `JsonFileLedger::defaultPath()`. */
  string ledgerPath;
  int teardownThreads = 2;
  int defaultCols = 120;
  int defaultRows = 40;

  string tmuxBinary = "tmux";
  MultiplexerStopPolicy multiplexerStopPolicy = MultiplexerStopPolicy::DETACH;

  vector<string> protectedPaths = {"~/.ssh",    "~/.gnupg", "~/.aws",
                                   "~/.kube",   "~/.docker", "/etc",
                                   "/root",     "/var"};
  /** @brief Empty disables the per-owner sandbox restriction. */
  string sandboxRoot;
  bool strictInputFilter = false;

  int verboseLevel = 0;
  bool silent = false;
  string logSize = "20971520";
  /** @brief Empty means the temp directory. */
  string logDirectory;

  /** @return false if the file cannot be loaded. */
  bool loadFromFile(const string& path);
  /** @return false if the text is not valid INI. */
  bool loadFromData(const string& data);

  static string stopPolicyName(MultiplexerStopPolicy policy);
  static bool parseStopPolicy(const string& name,
                              MultiplexerStopPolicy* policy);

 protected:
  void apply(const CSimpleIniA& ini);
};
}  // namespace pd

#endif  // __PD_ORCHESTRATOR_CONFIG__
