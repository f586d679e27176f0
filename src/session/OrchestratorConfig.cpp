#include "OrchestratorConfig.hpp"

namespace pd {
namespace {
vector<string> parseList(const char* value) {
  vector<string> items;
  for (auto item : split(value, ',')) {
    auto begin = item.find_first_not_of(" \t");
    if (begin == string::npos) {
      continue;
    }
    auto end = item.find_last_not_of(" \t");
    items.push_back(item.substr(begin, end - begin + 1));
  }
  return items;
}

string getString(const CSimpleIniA& ini, const char* section,
                 const char* key, const string& fallback) {
  const char* value = ini.GetValue(section, key, NULL);
  return value == NULL ? fallback : string(value);
}

int64_t getInt(const CSimpleIniA& ini, const char* section, const char* key,
               int64_t fallback) {
  const char* value = ini.GetValue(section, key, NULL);
  if (value == NULL) {
    return fallback;
  }
  try {
    return stoll(value);
  } catch (const std::logic_error&) {
    LOG(WARNING) << "Ignoring bad value for [" << section << "] " << key
                 << ": " << value;
    return fallback;
  }
}
}  // namespace

string OrchestratorConfig::stopPolicyName(MultiplexerStopPolicy policy) {
  return policy == MultiplexerStopPolicy::KILL ? "kill" : "detach";
}

bool OrchestratorConfig::parseStopPolicy(const string& name,
                                         MultiplexerStopPolicy* policy) {
  if (name == "detach") {
    *policy = MultiplexerStopPolicy::DETACH;
    return true;
  }
  if (name == "kill") {
    *policy = MultiplexerStopPolicy::KILL;
    return true;
  }
  return false;
}

bool OrchestratorConfig::loadFromFile(const string& path) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(path.c_str());
  if (rc < 0) {
    LOG(ERROR) << "Could not load config file " << path;
    return false;
  }
  apply(ini);
  return true;
}

bool OrchestratorConfig::loadFromData(const string& data) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadData(data.c_str(), data.size());
  if (rc < 0) {
    return false;
  }
  apply(ini);
  return true;
}

void OrchestratorConfig::apply(const CSimpleIniA& ini) {
  int64_t capacity = getInt(ini, "Sessions", "buffer_capacity",
                            int64_t(bufferCapacity));
  if (capacity > 0) {
    bufferCapacity = size_t(capacity);
  } else {
    LOG(WARNING) << "buffer_capacity must be positive, keeping "
                 << bufferCapacity;
  }
  exitRemovalDelayMillis = getInt(ini, "Sessions", "exit_removal_delay_ms",
                                  exitRemovalDelayMillis);
  keepaliveIntervalMillis = getInt(ini, "Sessions", "keepalive_interval_ms",
                                   keepaliveIntervalMillis);
  sweepIntervalMillis =
      getInt(ini, "Sessions", "sweep_interval_ms", sweepIntervalMillis);
  sweepPolicy.foregroundIdleMillis = getInt(
      ini, "Sessions", "foreground_idle_ms", sweepPolicy.foregroundIdleMillis);
  sweepPolicy.backgroundIdleMillis = getInt(
      ini, "Sessions", "background_idle_ms", sweepPolicy.backgroundIdleMillis);
  sweepPolicy.terminalRetentionMillis =
      getInt(ini, "Sessions", "finished_retention_ms",
             sweepPolicy.terminalRetentionMillis);
  assistantBinary =
      getString(ini, "Sessions", "binary", assistantBinary);
  const char* candidates = ini.GetValue("Sessions", "candidate_paths", NULL);
  if (candidates) {
    candidatePaths = parseList(candidates);
  }
  const char* extraDirs = ini.GetValue("Sessions", "extra_path_dirs", NULL);
  if (extraDirs) {
    extraPathDirs = parseList(extraDirs);
  }
  ledgerPath = getString(ini, "Sessions", "ledger_path", ledgerPath);
  teardownThreads = int(max<int64_t>(
      1, getInt(ini, "Sessions", "teardown_threads", teardownThreads)));
  defaultCols = int(getInt(ini, "Sessions", "cols", defaultCols));
  defaultRows = int(getInt(ini, "Sessions", "rows", defaultRows));

  tmuxBinary = getString(ini, "Multiplexer", "binary", tmuxBinary);
  const char* stopPolicy = ini.GetValue("Multiplexer", "stop_policy", NULL);
  if (stopPolicy && !parseStopPolicy(stopPolicy, &multiplexerStopPolicy)) {
    LOG(WARNING) << "Unknown stop_policy '" << stopPolicy << "', keeping "
                 << stopPolicyName(multiplexerStopPolicy);
  }

  const char* protectedList = ini.GetValue("Security", "protected_paths", NULL);
  if (protectedList) {
    protectedPaths = parseList(protectedList);
  }
  sandboxRoot = getString(ini, "Security", "sandbox_root", sandboxRoot);
  strictInputFilter =
      getInt(ini, "Security", "strict_input_filter", strictInputFilter) != 0;

  verboseLevel = int(getInt(ini, "Debug", "verbose", verboseLevel));
  silent = getInt(ini, "Debug", "silent", silent) != 0;
  const char* logsize = ini.GetValue("Debug", "logsize", NULL);
  if (logsize && atoi(logsize) != 0) {
    logSize = string(logsize);
  }
  logDirectory = getString(ini, "Debug", "logdir", logDirectory);
}
}  // namespace pd
