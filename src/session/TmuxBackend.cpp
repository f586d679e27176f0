#include "TmuxBackend.hpp"

namespace pd {
namespace {
const string SESSION_PREFIX = "ptydock-";
}

TmuxBackend::TmuxBackend(shared_ptr<SubprocessUtils> _subprocess,
                         const string& _tmuxPath)
    : subprocess(_subprocess), tmuxPath(_tmuxPath) {}

bool TmuxBackend::isAvailable() {
  lock_guard<mutex> guard(checkMutex);
  if (!available) {
    if (tmuxPath.empty()) {
      available = false;
    } else {
      try {
        available = subprocess->run(tmuxPath, {"-V"}).exitCode == 0;
      } catch (const std::runtime_error& ex) {
        LOG(WARNING) << "Could not check for tmux: " << ex.what();
        available = false;
      }
    }
    LOG(INFO) << "tmux " << (*available ? "is" : "is not") << " available";
  }
  return *available;
}

bool TmuxBackend::hasSession(const string& name) {
  if (!isAvailable()) {
    return false;
  }
  auto result =
      subprocess->run(tmuxPath, {"list-sessions", "-F", "#{session_name}"});
  if (result.exitCode != 0) {
    // No server running means no sessions
    return false;
  }
  for (const auto& line : split(result.output, '\n')) {
    if (line == name) {
      return true;
    }
  }
  return false;
}

ProcessLaunchSpec TmuxBackend::buildCreateSpec(const string& name,
                                               const ProcessLaunchSpec& inner) {
  ProcessLaunchSpec spec = inner;
  spec.executable = tmuxPath;
  spec.args = {"new-session", "-A", "-s", name, "-c", inner.workingDirectory,
               inner.executable};
  spec.args.insert(spec.args.end(), inner.args.begin(), inner.args.end());
  return spec;
}

ProcessLaunchSpec TmuxBackend::buildAttachSpec(const string& name,
                                               const ProcessLaunchSpec& base) {
  ProcessLaunchSpec spec = base;
  spec.executable = tmuxPath;
  spec.args = {"attach-session", "-t", name};
  return spec;
}

bool TmuxBackend::detachClients(const string& name) {
  if (!isAvailable()) {
    return false;
  }
  auto result = subprocess->run(tmuxPath, {"detach-client", "-s", name});
  if (result.exitCode != 0) {
    LOG(WARNING) << "tmux detach-client -s " << name << " exited with "
                 << result.exitCode;
    return false;
  }
  return true;
}

bool TmuxBackend::killSession(const string& name) {
  if (!isAvailable()) {
    return false;
  }
  auto result = subprocess->run(tmuxPath, {"kill-session", "-t", name});
  if (result.exitCode != 0) {
    LOG(WARNING) << "tmux kill-session -t " << name << " exited with "
                 << result.exitCode;
    return false;
  }
  LOG(INFO) << "Killed tmux session " << name;
  return true;
}

string TmuxBackend::sanitize(const string& s) {
  string out = s;
  for (auto& c : out) {
    if (!isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') {
      c = '-';
    }
  }
  return out;
}

string TmuxBackend::sessionNameFor(const string& sessionId) {
  return SESSION_PREFIX + sanitize(sessionId);
}
}  // namespace pd
