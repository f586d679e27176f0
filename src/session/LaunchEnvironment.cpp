#include "LaunchEnvironment.hpp"

extern char** environ;

namespace pd {
LaunchEnvironment::LaunchEnvironment(const vector<string>& _candidatePaths,
                                     const vector<string>& _extraPathDirs) {
  for (const auto& it : _candidatePaths) {
    candidatePaths.push_back(ExpandHome(it));
  }
  for (const auto& it : _extraPathDirs) {
    extraPathDirs.push_back(ExpandHome(it));
  }
}

bool LaunchEnvironment::isExecutableFile(const string& path) {
  struct stat st;
  if (::stat(path.c_str(), &st) != 0) {
    return false;
  }
  return S_ISREG(st.st_mode) && ::access(path.c_str(), X_OK) == 0;
}

optional<string> LaunchEnvironment::locateExecutable(
    const string& binaryName) const {
  for (const auto& candidate : candidatePaths) {
    if (isExecutableFile(candidate)) {
      VLOG(1) << "Found " << binaryName << " at " << candidate;
      return candidate;
    }
  }
  auto found = findOnPath(binaryName);
  if (!found) {
    LOG(WARNING) << "Could not locate " << binaryName;
  }
  return found;
}

optional<string> LaunchEnvironment::findOnPath(const string& binaryName) const {
  if (binaryName.find('/') != string::npos) {
    if (isExecutableFile(binaryName)) {
      return binaryName;
    }
    return nullopt;
  }
  for (const auto& dir : split(extendedPath(), ':')) {
    if (dir.empty()) {
      continue;
    }
    string path = dir + "/" + binaryName;
    if (isExecutableFile(path)) {
      VLOG(1) << "Found " << binaryName << " on PATH at " << path;
      return path;
    }
  }
  return nullopt;
}

string LaunchEnvironment::extendedPath() const {
  string path;
  for (const auto& dir : extraPathDirs) {
    if (!path.empty()) {
      path += ":";
    }
    path += dir;
  }
  const char* inherited = ::getenv("PATH");
  if (inherited != NULL && inherited[0] != '\0') {
    if (!path.empty()) {
      path += ":";
    }
    path += inherited;
  }
  return path;
}

map<string, string> LaunchEnvironment::buildChildEnvironment() const {
  map<string, string> env;
  for (char** it = environ; it != NULL && *it != NULL; ++it) {
    string entry(*it);
    auto eq = entry.find('=');
    if (eq == string::npos || eq == 0) {
      continue;
    }
    env[entry.substr(0, eq)] = entry.substr(eq + 1);
  }
  env["PATH"] = extendedPath();
  env["HOME"] = GetHomeDirectory();
  env["TERM"] = "xterm-256color";
  env["COLORTERM"] = "truecolor";
  env["FORCE_COLOR"] = "3";
  env["LANG"] = "en_US.UTF-8";
  env["LC_ALL"] = "en_US.UTF-8";
  env["PTYDOCK_VERSION"] = PD_VERSION;
  return env;
}

vector<string> LaunchEnvironment::buildAssistantArgs(bool bypassPermissions,
                                                     const string& resumeToken,
                                                     bool continueLast) {
  vector<string> args;
  if (bypassPermissions) {
    args.push_back("--dangerously-skip-permissions");
  }
  if (!resumeToken.empty()) {
    args.push_back("--resume");
    args.push_back(resumeToken);
  } else if (continueLast) {
    args.push_back("--continue");
  }
  return args;
}
}  // namespace pd
