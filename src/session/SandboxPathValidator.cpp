#include "SandboxPathValidator.hpp"

namespace pd {
SandboxPathValidator::SandboxPathValidator(
    const vector<string>& _protectedPaths, const string& _sandboxRoot) {
  for (const auto& it : _protectedPaths) {
    if (!it.empty()) {
      protectedPaths.push_back(normalize(ExpandHome(it)));
    }
  }
  if (!_sandboxRoot.empty()) {
    sandboxRoot = normalize(ExpandHome(_sandboxRoot));
  }
}

vector<string> SandboxPathValidator::defaultProtectedPaths() {
  return {"~/.ssh", "~/.gnupg", "~/.aws", "~/.kube",
          "~/.docker", "/etc", "/root", "/var"};
}

string SandboxPathValidator::normalize(const string& path) {
  fs::path p(path);
  if (p.is_relative()) {
    std::error_code ec;
    p = fs::current_path(ec) / p;
  }
  string s = p.lexically_normal().string();
  while (s.size() > 1 && s.back() == '/') {
    s.pop_back();
  }
  return s;
}

bool SandboxPathValidator::isWithin(const string& path, const string& root) {
  if (root == "/") {
    return true;
  }
  return path == root || startsWith(path, root + "/");
}

string SandboxPathValidator::sanitizeComponent(const string& component) {
  string out;
  for (char c : component) {
    if (isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_') {
      out.push_back(c);
    } else if (c != '.' && c != '/' && c != '\\') {
      out.push_back('_');
    }
  }
  return out;
}

PathDecision SandboxPathValidator::validate(const string& path,
                                            const string& ownerId) {
  for (const auto& component : split(path, '/')) {
    if (component == "..") {
      return {false, "Path traversal not allowed"};
    }
  }
  string normalized = normalize(ExpandHome(path));
  for (const auto& it : protectedPaths) {
    if (isWithin(normalized, it)) {
      return {false, "Access to " + it + " is not allowed"};
    }
  }
  if (!sandboxRoot.empty()) {
    string owner = sanitizeComponent(ownerId);
    if (owner.empty()) {
      return {false, "Sandboxed sessions need an owner"};
    }
    string ownerSandbox = sandboxRoot + "/" + owner;
    if (!isWithin(normalized, ownerSandbox)) {
      return {false, "Path must be within " + ownerSandbox};
    }
  }
  return {true, ""};
}
}  // namespace pd
