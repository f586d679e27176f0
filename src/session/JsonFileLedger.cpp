#include "JsonFileLedger.hpp"

#include "EnumNames.hpp"

namespace pd {
JsonFileLedger::JsonFileLedger(const string& _path) : path(_path) { load(); }

string JsonFileLedger::defaultPath() {
  return sago::getDataHome() + "/ptydock/sessions.json";
}

json JsonFileLedger::toJson(const LedgerRecord& record) {
  json j;
  j["id"] = record.id();
  j["workingDirectory"] = record.working_directory();
  j["bypassPermissions"] = record.bypass_permissions();
  j["startedAt"] = record.started_at();
  j["status"] = statusName(record.status());
  j["isBackground"] = record.is_background();
  if (record.has_resume_token()) {
    j["resumeToken"] = record.resume_token();
  }
  j["lastActivityAt"] = record.last_activity_at();
  if (record.has_owner_id()) {
    j["ownerId"] = record.owner_id();
  }
  if (record.has_multiplexer_handle()) {
    j["multiplexerHandle"] = record.multiplexer_handle();
  }
  if (record.has_project_id()) {
    j["projectId"] = record.project_id();
  }
  j["sandboxed"] = record.sandboxed();
  return j;
}

LedgerRecord JsonFileLedger::fromJson(const json& j) {
  LedgerRecord record;
  record.set_id(j.at("id").get<string>());
  record.set_working_directory(
      jsonValueOr<string>(j, "workingDirectory", string()));
  record.set_bypass_permissions(
      jsonValueOr<bool>(j, "bypassPermissions", false));
  record.set_started_at(jsonValueOr<int64_t>(j, "startedAt", 0));
  SessionStatus status = SESSION_STOPPED;
  string name = jsonValueOr<string>(j, "status", string("stopped"));
  if (!parseStatus(name, &status)) {
    LOG(WARNING) << "Unknown status '" << name << "' for session "
                 << record.id();
    status = SESSION_STOPPED;
  }
  record.set_status(status);
  record.set_is_background(jsonValueOr<bool>(j, "isBackground", false));
  if (j.contains("resumeToken") && j["resumeToken"].is_string()) {
    record.set_resume_token(j["resumeToken"].get<string>());
  }
  record.set_last_activity_at(
      jsonValueOr<int64_t>(j, "lastActivityAt", record.started_at()));
  if (j.contains("ownerId") && j["ownerId"].is_string()) {
    record.set_owner_id(j["ownerId"].get<string>());
  }
  if (j.contains("multiplexerHandle") && j["multiplexerHandle"].is_string()) {
    record.set_multiplexer_handle(j["multiplexerHandle"].get<string>());
  }
  if (j.contains("projectId") && j["projectId"].is_string()) {
    record.set_project_id(j["projectId"].get<string>());
  }
  record.set_sandboxed(jsonValueOr<bool>(j, "sandboxed", false));
  return record;
}

void JsonFileLedger::load() {
  lock_guard<recursive_mutex> guard(ledgerMutex);
  entries.clear();
  ifstream in(path);
  if (!in.good()) {
    VLOG(1) << "No ledger at " << path << ", starting empty";
    return;
  }
  try {
    json j = json::parse(in);
    if (!j.is_array()) {
      LOG(ERROR) << "Ledger " << path << " is not a JSON array, ignoring it";
      return;
    }
    for (const auto& it : j) {
      entries.push_back(fromJson(it));
    }
  } catch (const json::exception& ex) {
    LOG(ERROR) << "Could not parse ledger " << path << ": " << ex.what();
    entries.clear();
    return;
  }
  LOG(INFO) << "Loaded " << entries.size() << " ledger entries from " << path;
}

void JsonFileLedger::persist() {
  json j = json::array();
  for (const auto& it : entries) {
    j.push_back(toJson(it));
  }

  std::error_code ec;
  fs::path target(path);
  if (target.has_parent_path()) {
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
      throw std::runtime_error("Cannot create ledger directory " +
                               target.parent_path().string() + ": " +
                               ec.message());
    }
  }

  string tmpPath = path + ".tmp." + to_string(::getpid());
  {
    ofstream out(tmpPath, std::ios::out | std::ios::trunc);
    if (!out.good()) {
      throw std::runtime_error("Cannot open " + tmpPath + " for writing");
    }
    // Paths and ids are raw bytes; invalid UTF-8 is stored as U+FFFD
    out << j.dump(2, ' ', false, json::error_handler_t::replace);
    out.flush();
    if (!out.good()) {
      throw std::runtime_error("Failed writing " + tmpPath);
    }
  }
  if (::rename(tmpPath.c_str(), path.c_str()) != 0) {
    string error = strerror(GetErrno());
    ::unlink(tmpPath.c_str());
    throw std::runtime_error("Cannot replace " + path + ": " + error);
  }
}

void JsonFileLedger::upsert(const LedgerRecord& record) {
  lock_guard<recursive_mutex> guard(ledgerMutex);
  bool replaced = false;
  for (auto& it : entries) {
    if (it.id() == record.id()) {
      it = record;
      replaced = true;
      break;
    }
  }
  if (!replaced) {
    entries.push_back(record);
  }
  persist();
}

optional<LedgerRecord> JsonFileLedger::get(const string& id) {
  lock_guard<recursive_mutex> guard(ledgerMutex);
  for (const auto& it : entries) {
    if (it.id() == id) {
      return it;
    }
  }
  return nullopt;
}

bool JsonFileLedger::remove(const string& id) {
  lock_guard<recursive_mutex> guard(ledgerMutex);
  auto it = std::find_if(
      entries.begin(), entries.end(),
      [&id](const LedgerRecord& r) { return r.id() == id; });
  if (it == entries.end()) {
    return false;
  }
  entries.erase(it);
  persist();
  return true;
}

vector<LedgerRecord> JsonFileLedger::list() {
  lock_guard<recursive_mutex> guard(ledgerMutex);
  return entries;
}
}  // namespace pd
