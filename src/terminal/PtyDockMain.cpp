#include <cxxopts.hpp>

#include "ConsoleViewer.hpp"
#include "EventFormatter.hpp"
#include "LogHandler.hpp"
#include "OrchestratorConfig.hpp"
#include "PseudoTerminalConsole.hpp"
#include "SessionOrchestrator.hpp"

using namespace pd;

#define BUF_SIZE (16 * 1024)

namespace {
// Ctrl-]
const char DETACH_KEY = 0x1d;

std::atomic<bool> windowChanged(false);

void WindowChangeHandler(int) { windowChanged = true; }

int reportError(const ErrorInfo& error) {
  CLOG(INFO, "stdout") << EventFormatter::dump(EventFormatter::toJson(error))
                       << endl;
  return 1;
}

int runInteractive(SessionOrchestrator& orchestrator,
                   const StartRequest& request, bool eventsMode) {
  shared_ptr<PseudoTerminalConsole> console(new PseudoTerminalConsole());
  StartRequest startRequest = request;
  *startRequest.mutable_size() = console->getTerminalSize();

  StartResponse started = orchestrator.start(startRequest);
  if (started.has_error() && started.error().code() != ERR_NONE) {
    return reportError(started.error());
  }
  const string& id = started.id();
  CLOG(INFO, "stdout") << "Session " << id << (started.resumed() ? " (resumed)" : "")
                       << ", pid " << started.pid()
                       << ". Press Ctrl-] to detach." << endl;

  shared_ptr<ConsoleViewer> viewer(new ConsoleViewer(console, eventsMode));
  ErrorInfo attachError;
  auto subscription = orchestrator.attach(id, viewer, &attachError);
  if (!subscription) {
    return reportError(attachError);
  }

  ::signal(SIGWINCH, WindowChangeHandler);
  if (!eventsMode) {
    console->setup();
  }

  bool detached = false;
  char b[BUF_SIZE];
  try {
    while (!viewer->isDone()) {
      if (windowChanged.exchange(false)) {
        TerminalSize ts = console->getTerminalSize();
        LOG(INFO) << "Window size changed: " << ts.cols() << "x" << ts.rows();
        auto resized = orchestrator.resize(id, ts.cols(), ts.rows());
        if (resized.has_error() && resized.error().code() != ERR_NONE) {
          LOG(WARNING) << "Resize failed: " << resized.error().message();
        }
      }
      if (!FdUtils::waitForReadable(console->getInputFd(), 100)) {
        continue;
      }
      ssize_t rc = ::read(console->getInputFd(), b, BUF_SIZE);
      if (rc < 0 && (GetErrno() == EINTR || GetErrno() == EAGAIN)) {
        continue;
      }
      FATAL_FAIL(rc);
      if (rc == 0) {
        // stdin closed
        detached = true;
        break;
      }
      string s(b, rc);
      auto detachPos = s.find(DETACH_KEY);
      if (detachPos != string::npos) {
        s = s.substr(0, detachPos);
        detached = true;
      }
      if (!s.empty()) {
        InputRequest input;
        input.set_id(id);
        input.set_data(s);
        auto sent = orchestrator.sendInput(input);
        if (sent.has_error() && sent.error().code() != ERR_NONE) {
          console->write("\r\n[ptydock] " +
                         EventFormatter::dump(
                             EventFormatter::toJson(sent.error())) +
                         "\r\n");
        }
      }
      if (detached) {
        break;
      }
    }
  } catch (const runtime_error& re) {
    STERROR << "Error: " << re.what();
  }

  orchestrator.detach(id, subscription);
  if (!eventsMode) {
    console->teardown();
  }
  ::signal(SIGWINCH, SIG_DFL);

  string token = viewer->getResumeToken();
  auto record = orchestrator.getRegistry()->get(id);
  string multiplexerHandle = record ? record->getMultiplexerHandle() : "";
  if (detached && !multiplexerHandle.empty()) {
    CLOG(INFO, "stdout") << endl
                         << "Detached from " << id << ", tmux session "
                         << multiplexerHandle << " keeps running." << endl;
  } else if (detached) {
    // The process belongs to this ptydock and ends with it
    CLOG(INFO, "stdout") << endl
                         << "Left " << id
                         << ", stopping it (use --tmux to keep sessions "
                            "running after ptydock exits)."
                         << endl;
  } else {
    CLOG(INFO, "stdout") << endl
                         << "Session " << id << " exited with code "
                         << viewer->getExitCode() << "." << endl;
  }
  if (!token.empty()) {
    CLOG(INFO, "stdout") << "Resume with: ptydock --id " << id
                         << " --resume-token " << token << endl;
  }
  return 0;
}
}  // namespace

int main(int argc, char** argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  pd::HandleTerminate();

  // Override easylogging handler for sigint
  ::signal(SIGINT, pd::InterruptSignalHandler);
  ::signal(SIGPIPE, SIG_IGN);

  cxxopts::Options options("ptydock",
                           "Supervises long-running coding assistant sessions");
  try {
    options.allow_unrecognised_options();

    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("id", "Session id to start or reattach",
         cxxopts::value<string>()->default_value(""))  //
        ("cwd", "Working directory of the session",
         cxxopts::value<string>()->default_value(""))  //
        ("background", "Run as a background session")  //
        ("resume-token", "Resume this assistant conversation",
         cxxopts::value<string>()->default_value(""))  //
        ("continue", "Continue the most recent conversation")  //
        ("tmux", "Keep the session alive in tmux")             //
        ("reconnect", "tmux session to reattach to",
         cxxopts::value<string>()->default_value(""))  //
        ("bypass-permissions", "Skip the assistant's permission prompts")  //
        ("sandboxed", "Filter input for prompt injection")                 //
        ("owner", "Owner id of the session",
         cxxopts::value<string>()->default_value(""))  //
        ("project", "Project label of the session",
         cxxopts::value<string>()->default_value(""))  //
        ("list", "List known sessions")                //
        ("stop", "Stop the session with this id",
         cxxopts::value<string>()->default_value(""))  //
        ("remove", "With --stop, also forget the session")            //
        ("killmux", "With --stop, also kill its tmux session")        //
        ("events", "Print the stream as server-sent events")          //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("logtostdout", "log to stdout")                    //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ;

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "ptydock version " << PD_VERSION << endl;
      exit(0);
    }

    OrchestratorConfig config;
    if (result.count("cfgfile") && !result["cfgfile"].as<string>().empty()) {
      string cfgfilename = result["cfgfile"].as<string>();
      if (!config.loadFromFile(cfgfilename)) {
        STFATAL << "Invalid config file: " << cfgfilename;
      }
    }
    // Command line wins over the config file
    if (result.count("verbose")) {
      el::Loggers::setVerboseLevel(result["verbose"].as<int>());
    } else if (config.verboseLevel) {
      el::Loggers::setVerboseLevel(config.verboseLevel);
    }
    if (config.silent) {
      defaultConf.setGlobally(el::ConfigurationType::Enabled, "false");
    }

    bool logToStdout = result.count("logtostdout") > 0;
    string logDirectory = config.logDirectory.empty()
                              ? GetTempDirectory() + "ptydock"
                              : ExpandHome(config.logDirectory);
    LogHandler::setupLogFiles(&defaultConf, logDirectory, "ptydock",
                              logToStdout, !logToStdout, true,
                              config.logSize);
    // Reconfigure default logger to apply settings above
    el::Loggers::reconfigureLogger("default", defaultConf);
    LogHandler::setupAuditLogger(logDirectory, false);
    el::Helpers::setThreadName("ptydock-main");
    // Install log rotation callback
    el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);

    GOOGLE_PROTOBUF_VERIFY_VERSION;
    if (sodium_init() == -1) {
      STFATAL << "libsodium init failed";
    }

    SessionOrchestrator orchestrator(
        config, OrchestratorCollaborators::createDefault(config));

    int exitCode = 0;
    if (result.count("list")) {
      for (const auto& summary : orchestrator.list().sessions()) {
        CLOG(INFO, "stdout")
            << EventFormatter::dump(EventFormatter::toJson(summary)) << endl;
      }
    } else if (!result["stop"].as<string>().empty()) {
      StopRequest stopRequest;
      stopRequest.set_id(result["stop"].as<string>());
      stopRequest.set_remove_from_ledger(result.count("remove") > 0);
      stopRequest.set_kill_multiplexer(result.count("killmux") > 0);
      auto stopped = orchestrator.stop(stopRequest);
      if (stopped.has_error() && stopped.error().code() != ERR_NONE) {
        exitCode = reportError(stopped.error());
      } else {
        CLOG(INFO, "stdout") << "Stopped " << stopRequest.id() << endl;
      }
    } else {
      StartRequest request;
      if (!result["id"].as<string>().empty()) {
        request.set_id(result["id"].as<string>());
      }
      string cwd = result["cwd"].as<string>();
      if (cwd.empty()) {
        std::error_code ec;
        cwd = fs::current_path(ec).string();
      }
      request.set_working_directory(ExpandHome(cwd));
      request.set_is_background(result.count("background") > 0);
      request.set_bypass_permissions(result.count("bypass-permissions") > 0);
      request.set_continue_last(result.count("continue") > 0);
      request.set_use_multiplexer(result.count("tmux") > 0 ||
                                  !result["reconnect"].as<string>().empty());
      request.set_sandboxed(result.count("sandboxed") > 0);
      if (!result["resume-token"].as<string>().empty()) {
        request.set_resume(true);
        request.set_resume_token(result["resume-token"].as<string>());
      }
      if (!result["reconnect"].as<string>().empty()) {
        request.set_reconnect_target(result["reconnect"].as<string>());
      }
      if (!result["owner"].as<string>().empty()) {
        request.set_owner_id(result["owner"].as<string>());
      }
      if (!result["project"].as<string>().empty()) {
        request.set_project_id(result["project"].as<string>());
      }
      orchestrator.startMaintenance();
      exitCode = runInteractive(orchestrator, request,
                                result.count("events") > 0);
    }
    orchestrator.shutdown();

    // Uninstall log rotation callback
    el::Helpers::uninstallPreRollOutCallback();
    return exitCode;
  } catch (cxxopts::OptionException& oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  }
}
