#include <cxxopts.hpp>

#include "ChildProcess.hpp"
#include "HeadlessAdapter.hpp"
#include "HeadlessConfig.hpp"
#include "LogHandler.hpp"
#include "LoggingContext.hpp"
#include "PipeSocketHandler.hpp"
#include "PromptHandler.hpp"
#include "SimpleIni.h"
#include "SubprocessUtils.hpp"
#include "TunnelServer.hpp"
#include "WebSocketTransport.hpp"

using namespace lt;

namespace {
void removeEndpointDirectory(const SocketEndpoint& endpoint) {
  std::error_code ec;
  fs::remove_all(fs::path(endpoint.getName()).parent_path(), ec);
  if (ec) {
    LOG(WARNING) << "Could not remove tunnel directory for " << endpoint << ": "
                 << ec.message();
  }
}
}  // namespace

int main(int argc, char** argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  lt::HandleTerminate();
  ::signal(SIGPIPE, SIG_IGN);

  cxxopts::Options options("lthost",
                           "Run a command and collect the output of every "
                           "process it spawns");
  int exitCode = 1;
  try {
    options.positional_help("[--] command [args...]");
    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("headless", "Mirror output to a headless viewer")  //
        ("headless-url", "Websocket url of the headless viewer",
         cxxopts::value<std::string>())  //
        ("name", "Command name reported to the headless viewer",
         cxxopts::value<std::string>())  //
        ("plan-id", "Plan id reported to the headless viewer",
         cxxopts::value<int64_t>())  //
        ("plan-title", "Plan title reported to the headless viewer",
         cxxopts::value<std::string>())  //
        ("capture", "Capture the command's stdout and stderr")  //
        ("show-debug", "Print debug output on the console")     //
        ("logtostdout", "log to stdout")                        //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ("command", "Command to run",
         cxxopts::value<std::vector<std::string>>())  //
        ;
    options.parse_positional({"command"});

    auto result = options.parse(argc, argv);
    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "lthost version " << LT_VERSION << endl;
      exit(0);
    }
    if (!result.count("command")) {
      CLOG(INFO, "stdout") << "No command given" << endl
                           << options.help({}) << endl;
      exit(1);
    }
    vector<string> command = result["command"].as<vector<string>>();

    HeadlessConfig headlessConfig;
    int verbose = 0;
    string cfgfilename = result["cfgfile"].as<string>();
    if (!cfgfilename.empty()) {
      // Load the config file
      CSimpleIniA ini(true, false, false);
      SI_Error rc = ini.LoadFile(cfgfilename.c_str());
      if (rc == 0) {
        headlessConfig = HeadlessConfig::fromIni(ini);
        const char* vlevel = ini.GetValue("Debug", "verbose", NULL);
        if (vlevel) {
          verbose = atoi(vlevel);
        }
      } else {
        STFATAL << "Invalid config file: " << cfgfilename;
      }
    }
    // Command line options override the config file
    if (result.count("verbose")) {
      verbose = result["verbose"].as<int>();
    }
    if (result.count("headless")) {
      headlessConfig.enabled = true;
    }
    if (result.count("headless-url")) {
      headlessConfig.url = result["headless-url"].as<string>();
    }

    LogHandler::setupProcessLogging(&defaultConf, "lthost",
                                    result.count("logtostdout") > 0, verbose,
                                    "lthost-main");

    if (sodium_init() == -1) {
      STFATAL << "libsodium init failed";
    }

    shared_ptr<PipeSocketHandler> socketHandler(new PipeSocketHandler());
    bool showDebug = result.count("show-debug") > 0;
    auto loggingContext =
        LoggingContext::fromEnvironment(socketHandler, showDebug);
    shared_ptr<LogSink> sink = loggingContext->getSink();

    // Only the outermost host talks to the viewer
    shared_ptr<HeadlessAdapter> headless;
    if (headlessConfig.enabled && !loggingContext->isTunneled()) {
      string url = resolveHeadlessUrl(headlessConfig.url);
      string name = result.count("name") ? result["name"].as<string>()
                                         : fs::path(command[0]).filename().string();
      optional<int64_t> planId;
      if (result.count("plan-id")) {
        planId = result["plan-id"].as<int64_t>();
      }
      optional<string> planTitle;
      if (result.count("plan-title")) {
        planTitle = result["plan-title"].as<string>();
      }
      auto sessionInfo = buildHeadlessSessionInfo(
          name, planId, planTitle, make_shared<SubprocessUtils>());
      headless = HeadlessAdapter::create(url, sessionInfo, sink,
                                         make_shared<WebSocketTransport>(),
                                         headlessConfig.adapterOptions);
      sink = headless;
      LOG(INFO) << "Mirroring output to " << url;
    } else if (headlessConfig.enabled) {
      VLOG(1) << "Running under another host, headless output is left to it";
    }

    auto promptHandler = make_shared<PromptHandler>(
        TerminalPromptConsole::openControllingTerminal(),
        loggingContext->getTunnelClient(), headless, sink);

    SocketEndpoint endpoint = createPrivateEndpoint("lthost");
    TunnelServerHandlers handlers;
    handlers.onPromptRequest = [promptHandler](const json& promptRequest,
                                               PromptResponder respond) {
      promptHandler->handleAsync(promptRequest, respond);
    };
    auto server =
        make_shared<TunnelServer>(socketHandler, endpoint, sink, handlers);

    // Text typed into the viewer or sent down by a parent reaches every child
    weak_ptr<TunnelServer> weakServer = server;
    UserInputHandler forwardInput = [weakServer](const string& content) {
      auto lockedServer = weakServer.lock();
      if (lockedServer) {
        lockedServer->broadcastUserInput(content);
      }
    };
    if (headless) {
      headless->setUserInputHandler(forwardInput);
    }
    if (loggingContext->getTunnelClient()) {
      loggingContext->getTunnelClient()->setUserInputHandler(forwardInput);
    }

    map<string, string> childEnvironment;
    childEnvironment[LT_OUTPUT_SOCKET_ENV] = endpoint.getName();
    ChildProcess child(command, childEnvironment,
                       result.count("capture") ? sink : shared_ptr<LogSink>());
    // The child gets the terminal's interrupts; the host outlives it
    ::signal(SIGINT, SIG_IGN);
    child.start();
    exitCode = child.wait();

    server->close();
    removeEndpointDirectory(endpoint);
    if (headless) {
      headless->destroy();
    }
    loggingContext->shutdown();
    promptHandler->shutdown();
  } catch (cxxopts::OptionException& oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  } catch (const std::runtime_error& re) {
    STERROR << "lthost failed: " << re.what();
    CLOG(INFO, "stdout") << "Error: " << re.what() << endl;
    exitCode = 1;
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
  return exitCode;
}
