#include <cxxopts.hpp>

#include "LogHandler.hpp"
#include "LoggingContext.hpp"
#include "PipeSocketHandler.hpp"
#include "PromptHandler.hpp"
#include "StructuredMessages.hpp"
#include "TunnelMessages.hpp"

using namespace lt;

namespace {
string readAllStdin() {
  string data;
  char buf[4096];
  while (true) {
    ssize_t bytesRead = ::read(STDIN_FILENO, buf, sizeof(buf));
    if (bytesRead < 0 && GetErrno() == EINTR) {
      continue;
    }
    if (bytesRead <= 0) {
      break;
    }
    data.append(buf, bytesRead);
  }
  return data;
}

json parseLooseValue(const string& text) {
  json value = json::parse(text, nullptr, false);
  if (value.is_discarded()) {
    return text;
  }
  return value;
}

json buildPromptConfig(const string& promptType,
                       const cxxopts::ParseResult& result) {
  json config = json::object();
  config["message"] = result["message"].as<string>();
  if (result.count("default")) {
    string defaultText = result["default"].as<string>();
    if (promptType == "input") {
      config["default"] = defaultText;
    } else {
      config["default"] = parseLooseValue(defaultText);
    }
  }
  if (result.count("choice")) {
    json choices = json::array();
    for (const auto& choiceText : result["choice"].as<vector<string>>()) {
      json choice = json::object();
      auto equals = choiceText.find('=');
      if (equals == string::npos) {
        choice["name"] = choiceText;
        choice["value"] = choiceText;
      } else {
        choice["name"] = choiceText.substr(0, equals);
        choice["value"] = parseLooseValue(choiceText.substr(equals + 1));
      }
      choices.push_back(choice);
    }
    config["choices"] = choices;
  }
  if (result.count("hint")) {
    config["validationHint"] = result["hint"].as<string>();
  }
  return config;
}

int sendPrompt(shared_ptr<LoggingContext> context,
               const cxxopts::ParseResult& result) {
  string promptType = result["prompt"].as<string>();
  int64_t timeoutMs = result["timeout"].as<int64_t>();
  json request =
      makePromptRequestMessage(genRandomAlphaNum(16), promptType,
                               buildPromptConfig(promptType, result), timeoutMs);
  if (!isValidStructuredMessage(request)) {
    CLOG(INFO, "stdout") << "Invalid prompt: " << dumpJson(request) << endl;
    return 2;
  }

  auto handler = make_shared<PromptHandler>(
      TerminalPromptConsole::openControllingTerminal(),
      context->getTunnelClient(), shared_ptr<HeadlessAdapter>(),
      context->getSink());
  ServerTunnelMessage response = handler->answer(request);
  handler->shutdown();
  if (response.error) {
    cerr << "Prompt failed: " << *response.error << endl;
    return 1;
  }
  json value = response.value ? *response.value : json();
  if (value.is_string()) {
    cout << value.get<string>() << endl;
  } else {
    cout << dumpJson(value) << endl;
  }
  return 0;
}

int sendOutput(shared_ptr<LoggingContext> context,
               const cxxopts::ParseResult& result) {
  string type = result["type"].as<string>();
  vector<string> args;
  if (result.count("args")) {
    args = result["args"].as<vector<string>>();
  }
  shared_ptr<LogSink> sink = context->getSink();

  if (type == "stdout" || type == "stderr") {
    string data = args.empty() ? readAllStdin() : joinArgs(args) + "\n";
    if (type == "stdout") {
      sink->writeStdout(data);
    } else {
      sink->writeStderr(data);
    }
    return 0;
  }

  if (type == "structured") {
    string text = args.empty() ? readAllStdin() : joinArgs(args);
    json message = json::parse(text, nullptr, false);
    if (message.is_object() && !message.contains("timestamp")) {
      message["timestamp"] = isoTimestamp();
    }
    if (message.is_discarded() || !isValidStructuredMessage(message)) {
      CLOG(INFO, "stdout") << "Invalid structured message: " << text << endl;
      return 2;
    }
    sink->sendStructured(message);
    return 0;
  }

  if (result.count("json")) {
    vector<json> values;
    for (const auto& arg : args) {
      values.push_back(parseLooseValue(arg));
    }
    args = formatLogArgs(values);
  }
  if (type == "log") {
    sink->log(args);
  } else if (type == "error") {
    sink->error(args);
  } else if (type == "warn") {
    sink->warn(args);
  } else if (type == "debug") {
    sink->debug(args);
  } else {
    CLOG(INFO, "stdout") << "Unknown message type: " << type << endl;
    return 2;
  }
  return 0;
}
}  // namespace

int main(int argc, char** argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  lt::HandleTerminate();
  ::signal(SIGPIPE, SIG_IGN);

  cxxopts::Options options(
      "ltsend", "Send output or a prompt through the enclosing lthost");
  int exitCode = 1;
  try {
    options.positional_help("[args...]");
    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("t,type",
         "Message type: log, error, warn, debug, stdout, stderr or structured",
         cxxopts::value<std::string>()->default_value("log"))  //
        ("json", "Parse each argument as JSON before formatting it")  //
        ("prompt", "Ask a prompt: confirm, input, select or checkbox",
         cxxopts::value<std::string>())  //
        ("message", "Prompt message",
         cxxopts::value<std::string>()->default_value(""))  //
        ("default", "Prompt default value", cxxopts::value<std::string>())  //
        ("choice", "Prompt choice as name=value, may be repeated",
         cxxopts::value<std::vector<std::string>>())  //
        ("hint", "Hint shown with an input prompt",
         cxxopts::value<std::string>())  //
        ("timeout", "Prompt timeout in milliseconds, 0 waits forever",
         cxxopts::value<int64_t>()->default_value("0"))  //
        ("show-debug", "Print debug output on the console")  //
        ("logtostdout", "log to stdout")                     //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ("args", "Message arguments",
         cxxopts::value<std::vector<std::string>>())  //
        ;
    options.parse_positional({"args"});

    auto result = options.parse(argc, argv);
    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "ltsend version " << LT_VERSION << endl;
      exit(0);
    }

    LogHandler::setupProcessLogging(&defaultConf, "ltsend",
                                    result.count("logtostdout") > 0,
                                    result["verbose"].as<int>(), "ltsend-main");
    if (sodium_init() == -1) {
      STFATAL << "libsodium init failed";
    }

    auto context = LoggingContext::fromEnvironment(
        make_shared<PipeSocketHandler>(), result.count("show-debug") > 0);
    if (result.count("prompt")) {
      exitCode = sendPrompt(context, result);
    } else {
      exitCode = sendOutput(context, result);
    }
    context->shutdown();
  } catch (cxxopts::OptionException& oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  } catch (const std::runtime_error& re) {
    STERROR << "ltsend failed: " << re.what();
    CLOG(INFO, "stdout") << "Error: " << re.what() << endl;
    exitCode = 1;
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
  return exitCode;
}
