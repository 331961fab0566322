#include "LogSink.hpp"

namespace lt {
string joinArgs(const vector<string>& args) {
  string line;
  for (size_t a = 0; a < args.size(); a++) {
    if (a) line += " ";
    line += args[a];
  }
  return line;
}

void LogSink::dispatch(const TunnelMessage& message) {
  switch (message.type) {
    case TunnelMessageType::Log:
      log(message.args);
      break;
    case TunnelMessageType::Error:
      error(message.args);
      break;
    case TunnelMessageType::Warn:
      warn(message.args);
      break;
    case TunnelMessageType::Debug:
      debug(message.args);
      break;
    case TunnelMessageType::Stdout:
      writeStdout(message.data);
      break;
    case TunnelMessageType::Stderr:
      writeStderr(message.data);
      break;
    case TunnelMessageType::Structured:
      sendStructured(message.message);
      break;
  }
}

void ConsoleLogSink::writeLine(ostream& out, const string& line) {
  lock_guard<std::mutex> guard(consoleMutex);
  out << line << endl;
}

void ConsoleLogSink::log(const vector<string>& args) {
  writeLine(cout, joinArgs(args));
}

void ConsoleLogSink::error(const vector<string>& args) {
  string line = joinArgs(args);
  LOG(ERROR) << line;
  writeLine(cerr, line);
}

void ConsoleLogSink::warn(const vector<string>& args) {
  string line = joinArgs(args);
  LOG(WARNING) << line;
  writeLine(cerr, line);
}

void ConsoleLogSink::debug(const vector<string>& args) {
  string line = joinArgs(args);
  VLOG(1) << line;
  if (showDebug) {
    writeLine(cerr, "[DEBUG] " + line);
  }
}

void ConsoleLogSink::writeStdout(const string& data) {
  lock_guard<std::mutex> guard(consoleMutex);
  cout << data << flush;
}

void ConsoleLogSink::writeStderr(const string& data) {
  lock_guard<std::mutex> guard(consoleMutex);
  cerr << data << flush;
}

void ConsoleLogSink::sendStructured(const json& message) {
  writeLine(cout, describeStructured(message));
}

string ConsoleLogSink::describeStructured(const json& message) {
  if (!message.is_object()) {
    return "[structured] " + dumpJson(message);
  }
  string type = message.value("type", string("structured"));
  // First human readable field wins
  static const vector<string> textFields = {
      "message", "text", "summary", "status", "command", "path", "content",
      "prompt",  "title"};
  for (const auto& field : textFields) {
    auto it = message.find(field);
    if (it != message.end() && it->is_string()) {
      return "[" + type + "] " + it->get<string>();
    }
  }
  if (type == "prompt_request" && message.contains("promptConfig") &&
      message["promptConfig"].is_object()) {
    return "[" + type + "] " +
           message["promptConfig"].value("message", string(""));
  }
  json rest = message;
  rest.erase("type");
  rest.erase("timestamp");
  return "[" + type + "] " + dumpJson(rest);
}
}  // namespace lt
