#include "TunnelMessages.hpp"

#include "StructuredMessages.hpp"

namespace lt {
namespace {
const map<string, TunnelMessageType> &typesByName() {
  static const map<string, TunnelMessageType> types = {
      {"log", TunnelMessageType::Log},
      {"error", TunnelMessageType::Error},
      {"warn", TunnelMessageType::Warn},
      {"debug", TunnelMessageType::Debug},
      {"stdout", TunnelMessageType::Stdout},
      {"stderr", TunnelMessageType::Stderr},
      {"structured", TunnelMessageType::Structured},
  };
  return types;
}

bool isLogLevel(TunnelMessageType type) {
  return type == TunnelMessageType::Log || type == TunnelMessageType::Error ||
         type == TunnelMessageType::Warn || type == TunnelMessageType::Debug;
}
}  // namespace

const char *tunnelMessageTypeName(TunnelMessageType type) {
  switch (type) {
    case TunnelMessageType::Log:
      return "log";
    case TunnelMessageType::Error:
      return "error";
    case TunnelMessageType::Warn:
      return "warn";
    case TunnelMessageType::Debug:
      return "debug";
    case TunnelMessageType::Stdout:
      return "stdout";
    case TunnelMessageType::Stderr:
      return "stderr";
    case TunnelMessageType::Structured:
      return "structured";
  }
  STFATAL << "Invalid tunnel message type: " << int(type);
  return "";
}

TunnelMessage TunnelMessage::logArgs(TunnelMessageType type,
                                     const vector<string> &args) {
  if (!isLogLevel(type)) {
    STFATAL << "Not a log level: " << tunnelMessageTypeName(type);
  }
  TunnelMessage message;
  message.type = type;
  message.args = args;
  return message;
}

TunnelMessage TunnelMessage::output(TunnelMessageType type,
                                    const string &data) {
  if (type != TunnelMessageType::Stdout && type != TunnelMessageType::Stderr) {
    STFATAL << "Not an output stream: " << tunnelMessageTypeName(type);
  }
  TunnelMessage message;
  message.type = type;
  message.data = data;
  return message;
}

TunnelMessage TunnelMessage::structured(const json &structuredMessage) {
  TunnelMessage message;
  message.type = TunnelMessageType::Structured;
  message.message = structuredMessage;
  return message;
}

bool TunnelMessage::operator==(const TunnelMessage &other) const {
  return type == other.type && args == other.args && data == other.data &&
         message == other.message;
}

json tunnelMessageToJson(const TunnelMessage &message) {
  json value;
  value["type"] = tunnelMessageTypeName(message.type);
  if (isLogLevel(message.type)) {
    value["args"] = message.args;
  } else if (message.type == TunnelMessageType::Structured) {
    value["message"] = message.message;
  } else {
    value["data"] = message.data;
  }
  return value;
}

optional<TunnelMessage> tunnelMessageFromJson(const json &value) {
  if (!value.is_object()) {
    return nullopt;
  }
  auto typeIt = value.find("type");
  if (typeIt == value.end() || !typeIt->is_string()) {
    return nullopt;
  }
  auto nameIt = typesByName().find(typeIt->get<string>());
  if (nameIt == typesByName().end()) {
    return nullopt;
  }
  TunnelMessageType type = nameIt->second;

  if (isLogLevel(type)) {
    auto argsIt = value.find("args");
    if (argsIt == value.end() || !argsIt->is_array()) {
      return nullopt;
    }
    vector<string> args;
    for (const auto &arg : *argsIt) {
      if (!arg.is_string()) {
        return nullopt;
      }
      args.push_back(arg.get<string>());
    }
    return TunnelMessage::logArgs(type, args);
  }

  if (type == TunnelMessageType::Structured) {
    auto messageIt = value.find("message");
    if (messageIt == value.end() || !isValidStructuredMessage(*messageIt)) {
      return nullopt;
    }
    return TunnelMessage::structured(*messageIt);
  }

  auto dataIt = value.find("data");
  if (dataIt == value.end() || !dataIt->is_string()) {
    return nullopt;
  }
  return TunnelMessage::output(type, dataIt->get<string>());
}

ServerTunnelMessage ServerTunnelMessage::promptResponse(
    const string &requestId, const optional<json> &value,
    const optional<string> &error) {
  ServerTunnelMessage message;
  message.type = ServerTunnelMessageType::PromptResponse;
  message.requestId = requestId;
  message.value = value;
  message.error = error;
  return message;
}

ServerTunnelMessage ServerTunnelMessage::userInput(const string &content) {
  ServerTunnelMessage message;
  message.type = ServerTunnelMessageType::UserInput;
  message.content = content;
  return message;
}

json serverTunnelMessageToJson(const ServerTunnelMessage &message) {
  json value;
  if (message.type == ServerTunnelMessageType::UserInput) {
    value["type"] = "user_input";
    value["content"] = message.content;
    return value;
  }
  value["type"] = "prompt_response";
  value["requestId"] = message.requestId;
  if (message.error) {
    value["error"] = *message.error;
  } else if (message.value) {
    value["value"] = *message.value;
  }
  return value;
}

optional<ServerTunnelMessage> serverTunnelMessageFromJson(const json &value) {
  if (!value.is_object()) {
    return nullopt;
  }
  auto typeIt = value.find("type");
  if (typeIt == value.end() || !typeIt->is_string()) {
    return nullopt;
  }
  const string type = typeIt->get<string>();
  if (type == "user_input") {
    auto contentIt = value.find("content");
    if (contentIt == value.end() || !contentIt->is_string()) {
      return nullopt;
    }
    return ServerTunnelMessage::userInput(contentIt->get<string>());
  }
  if (type == "prompt_response") {
    auto requestIdIt = value.find("requestId");
    if (requestIdIt == value.end() || !requestIdIt->is_string()) {
      return nullopt;
    }
    optional<string> error;
    auto errorIt = value.find("error");
    if (errorIt != value.end()) {
      if (!errorIt->is_string()) {
        return nullopt;
      }
      error = errorIt->get<string>();
    }
    optional<json> responseValue;
    auto valueIt = value.find("value");
    if (valueIt != value.end()) {
      responseValue = *valueIt;
    }
    return ServerTunnelMessage::promptResponse(requestIdIt->get<string>(),
                                               responseValue, error);
  }
  return nullopt;
}

json makeSessionInfoMessage(const HeadlessSessionInfo &info) {
  json value;
  value["type"] = "session_info";
  value["command"] = info.command;
  if (info.planId) value["planId"] = *info.planId;
  if (info.planTitle) value["planTitle"] = *info.planTitle;
  if (info.workspacePath) value["workspacePath"] = *info.workspacePath;
  if (info.gitRemote) value["gitRemote"] = *info.gitRemote;
  if (info.terminalPaneId) value["terminalPaneId"] = *info.terminalPaneId;
  if (info.terminalType) value["terminalType"] = *info.terminalType;
  return value;
}

json makeOutputMessage(int64_t seq, const TunnelMessage &message) {
  json value;
  value["type"] = "output";
  value["seq"] = seq;
  value["message"] = tunnelMessageToJson(message);
  return value;
}

json makeReplayStartMessage() { return json{{"type", "replay_start"}}; }

json makeReplayEndMessage() { return json{{"type", "replay_end"}}; }

string formatLogArg(const json &arg) {
  if (arg.is_string()) {
    return arg.get<string>();
  }
  return dumpJson(arg);
}

vector<string> formatLogArgs(const vector<json> &args) {
  vector<string> formatted;
  for (const auto &arg : args) {
    formatted.push_back(formatLogArg(arg));
  }
  return formatted;
}

string dumpJson(const json &value) {
  return value.dump(-1, ' ', false, json::error_handler_t::replace);
}
}  // namespace lt
