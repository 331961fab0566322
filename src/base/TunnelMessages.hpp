#ifndef __LT_TUNNEL_MESSAGES__
#define __LT_TUNNEL_MESSAGES__

#include "Headers.hpp"

namespace lt {
/** @brief Kinds of frame a tunnel client sends up to its server. */
enum class TunnelMessageType {
  Log,
  Error,
  Warn,
  Debug,
  Stdout,
  Stderr,
  Structured
};

/** @brief Wire name of a message type ("log", "stdout", ...). */
const char *tunnelMessageTypeName(TunnelMessageType type);

/**
 * @brief One client->server frame.
 *
 * Only the member that matches `type` is meaningful: `args` for the four log
 * levels, `data` for stdout/stderr and `message` for structured events.
 */
struct TunnelMessage {
  TunnelMessageType type;
  vector<string> args;
  string data;
  json message;

  static TunnelMessage logArgs(TunnelMessageType type,
                               const vector<string> &args);
  static TunnelMessage output(TunnelMessageType type, const string &data);
  static TunnelMessage structured(const json &message);

  bool operator==(const TunnelMessage &other) const;
};

json tunnelMessageToJson(const TunnelMessage &message);

/**
 * @brief Validates and decodes a client->server frame.
 * @return nullopt for any shape violation: unknown type, a non-string log
 * argument, a missing `data` string, or an invalid structured event.
 */
optional<TunnelMessage> tunnelMessageFromJson(const json &value);

/** @brief Kinds of frame sent down to a client (or in from a viewer). */
enum class ServerTunnelMessageType { PromptResponse, UserInput };

struct ServerTunnelMessage {
  ServerTunnelMessageType type;
  string requestId;
  // A present error wins over any value
  optional<json> value;
  optional<string> error;
  string content;

  static ServerTunnelMessage promptResponse(const string &requestId,
                                            const optional<json> &value,
                                            const optional<string> &error);
  static ServerTunnelMessage userInput(const string &content);
};

json serverTunnelMessageToJson(const ServerTunnelMessage &message);
optional<ServerTunnelMessage> serverTunnelMessageFromJson(const json &value);

/**
 * @brief Describes the session a headless adapter streams, sent to the
 * viewer at the start of every connection.
 */
struct HeadlessSessionInfo {
  string command;
  optional<int64_t> planId;
  optional<string> planTitle;
  optional<string> workspacePath;
  optional<string> gitRemote;
  optional<string> terminalPaneId;
  optional<string> terminalType;
};

json makeSessionInfoMessage(const HeadlessSessionInfo &info);
json makeOutputMessage(int64_t seq, const TunnelMessage &message);
json makeReplayStartMessage();
json makeReplayEndMessage();

/**
 * @brief Formats one log argument the way it is carried on the wire: strings
 * pass through, everything else is rendered as compact JSON.
 */
string formatLogArg(const json &arg);
vector<string> formatLogArgs(const vector<json> &args);

/**
 * @brief Serializes a JSON value to compact text. Invalid UTF-8 is replaced
 * rather than thrown on.
 */
string dumpJson(const json &value);
}  // namespace lt

#endif  // __LT_TUNNEL_MESSAGES__
