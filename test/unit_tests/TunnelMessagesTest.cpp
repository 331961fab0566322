#include "StructuredMessages.hpp"
#include "TestHeaders.hpp"
#include "TunnelMessages.hpp"

using namespace lt;

namespace {
json structuredEvent(const string& type) {
  json message;
  message["type"] = type;
  message["timestamp"] = "2024-05-01T12:00:00.000Z";
  return message;
}
}  // namespace

TEST_CASE("TunnelMessageDecoding", "[TunnelMessages]") {
  SECTION("Log levels carry string args") {
    for (const string type : {"log", "error", "warn", "debug"}) {
      auto message = tunnelMessageFromJson(
          json{{"type", type}, {"args", {"one", "two"}}});
      REQUIRE(message);
      REQUIRE(tunnelMessageTypeName(message->type) == type);
      REQUIRE(message->args == vector<string>{"one", "two"});
    }
  }

  SECTION("Output streams carry data") {
    auto message =
        tunnelMessageFromJson(json{{"type", "stderr"}, {"data", "oops\n"}});
    REQUIRE(message);
    REQUIRE(message->type == TunnelMessageType::Stderr);
    REQUIRE(message->data == "oops\n");
  }

  SECTION("Structured messages are validated") {
    json event = structuredEvent("llm_response");
    event["text"] = "done";
    auto message =
        tunnelMessageFromJson(json{{"type", "structured"}, {"message", event}});
    REQUIRE(message);
    REQUIRE(message->message == event);

    event.erase("text");
    REQUIRE(!tunnelMessageFromJson(
        json{{"type", "structured"}, {"message", event}}));
  }

  SECTION("Shape violations are rejected") {
    REQUIRE(!tunnelMessageFromJson(json::array()));
    REQUIRE(!tunnelMessageFromJson(json{{"args", json::array()}}));
    REQUIRE(!tunnelMessageFromJson(json{{"type", "shout"}, {"args", {"x"}}}));
    REQUIRE(!tunnelMessageFromJson(json{{"type", "log"}, {"args", {1, 2}}}));
    REQUIRE(!tunnelMessageFromJson(json{{"type", "log"}, {"args", "x"}}));
    REQUIRE(!tunnelMessageFromJson(json{{"type", "stdout"}}));
    REQUIRE(!tunnelMessageFromJson(json{{"type", "stdout"}, {"data", 5}}));
  }
}

TEST_CASE("TunnelMessageEncoding", "[TunnelMessages]") {
  REQUIRE(tunnelMessageToJson(
              TunnelMessage::logArgs(TunnelMessageType::Warn, {"careful"})) ==
          json{{"type", "warn"}, {"args", {"careful"}}});
  REQUIRE(tunnelMessageToJson(
              TunnelMessage::output(TunnelMessageType::Stdout, "out")) ==
          json{{"type", "stdout"}, {"data", "out"}});

  TunnelMessage original =
      TunnelMessage::logArgs(TunnelMessageType::Error, {"a", "b"});
  auto decoded = tunnelMessageFromJson(tunnelMessageToJson(original));
  REQUIRE(decoded);
  REQUIRE(*decoded == original);
}

TEST_CASE("ServerTunnelMessages", "[TunnelMessages]") {
  SECTION("Prompt responses") {
    auto response = serverTunnelMessageFromJson(
        json{{"type", "prompt_response"}, {"requestId", "r1"}, {"value", 3}});
    REQUIRE(response);
    REQUIRE(response->type == ServerTunnelMessageType::PromptResponse);
    REQUIRE(response->requestId == "r1");
    REQUIRE(*response->value == 3);
    REQUIRE(!response->error);

    auto failure = serverTunnelMessageFromJson(json{
        {"type", "prompt_response"}, {"requestId", "r1"}, {"error", "nope"}});
    REQUIRE(failure);
    REQUIRE(*failure->error == "nope");

    REQUIRE(!serverTunnelMessageFromJson(json{{"type", "prompt_response"}}));
    REQUIRE(!serverTunnelMessageFromJson(
        json{{"type", "prompt_response"}, {"requestId", "r1"}, {"error", 1}}));
  }

  SECTION("An error wins over a value when encoding") {
    json encoded = serverTunnelMessageToJson(
        ServerTunnelMessage::promptResponse("r2", json(true), string("bad")));
    REQUIRE(encoded ==
            json{{"type", "prompt_response"}, {"requestId", "r2"},
                 {"error", "bad"}});
  }

  SECTION("User input") {
    auto input = serverTunnelMessageFromJson(
        json{{"type", "user_input"}, {"content", "hi"}});
    REQUIRE(input);
    REQUIRE(input->content == "hi");
    REQUIRE(serverTunnelMessageToJson(*input) ==
            json{{"type", "user_input"}, {"content", "hi"}});
    REQUIRE(!serverTunnelMessageFromJson(json{{"type", "user_input"}}));
    REQUIRE(!serverTunnelMessageFromJson(json{{"type", "other"}}));
  }
}

TEST_CASE("HeadlessEnvelopes", "[TunnelMessages]") {
  HeadlessSessionInfo info;
  info.command = "agent";
  info.gitRemote = string("github.com/owner/repo");
  REQUIRE(makeSessionInfoMessage(info) ==
          json{{"type", "session_info"},
               {"command", "agent"},
               {"gitRemote", "github.com/owner/repo"}});

  json output = makeOutputMessage(
      7, TunnelMessage::output(TunnelMessageType::Stdout, "x"));
  REQUIRE(output == json{{"type", "output"},
                         {"seq", 7},
                         {"message", {{"type", "stdout"}, {"data", "x"}}}});
  REQUIRE(makeReplayStartMessage() == json{{"type", "replay_start"}});
  REQUIRE(makeReplayEndMessage() == json{{"type", "replay_end"}});
}

TEST_CASE("FormatLogArgs", "[TunnelMessages]") {
  REQUIRE(formatLogArg(json("plain")) == "plain");
  REQUIRE(formatLogArg(json(42)) == "42");
  REQUIRE(formatLogArg(json(nullptr)) == "null");
  REQUIRE(formatLogArg(json{{"a", 1}}) == "{\"a\":1}");
  REQUIRE(formatLogArgs({json("x"), json(true)}) ==
          vector<string>{"x", "true"});
  // Invalid UTF-8 is replaced rather than thrown on
  REQUIRE_NOTHROW(dumpJson(json(string("\xff\xfe"))));
}

TEST_CASE("StructuredMessageValidation", "[StructuredMessages]") {
  SECTION("Every known type is recognized") {
    REQUIRE(STRUCTURED_MESSAGE_TYPES.size() == 30);
    for (const auto& type : STRUCTURED_MESSAGE_TYPES) {
      REQUIRE(isKnownStructuredMessageType(type));
    }
    REQUIRE(!isKnownStructuredMessageType("session_info"));
  }

  SECTION("Envelope fields") {
    json event = structuredEvent("input_required");
    REQUIRE(isValidStructuredMessage(event));
    event.erase("timestamp");
    REQUIRE(!isValidStructuredMessage(event));
    REQUIRE(!isValidStructuredMessage(structuredEvent("not_a_type")));
    REQUIRE(!isValidStructuredMessage(json("input_required")));
  }

  SECTION("Required and optional fields") {
    json event = structuredEvent("command_result");
    REQUIRE(!isValidStructuredMessage(event));
    event["exitCode"] = 0;
    REQUIRE(isValidStructuredMessage(event));
    event["stdout"] = 12;
    REQUIRE(!isValidStructuredMessage(event));
    event["stdout"] = "ok";
    // Extra fields are tolerated
    event["extra"] = json::array();
    REQUIRE(isValidStructuredMessage(event));
  }

  SECTION("Nested items") {
    json todo = structuredEvent("todo_update");
    todo["items"] = json::array({{{"label", "write"}, {"status", "done"}}});
    REQUIRE(isValidStructuredMessage(todo));
    todo["items"].push_back(json{{"label", "test"}});
    REQUIRE(!isValidStructuredMessage(todo));
  }

  SECTION("Prompt requests") {
    json request = makePromptRequestMessage(
        "r1", "select",
        json{{"message", "Pick"},
             {"choices", {{{"name", "A"}, {"value", "a"}}}}},
        5000);
    REQUIRE(isValidStructuredMessage(request));
    REQUIRE(request["timeoutMs"] == 5000);
    REQUIRE(!makePromptRequestMessage("r1", "input", json{{"message", "x"}})
                 .contains("timeoutMs"));

    request["promptType"] = "radio";
    REQUIRE(!isValidStructuredMessage(request));
    request["promptType"] = "select";
    request["promptConfig"]["choices"][0].erase("value");
    REQUIRE(!isValidStructuredMessage(request));
  }

  SECTION("Prompt answers") {
    json answered =
        makePromptAnsweredMessage("r1", "confirm", json(true), "websocket");
    REQUIRE(isValidStructuredMessage(answered));
    REQUIRE(answered["value"] == true);
    answered["source"] = "carrier pigeon";
    REQUIRE(!isValidStructuredMessage(answered));
  }
}
