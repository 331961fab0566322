#include "PromptHandler.hpp"

#include "FakeHeadlessTransport.hpp"
#include "RecordingLogSink.hpp"
#include "StructuredMessages.hpp"
#include "TestHeaders.hpp"

using namespace lt;

namespace {
/**
 * @brief Console that answers after a delay, fails, or waits until it is
 * cancelled or times out.
 */
class ScriptedPromptConsole : public PromptConsole {
 public:
  ScriptedPromptConsole() : answerDelayMs(-1), asked(0) {}

  virtual json ask(const json& promptRequest,
                   shared_ptr<PromptCancellation> cancellation) {
    asked++;
    if (failure) {
      throw std::runtime_error(*failure);
    }
    int64_t answerAt = answerDelayMs >= 0 ? nowMs() + answerDelayMs : 0;
    while (true) {
      if (answer && answerDelayMs >= 0 && nowMs() >= answerAt) {
        return *answer;
      }
      if (cancellation->cancelled) {
        throw PromptCancelledError("Prompt cancelled");
      }
      if (cancellation->expired()) {
        throw PromptTimeoutError("Prompt aborted: no answer within " +
                                 to_string(cancellation->timeoutMs) + "ms");
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
  }

  optional<json> answer;
  // Negative never answers
  int64_t answerDelayMs;
  optional<string> failure;
  atomic<int> asked;
};

json confirmRequest(const string& requestId, int64_t timeoutMs = 0) {
  return makePromptRequestMessage(requestId, "confirm",
                                  json{{"message", "Proceed?"}}, timeoutMs);
}

// Gives the handler time to register its viewer waiter first
void deliverLater(shared_ptr<FakeHeadlessConnection> connection,
                  const string& response) {
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  connection->deliver(response);
}
}  // namespace

TEST_CASE("PromptHandlerConsoleOnly", "[PromptHandler]") {
  auto console = make_shared<ScriptedPromptConsole>();
  auto sink = make_shared<RecordingLogSink>();
  auto handler = make_shared<PromptHandler>(console, shared_ptr<TunnelClient>(),
                                            shared_ptr<HeadlessAdapter>(), sink);

  SECTION("The console answer is returned") {
    console->answer = json(true);
    console->answerDelayMs = 0;
    auto response = handler->answer(confirmRequest("r1"));
    REQUIRE(response.type == ServerTunnelMessageType::PromptResponse);
    REQUIRE(response.requestId == "r1");
    REQUIRE(*response.value == true);
    REQUIRE(!response.error);
    // Only a raced answer is announced
    REQUIRE(sink->count() == 0);
  }

  SECTION("Console failures become response errors") {
    console->failure = string("No terminal");
    auto response = handler->answer(confirmRequest("r1"));
    REQUIRE(!response.value);
    REQUIRE(*response.error == "No terminal");
  }

  SECTION("Timeouts become response errors") {
    auto response = handler->answer(confirmRequest("r1", 100));
    REQUIRE(response.error);
    REQUIRE(response.error->find("no answer within 100ms") != string::npos);
  }

  handler->shutdown();
}

TEST_CASE("PromptHandlerRacesViewer", "[PromptHandler]") {
  auto console = make_shared<ScriptedPromptConsole>();
  auto sink = make_shared<RecordingLogSink>();
  auto transport = make_shared<FakeHeadlessTransport>();
  auto adapter = HeadlessAdapter::create("ws://viewer.test/lt-agent",
                                         HeadlessSessionInfo(), sink, transport,
                                         HeadlessAdapterOptions());
  adapter->log({"connect"});
  auto connection = transport->latest();
  connection->acceptOpen();
  auto handler =
      make_shared<PromptHandler>(console, shared_ptr<TunnelClient>(), adapter,
                                 adapter);

  SECTION("The viewer answers first") {
    thread viewer(deliverLater, connection,
                  R"({"type":"prompt_response","requestId":"r1","value":false})");
    auto response = handler->answer(confirmRequest("r1"));
    viewer.join();
    REQUIRE(*response.value == false);
    // The terminal prompt was withdrawn
    REQUIRE(console->asked.load() == 1);

    auto messages = sink->getMessages();
    REQUIRE(messages.back().type == TunnelMessageType::Structured);
    json answered = messages.back().message;
    REQUIRE(answered["type"] == "prompt_answered");
    REQUIRE(answered["requestId"] == "r1");
    REQUIRE(answered["promptType"] == "confirm");
    REQUIRE(answered["value"] == false);
    REQUIRE(answered["source"] == "websocket");
    REQUIRE(isValidStructuredMessage(answered));
  }

  SECTION("The terminal answers first") {
    console->answer = json(true);
    console->answerDelayMs = 50;
    auto response = handler->answer(confirmRequest("r1"));
    REQUIRE(*response.value == true);
    auto messages = sink->getMessages();
    REQUIRE(messages.back().message["source"] == "terminal");

    // The viewer's late answer is ignored
    connection->deliver(
        R"({"type":"prompt_response","requestId":"r1","value":false})");
    REQUIRE(adapter->getState() == HeadlessConnectionState::Connected);
  }

  SECTION("A broken terminal still lets the viewer answer") {
    console->failure = string("Prompt input closed");
    thread viewer(deliverLater, connection,
                  R"({"type":"prompt_response","requestId":"r1","value":true})");
    auto response = handler->answer(confirmRequest("r1"));
    viewer.join();
    REQUIRE(*response.value == true);
    REQUIRE(sink->getMessages().back().message["source"] == "websocket");
  }

  SECTION("Nobody answers before the timeout") {
    size_t before = sink->count();
    auto response = handler->answer(confirmRequest("r1", 100));
    REQUIRE(response.error);
    REQUIRE(response.error->find("100ms") != string::npos);
    REQUIRE(sink->count() == before);
  }

  SECTION("Shutting the adapter down leaves the terminal") {
    console->answer = json(true);
    console->answerDelayMs = 200;
    thread stopper([adapter]() {
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
      adapter->destroySync();
    });
    auto response = handler->answer(confirmRequest("r1"));
    stopper.join();
    REQUIRE(*response.value == true);
  }

  handler->shutdown();
  adapter->destroySync();
}

TEST_CASE("PromptHandlerAsync", "[PromptHandler]") {
  auto console = make_shared<ScriptedPromptConsole>();
  auto sink = make_shared<RecordingLogSink>();
  auto handler = make_shared<PromptHandler>(console, shared_ptr<TunnelClient>(),
                                            shared_ptr<HeadlessAdapter>(), sink);

  SECTION("Answers arrive through the responder") {
    console->answer = json("blue");
    console->answerDelayMs = 10;
    std::promise<ServerTunnelMessage> delivered;
    handler->handleAsync(confirmRequest("r1"),
                         [&delivered](const ServerTunnelMessage& response) {
                           delivered.set_value(response);
                           return true;
                         });
    auto future = delivered.get_future();
    REQUIRE(future.wait_for(std::chrono::seconds(5)) ==
            std::future_status::ready);
    REQUIRE(*future.get().value == "blue");
    handler->shutdown();
  }

  SECTION("Finished workers do not accumulate") {
    console->answer = json(true);
    console->answerDelayMs = 0;
    atomic<int> answered(0);
    PromptResponder count = [&answered](const ServerTunnelMessage& response) {
      answered++;
      return true;
    };
    for (int a = 0; a < 5; a++) {
      handler->handleAsync(confirmRequest("r" + to_string(a)), count);
    }
    int64_t deadline = nowMs() + 5000;
    while ((answered < 5 || handler->workerCount() > 0) && nowMs() < deadline) {
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    REQUIRE(answered == 5);
    REQUIRE(handler->workerCount() == 0);

    // Later requests still get a worker of their own
    handler->handleAsync(confirmRequest("r5"), count);
    REQUIRE(handler->workerCount() <= 1);
    deadline = nowMs() + 5000;
    while (answered < 6 && nowMs() < deadline) {
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    REQUIRE(answered == 6);
    handler->shutdown();
    REQUIRE(handler->workerCount() == 0);
  }

  SECTION("Shutdown cancels prompts in progress") {
    std::promise<ServerTunnelMessage> delivered;
    handler->handleAsync(confirmRequest("r1"),
                         [&delivered](const ServerTunnelMessage& response) {
                           delivered.set_value(response);
                           return false;
                         });
    while (console->asked == 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    handler->shutdown();
    auto response = delivered.get_future().get();
    REQUIRE(*response.error == "Prompt cancelled");

    // Requests after shutdown are refused right away
    bool refused = false;
    handler->handleAsync(confirmRequest("r2"),
                         [&refused](const ServerTunnelMessage& response) {
                           refused = bool(response.error);
                           return true;
                         });
    REQUIRE(refused);
  }
}
