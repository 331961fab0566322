#include "PromptConsole.hpp"

#include "StructuredMessages.hpp"
#include "TestHeaders.hpp"

using namespace lt;

namespace {
/**
 * @brief A TerminalPromptConsole wired to pipes the test types into and
 * reads the questions from.
 */
class PipeConsole {
 public:
  PipeConsole() {
    FATAL_FAIL(pipe(inPipe));
    FATAL_FAIL(pipe(outPipe));
    int flags = fcntl(outPipe[0], F_GETFL, 0);
    FATAL_FAIL(fcntl(outPipe[0], F_SETFL, flags | O_NONBLOCK));
    console.reset(new TerminalPromptConsole(inPipe[0], outPipe[1]));
  }

  ~PipeConsole() {
    console.reset();
    for (int fd : {inPipe[0], inPipe[1], outPipe[0], outPipe[1]}) {
      if (fd >= 0) {
        ::close(fd);
      }
    }
  }

  void type(const string& text) {
    REQUIRE(::write(inPipe[1], text.data(), text.size()) ==
            ssize_t(text.size()));
  }

  void closeInput() {
    ::close(inPipe[1]);
    inPipe[1] = -1;
  }

  string shown() {
    string output;
    char buf[1024];
    while (true) {
      ssize_t bytesRead = ::read(outPipe[0], buf, sizeof(buf));
      if (bytesRead <= 0) {
        break;
      }
      output.append(buf, bytesRead);
    }
    return output;
  }

  json ask(const string& promptType, const json& config,
           int64_t timeoutMs = 0) {
    json request = makePromptRequestMessage("req", promptType, config);
    return console->ask(request, make_shared<PromptCancellation>(timeoutMs));
  }

  int inPipe[2];
  int outPipe[2];
  shared_ptr<TerminalPromptConsole> console;
};
}  // namespace

TEST_CASE("TerminalPromptConsoleConfirm", "[PromptConsole]") {
  PipeConsole pipes;

  SECTION("Explicit answers") {
    pipes.type("yes\nN\n");
    REQUIRE(pipes.ask("confirm", json{{"message", "Continue?"}}) == true);
    REQUIRE(pipes.ask("confirm", json{{"message", "Continue?"}}) == false);
    REQUIRE(pipes.shown().find("Continue? (Y/n)") != string::npos);
  }

  SECTION("Empty answers take the default") {
    pipes.type("\n\n");
    REQUIRE(pipes.ask("confirm", json{{"message", "Go?"}}) == true);
    REQUIRE(pipes.ask("confirm", json{{"message", "Go?"}, {"default", false}}) ==
            false);
    REQUIRE(pipes.shown().find("Go? (y/N)") != string::npos);
  }

  SECTION("Unclear answers are asked again") {
    pipes.type("maybe\r\nn\n");
    REQUIRE(pipes.ask("confirm", json{{"message", "Go?"}}) == false);
    REQUIRE(pipes.shown().find("Please answer y or n.") != string::npos);
  }
}

TEST_CASE("TerminalPromptConsoleInput", "[PromptConsole]") {
  PipeConsole pipes;
  pipes.type("typed text\n\n");
  json config = {{"message", "Name"},
                 {"default", "anon"},
                 {"validationHint", "letters only"}};
  REQUIRE(pipes.ask("input", config) == "typed text");
  REQUIRE(pipes.ask("input", config) == "anon");
  REQUIRE(pipes.shown().find("Name (anon) [letters only]") != string::npos);

  // Without a default an empty answer stays empty
  pipes.type("\n");
  REQUIRE(pipes.ask("input", json{{"message", "Name"}}) == "");
}

TEST_CASE("TerminalPromptConsoleSelect", "[PromptConsole]") {
  PipeConsole pipes;
  json config = {{"message", "Pick a color"},
                 {"default", "green"},
                 {"choices",
                  {{{"name", "Red"}, {"value", "red"}},
                   {{"name", "Green"}, {"value", "green"},
                    {"description", "calm"}},
                   {{"name", "Blue"}, {"value", "blue"}}}}};

  SECTION("A number picks the choice") {
    pipes.type("3\n");
    REQUIRE(pipes.ask("select", config) == "blue");
    string shown = pipes.shown();
    REQUIRE(shown.find("2) Green - calm") != string::npos);
    REQUIRE(shown.find("Choose 1-3 (2)") != string::npos);
  }

  SECTION("Empty picks the default") {
    pipes.type("\n");
    REQUIRE(pipes.ask("select", config) == "green");
  }

  SECTION("Out of range numbers are asked again") {
    pipes.type("7\nred\n1\n");
    REQUIRE(pipes.ask("select", config) == "red");
  }

  SECTION("No choices") {
    REQUIRE_THROWS_WITH(pipes.ask("select", json{{"message", "Pick"}}),
                        "Select prompt has no choices");
  }
}

TEST_CASE("TerminalPromptConsoleCheckbox", "[PromptConsole]") {
  PipeConsole pipes;
  json config = {{"message", "Features"},
                 {"choices",
                  {{{"name", "Logs"}, {"value", "logs"}, {"checked", true}},
                   {{"name", "Metrics"}, {"value", "metrics"}},
                   {{"name", "Traces"}, {"value", 3}, {"checked", true}}}}};

  SECTION("Empty keeps the checked choices") {
    pipes.type("\n");
    REQUIRE(pipes.ask("checkbox", config) == json::array({"logs", 3}));
    REQUIRE(pipes.shown().find("1) [x] Logs") != string::npos);
  }

  SECTION("Numbers replace the selection") {
    pipes.type("2, 1\n");
    REQUIRE(pipes.ask("checkbox", config) == json::array({"logs", "metrics"}));
  }

  SECTION("Invalid numbers are asked again") {
    pipes.type("1,9\n2\n");
    REQUIRE(pipes.ask("checkbox", config) == json::array({"metrics"}));
  }
}

TEST_CASE("TerminalPromptConsoleFailures", "[PromptConsole]") {
  PipeConsole pipes;

  SECTION("Unknown prompt type") {
    json request = makePromptRequestMessage("req", "input", json{{"message", "x"}});
    request["promptType"] = "slider";
    REQUIRE_THROWS_WITH(
        pipes.console->ask(request, make_shared<PromptCancellation>()),
        "Unsupported prompt type: slider");
  }

  SECTION("Timeout") {
    int64_t start = nowMs();
    REQUIRE_THROWS_AS(pipes.ask("input", json{{"message", "Name"}}, 100),
                      PromptTimeoutError);
    REQUIRE(nowMs() - start >= 100);
  }

  SECTION("Cancellation") {
    auto cancellation = make_shared<PromptCancellation>();
    thread canceller([cancellation]() {
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
      cancellation->cancelled = true;
    });
    json request =
        makePromptRequestMessage("req", "input", json{{"message", "Name"}});
    REQUIRE_THROWS_AS(pipes.console->ask(request, cancellation),
                      PromptCancelledError);
    canceller.join();
  }

  SECTION("Closed input") {
    pipes.closeInput();
    REQUIRE_THROWS_WITH(pipes.ask("input", json{{"message", "Name"}}),
                        "Prompt input closed");
  }

  SECTION("A final line without a newline is still an answer") {
    pipes.type("last");
    pipes.closeInput();
    REQUIRE(pipes.ask("input", json{{"message", "Name"}}) == "last");
  }
}
