#include "ChildProcess.hpp"

#include "RecordingLogSink.hpp"
#include "TestHeaders.hpp"

using namespace lt;

namespace {
string joinedData(const vector<TunnelMessage>& messages,
                  TunnelMessageType type) {
  string data;
  for (const auto& message : messages) {
    if (message.type == type) {
      data += message.data;
    }
  }
  return data;
}
}  // namespace

TEST_CASE("ChildProcessExitCodes", "[ChildProcess]") {
  SECTION("Success") {
    ChildProcess child({"true"}, {});
    child.start();
    REQUIRE(child.getPid() > 0);
    REQUIRE(child.wait() == 0);
  }

  SECTION("Failure status is passed through") {
    ChildProcess child({"sh", "-c", "exit 3"}, {});
    child.start();
    REQUIRE(child.wait() == 3);
  }

  SECTION("Killed by a signal") {
    ChildProcess child({"sh", "-c", "kill -TERM $$"}, {});
    child.start();
    REQUIRE(child.wait() == 128 + SIGTERM);
  }

  SECTION("Missing command") {
    ChildProcess child({"lt-command-that-does-not-exist"}, {});
    child.start();
    REQUIRE(child.wait() == 127);
  }
}

TEST_CASE("ChildProcessMisuse", "[ChildProcess]") {
  ChildProcess empty({}, {});
  REQUIRE_THROWS_AS(empty.start(), std::runtime_error);

  ChildProcess notStarted({"true"}, {});
  REQUIRE_THROWS_AS(notStarted.wait(), std::runtime_error);

  ChildProcess twice({"true"}, {});
  twice.start();
  REQUIRE_THROWS_AS(twice.start(), std::runtime_error);
  REQUIRE(twice.wait() == 0);
}

TEST_CASE("ChildProcessEnvironment", "[ChildProcess]") {
  auto sink = make_shared<RecordingLogSink>();
  map<string, string> environment;
  environment[LT_OUTPUT_SOCKET_ENV] = "/tmp/lt_test/socket.sock";
  ChildProcess child({"sh", "-c", "printf %s \"$LT_OUTPUT_SOCKET\""},
                     environment, sink);
  child.start();
  REQUIRE(child.wait() == 0);
  REQUIRE(joinedData(sink->getMessages(), TunnelMessageType::Stdout) ==
          "/tmp/lt_test/socket.sock");
}

TEST_CASE("ChildProcessCapture", "[ChildProcess]") {
  auto sink = make_shared<RecordingLogSink>();
  ChildProcess child(
      {"sh", "-c", "echo out1; echo err1 >&2; echo out2; echo err2 >&2"}, {},
      sink);
  child.start();
  REQUIRE(child.wait() == 0);

  // All captured output is replayed before wait() returns
  auto messages = sink->getMessages();
  REQUIRE(joinedData(messages, TunnelMessageType::Stdout) == "out1\nout2\n");
  REQUIRE(joinedData(messages, TunnelMessageType::Stderr) == "err1\nerr2\n");
}
