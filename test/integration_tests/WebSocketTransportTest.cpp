#include <boost/beast/http.hpp>

#include "HeadlessAdapter.hpp"
#include "RecordingLogSink.hpp"
#include "TestHeaders.hpp"
#include "WebSocketTransport.hpp"

using namespace lt;

namespace {
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

/**
 * @brief Minimal synchronous websocket viewer on a loopback port.
 *
 * Each accepted session records the upgrade request it saw.
 */
class LoopbackViewer {
 public:
  LoopbackViewer()
      : acceptor(ioContext, tcp::endpoint(net::ip::address_v4::loopback(), 0)) {}

  string url(const string& target = "/lt-agent") {
    return "ws://127.0.0.1:" + to_string(acceptor.local_endpoint().port()) +
           target;
  }

  /** @brief Blocks until a client connects and completes the upgrade. */
  shared_ptr<websocket::stream<tcp::socket>> accept() {
    tcp::socket socket(ioContext);
    acceptor.accept(socket);
    beast::flat_buffer buffer;
    http::request<http::string_body> request;
    http::read(socket, buffer, request);
    lastTarget = string(request.target());
    lastUserAgent = string(request[http::field::user_agent]);
    auto session =
        make_shared<websocket::stream<tcp::socket>>(std::move(socket));
    session->accept(request);
    return session;
  }

  static string read(shared_ptr<websocket::stream<tcp::socket>> session) {
    beast::flat_buffer buffer;
    session->read(buffer);
    return beast::buffers_to_string(buffer.data());
  }

  static void write(shared_ptr<websocket::stream<tcp::socket>> session,
                    const string& text) {
    session->text(true);
    session->write(net::buffer(text));
  }

  net::io_context ioContext;
  tcp::acceptor acceptor;
  string lastTarget;
  string lastUserAgent;
};

/**
 * @brief Collects the events of one connection.
 */
struct EventLog {
  EventLog() : opened(0), closed(0) {}

  HeadlessConnectionEvents events() {
    HeadlessConnectionEvents result;
    result.onOpen = [this]() { opened++; };
    result.onMessage = [this](const string& text) {
      lock_guard<std::mutex> guard(eventMutex);
      messages.push_back(text);
    };
    result.onClose = [this]() { closed++; };
    return result;
  }

  vector<string> getMessages() {
    lock_guard<std::mutex> guard(eventMutex);
    return messages;
  }

  atomic<int> opened;
  atomic<int> closed;
  std::mutex eventMutex;
  vector<string> messages;
};

bool waitFor(function<bool()> condition, int64_t timeoutMs = 5000) {
  int64_t deadline = nowMs() + timeoutMs;
  while (nowMs() < deadline) {
    if (condition()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return condition();
}
}  // namespace

TEST_CASE("WebSocketTransportRejectsUrls", "[WebSocketTransport]") {
  WebSocketTransport transport;
  REQUIRE_THROWS_AS(transport.createConnection("http://localhost/"),
                    std::runtime_error);
  REQUIRE_THROWS_AS(transport.createConnection("wss://localhost/"),
                    std::runtime_error);
}

TEST_CASE("WebSocketTransportExchange", "[WebSocketTransport][Integration]") {
  LoopbackViewer viewer;
  WebSocketTransport transport;
  EventLog log;

  std::promise<vector<string>> received;
  thread server([&viewer, &received]() {
    auto session = viewer.accept();
    vector<string> messages;
    messages.push_back(LoopbackViewer::read(session));
    messages.push_back(LoopbackViewer::read(session));
    LoopbackViewer::write(session, "{\"type\":\"user_input\",\"content\":\"hi\"}");
    received.set_value(messages);
    // Wait for the client to close
    beast::error_code ec;
    beast::flat_buffer buffer;
    session->read(buffer, ec);
  });

  auto connection = transport.createConnection(viewer.url());
  REQUIRE(!connection->isOpen());
  // Nothing can be sent before the upgrade completes
  REQUIRE(!connection->send("early"));
  connection->start(log.events());
  REQUIRE(waitFor([&log]() { return log.opened == 1; }));
  REQUIRE(connection->isOpen());
  REQUIRE(!connection->isConnecting());

  REQUIRE(connection->send("first"));
  REQUIRE(connection->send("{\"type\":\"replay_start\"}"));
  REQUIRE(received.get_future().get() ==
          vector<string>{"first", "{\"type\":\"replay_start\"}"});
  REQUIRE(viewer.lastTarget == "/lt-agent");
  REQUIRE(startsWith(viewer.lastUserAgent, "logtunnel/"));

  REQUIRE(waitFor([&log]() { return log.getMessages().size() == 1; }));
  REQUIRE(log.getMessages()[0] == "{\"type\":\"user_input\",\"content\":\"hi\"}");

  connection->close();
  server.join();
  REQUIRE(waitFor([&log]() { return log.closed == 1; }));
  REQUIRE(!connection->isOpen());
  REQUIRE(!connection->send("late"));
  // Closing again changes nothing
  connection->close();
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  REQUIRE(log.closed == 1);
}

TEST_CASE("WebSocketTransportServerGoesAway",
          "[WebSocketTransport][Integration]") {
  LoopbackViewer viewer;
  WebSocketTransport transport;
  EventLog log;

  thread server([&viewer]() {
    auto session = viewer.accept();
    session->close(websocket::close_code::going_away);
  });
  auto connection = transport.createConnection(viewer.url());
  connection->start(log.events());
  server.join();
  REQUIRE(waitFor([&log]() { return log.closed == 1; }));
  REQUIRE(!connection->isOpen());
  REQUIRE(!connection->send("after close"));
}

TEST_CASE("WebSocketTransportConnectFailure",
          "[WebSocketTransport][Integration]") {
  string url;
  {
    // A port nobody listens on any more
    LoopbackViewer closedViewer;
    url = closedViewer.url();
  }
  WebSocketTransport transport;
  EventLog log;
  auto connection = transport.createConnection(url);
  connection->start(log.events());
  REQUIRE(waitFor([&log]() { return log.closed == 1; }));
  REQUIRE(log.opened == 0);
  REQUIRE(!connection->isConnecting());
  REQUIRE(!connection->isOpen());
}

TEST_CASE("HeadlessAdapterOverWebSocket", "[HeadlessAdapter][Integration]") {
  LoopbackViewer viewer;
  auto wrapped = make_shared<RecordingLogSink>();
  HeadlessSessionInfo info;
  info.command = "agent";

  std::promise<vector<json>> handshake;
  std::promise<json> live;
  thread server([&viewer, &handshake, &live]() {
    auto session = viewer.accept();
    vector<json> messages;
    for (int a = 0; a < 4; a++) {
      messages.push_back(json::parse(LoopbackViewer::read(session)));
    }
    handshake.set_value(messages);
    live.set_value(json::parse(LoopbackViewer::read(session)));
    beast::error_code ec;
    beast::flat_buffer buffer;
    while (!ec) {
      session->read(buffer, ec);
      buffer.consume(buffer.size());
    }
  });

  auto adapter = HeadlessAdapter::create(viewer.url(), info, wrapped,
                                         make_shared<WebSocketTransport>(),
                                         HeadlessAdapterOptions());
  adapter->log({"before connect"});

  auto messages = handshake.get_future().get();
  REQUIRE(messages[0]["type"] == "session_info");
  REQUIRE(messages[0]["command"] == "agent");
  REQUIRE(messages[1]["type"] == "replay_start");
  REQUIRE(messages[2]["seq"] == 1);
  REQUIRE(messages[2]["message"]["args"][0] == "before connect");
  REQUIRE(messages[3]["type"] == "replay_end");

  adapter->writeStdout("more\n");
  json liveMessage = live.get_future().get();
  REQUIRE(liveMessage["seq"] == 2);
  REQUIRE(liveMessage["message"]["data"] == "more\n");

  adapter->destroy(2000);
  server.join();
  REQUIRE(adapter->getState() == HeadlessConnectionState::Disconnected);
  REQUIRE(wrapped->count() == 2);
}
