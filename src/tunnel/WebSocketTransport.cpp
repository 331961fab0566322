#include "WebSocketTransport.hpp"

#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

namespace lt {
using tcp = net::ip::tcp;

WebSocketConnection::WebSocketConnection(net::io_context& ioContext,
                                         const WebSocketUrl& _url)
    : ioExecutor(ioContext.get_executor()),
      url(_url),
      resolver(net::make_strand(ioContext)),
      ws(net::make_strand(ioContext)),
      state(IDLE),
      closing(false),
      notifiedClose(false) {}

WebSocketConnection::~WebSocketConnection() {
  for (auto& pending : writeQueue) {
    pending.done->set_value(false);
  }
}

void WebSocketConnection::start(const HeadlessConnectionEvents& _events) {
  int expected = IDLE;
  if (!state.compare_exchange_strong(expected, CONNECTING)) {
    STFATAL << "Tried to start a websocket connection twice";
  }
  events = _events;
  VLOG(1) << "Resolving headless viewer " << url.host << ":" << url.port;
  auto self = shared_from_this();
  net::post(ws.get_executor(), [self]() {
    self->resolver.async_resolve(
        self->url.host, self->url.port,
        beast::bind_front_handler(&WebSocketConnection::onResolve, self));
  });
}

void WebSocketConnection::onResolve(const beast::error_code& ec,
                                    tcp::resolver::results_type results) {
  if (ec) {
    fail("resolve", ec);
    return;
  }
  if (closing) {
    return;
  }
  beast::get_lowest_layer(ws).expires_after(
      std::chrono::milliseconds(CONNECT_TIMEOUT_MS));
  beast::get_lowest_layer(ws).async_connect(
      results, beast::bind_front_handler(&WebSocketConnection::onConnect,
                                         shared_from_this()));
}

void WebSocketConnection::onConnect(
    const beast::error_code& ec, const tcp::resolver::results_type::endpoint_type&) {
  if (ec) {
    fail("connect", ec);
    return;
  }
  // The websocket stream enforces its own timeouts from here on
  beast::get_lowest_layer(ws).expires_never();
  ws.set_option(
      websocket::stream_base::timeout::suggested(beast::role_type::client));
  ws.set_option(
      websocket::stream_base::decorator([](websocket::request_type& req) {
        req.set(beast::http::field::user_agent,
                string("logtunnel/") + LT_VERSION);
      }));
  ws.text(true);
  string hostHeader = url.host.find(':') == string::npos
                          ? url.host
                          : "[" + url.host + "]";
  ws.async_handshake(hostHeader + ":" + url.port, url.target,
                     beast::bind_front_handler(
                         &WebSocketConnection::onHandshake, shared_from_this()));
}

void WebSocketConnection::onHandshake(const beast::error_code& ec) {
  if (ec) {
    fail("handshake", ec);
    return;
  }
  if (closing) {
    closeOnStrand();
    return;
  }
  LOG(INFO) << "Headless websocket established to " << url.host << ":"
            << url.port << url.target;
  state = OPEN;
  if (events.onOpen) {
    events.onOpen();
  }
  startRead();
}

void WebSocketConnection::startRead() {
  ws.async_read(readBuffer,
                beast::bind_front_handler(&WebSocketConnection::onRead,
                                          shared_from_this()));
}

void WebSocketConnection::onRead(const beast::error_code& ec,
                                 size_t bytesTransferred) {
  if (ec) {
    if (ec == websocket::error::closed) {
      LOG(INFO) << "Headless websocket closed by peer";
    }
    fail("read", ec);
    return;
  }
  string payload = beast::buffers_to_string(readBuffer.data());
  readBuffer.consume(readBuffer.size());
  VLOG(2) << "Headless websocket received " << bytesTransferred << " bytes";
  if (events.onMessage) {
    events.onMessage(payload);
  }
  startRead();
}

bool WebSocketConnection::send(const string& text) {
  if (state != OPEN) {
    return false;
  }
  if (ioExecutor.running_in_this_thread()) {
    STERROR << "Blocking websocket send from the io thread";
    return false;
  }
  auto done = make_shared<promise<bool>>();
  auto result = done->get_future();
  auto self = shared_from_this();
  auto payload = make_shared<const string>(text);
  net::post(ws.get_executor(), [self, payload, done]() {
    if (self->state != OPEN) {
      done->set_value(false);
      return;
    }
    self->writeQueue.push_back(PendingWrite{payload, done});
    if (self->writeQueue.size() == 1) {
      self->doWrite();
    }
  });
  if (result.wait_for(std::chrono::milliseconds(SEND_TIMEOUT_MS)) !=
      future_status::ready) {
    LOG(WARNING) << "Timed out writing to headless websocket";
    close();
    return false;
  }
  try {
    return result.get();
  } catch (const future_error& fe) {
    // The io thread dropped the write without completing it
    VLOG(1) << "Headless websocket write abandoned: " << fe.what();
    return false;
  }
}

void WebSocketConnection::doWrite() {
  auto self = shared_from_this();
  auto payload = writeQueue.front().payload;
  ws.async_write(net::buffer(*payload),
                 [self, payload](const beast::error_code& ec,
                                 size_t bytesTransferred) {
                   self->onWrite(ec, bytesTransferred);
                 });
}

void WebSocketConnection::onWrite(const beast::error_code& ec, size_t) {
  if (ec) {
    fail("write", ec);
    return;
  }
  if (writeQueue.empty()) {
    return;
  }
  writeQueue.front().done->set_value(true);
  writeQueue.pop_front();
  if (!writeQueue.empty()) {
    doWrite();
  }
}

void WebSocketConnection::close() {
  auto self = shared_from_this();
  net::post(ws.get_executor(), [self]() { self->closeOnStrand(); });
}

void WebSocketConnection::closeOnStrand() {
  if (state == CLOSED) {
    return;
  }
  bool wasOpen = (state == OPEN);
  closing = true;
  state = CLOSED;
  resolver.cancel();
  failPendingWrites();
  if (wasOpen) {
    ws.async_close(websocket::close_code::normal,
                   beast::bind_front_handler(&WebSocketConnection::onClose,
                                             shared_from_this()));
    return;
  }
  beast::error_code ignored;
  beast::get_lowest_layer(ws).socket().close(ignored);
  notifyClosed();
}

void WebSocketConnection::onClose(const beast::error_code& ec) {
  if (ec && ec != net::error::operation_aborted) {
    VLOG(1) << "Headless websocket close error: " << ec.message();
  }
  beast::error_code ignored;
  beast::get_lowest_layer(ws).socket().close(ignored);
  notifyClosed();
}

void WebSocketConnection::fail(const char* context,
                               const beast::error_code& ec) {
  if (closing && ec == net::error::operation_aborted) {
    notifyClosed();
    return;
  }
  if (!closing) {
    LOG(INFO) << "Headless websocket " << context
              << " error: " << ec.message();
  }
  state = CLOSED;
  failPendingWrites();
  beast::error_code ignored;
  beast::get_lowest_layer(ws).socket().close(ignored);
  notifyClosed();
}

void WebSocketConnection::failPendingWrites() {
  for (auto& pending : writeQueue) {
    pending.done->set_value(false);
  }
  writeQueue.clear();
}

void WebSocketConnection::notifyClosed() {
  if (notifiedClose) {
    return;
  }
  notifiedClose = true;
  if (events.onClose) {
    events.onClose();
  }
}

WebSocketTransport::WebSocketTransport()
    : workGuard(net::make_work_guard(ioContext)) {
  ioThread = thread(&WebSocketTransport::run, this);
}

WebSocketTransport::~WebSocketTransport() {
  workGuard.reset();
  ioContext.stop();
  if (ioThread.joinable()) {
    if (ioThread.get_id() == std::this_thread::get_id()) {
      ioThread.detach();
    } else {
      ioThread.join();
    }
  }
}

shared_ptr<HeadlessConnection> WebSocketTransport::createConnection(
    const string& url) {
  auto parsed = parseWebSocketUrl(url);
  if (!parsed) {
    throw std::runtime_error("Invalid websocket url: " + url);
  }
  if (parsed->secure) {
    throw std::runtime_error("wss:// urls are not supported: " + url);
  }
  return make_shared<WebSocketConnection>(ioContext, *parsed);
}

void WebSocketTransport::run() {
  el::Helpers::setThreadName("headless-io");
  while (true) {
    try {
      ioContext.run();
      return;
    } catch (const std::exception& e) {
      LOG(ERROR) << "Error in headless io thread: " << e.what();
    }
  }
}
}  // namespace lt
