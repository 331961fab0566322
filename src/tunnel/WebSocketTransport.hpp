#ifndef __LT_WEB_SOCKET_TRANSPORT_H__
#define __LT_WEB_SOCKET_TRANSPORT_H__

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "HeadlessTransport.hpp"

namespace lt {
namespace net = boost::asio;
namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;

/**
 * @brief A plain TCP websocket connection driven by Boost.Beast.
 *
 * All stream operations run on a strand of the transport's io_context.
 * send() is the only blocking call: it posts the write to the strand and
 * waits for its completion.
 */
class WebSocketConnection
    : public HeadlessConnection,
      public enable_shared_from_this<WebSocketConnection> {
 public:
  WebSocketConnection(net::io_context& ioContext, const WebSocketUrl& url);

  virtual ~WebSocketConnection();

  virtual void start(const HeadlessConnectionEvents& events);

  virtual bool isConnecting() { return state == CONNECTING; }

  virtual bool isOpen() { return state == OPEN; }

  virtual bool send(const string& text);

  virtual void close();

  static constexpr int64_t CONNECT_TIMEOUT_MS = 10000;
  static constexpr int64_t SEND_TIMEOUT_MS = 10000;

 protected:
  enum ConnectionState { IDLE = 0, CONNECTING, OPEN, CLOSED };

  struct PendingWrite {
    // Shared with the write in flight, which may outlive the queue entry
    shared_ptr<const string> payload;
    shared_ptr<promise<bool>> done;
  };

  void onResolve(const beast::error_code& ec,
                 net::ip::tcp::resolver::results_type results);
  void onConnect(const beast::error_code& ec,
                 const net::ip::tcp::resolver::results_type::endpoint_type&);
  void onHandshake(const beast::error_code& ec);
  void startRead();
  void onRead(const beast::error_code& ec, size_t bytesTransferred);
  void doWrite();
  void onWrite(const beast::error_code& ec, size_t bytesTransferred);
  void closeOnStrand();
  void onClose(const beast::error_code& ec);
  void fail(const char* context, const beast::error_code& ec);
  void failPendingWrites();
  void notifyClosed();

  net::io_context::executor_type ioExecutor;
  WebSocketUrl url;
  net::ip::tcp::resolver resolver;
  websocket::stream<beast::tcp_stream> ws;
  beast::flat_buffer readBuffer;
  HeadlessConnectionEvents events;
  atomic<int> state;
  // Only touched on the strand
  deque<PendingWrite> writeQueue;
  bool closing;
  bool notifiedClose;
};

/**
 * @brief Creates websocket connections that share one io thread.
 *
 * Only ws:// urls are supported; a wss:// url is rejected by
 * createConnection.
 */
class WebSocketTransport : public HeadlessTransport {
 public:
  WebSocketTransport();

  virtual ~WebSocketTransport();

  virtual shared_ptr<HeadlessConnection> createConnection(const string& url);

 protected:
  void run();

  net::io_context ioContext;
  net::executor_work_guard<net::io_context::executor_type> workGuard;
  thread ioThread;
};
}  // namespace lt

#endif  // __LT_WEB_SOCKET_TRANSPORT_H__
