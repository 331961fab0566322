#ifndef __LT_HEADLESS_TRANSPORT_H__
#define __LT_HEADLESS_TRANSPORT_H__

#include "Headers.hpp"

namespace lt {
/**
 * @brief The pieces of a ws:// or wss:// url needed to open a connection.
 */
struct WebSocketUrl {
  bool secure = false;
  string host;
  string port;
  string target;
};

/**
 * @brief Parses a websocket url.  Returns nullopt when the scheme is not
 * ws:// or wss:// or when the host is missing.
 */
optional<WebSocketUrl> parseWebSocketUrl(const string& url);

/**
 * @brief Callbacks fired by a HeadlessConnection.  They run on the
 * transport's own thread and must not block.
 */
struct HeadlessConnectionEvents {
  function<void()> onOpen;
  function<void(const string&)> onMessage;
  // Fired once, on error or close, after the connection stops being usable
  function<void()> onClose;
};

/**
 * @brief One connection attempt to the headless viewer.
 *
 * A connection starts out idle, is started once, and is never reused after
 * it closes.  Reconnecting means creating a new connection.
 */
class HeadlessConnection {
 public:
  virtual ~HeadlessConnection() {}

  virtual void start(const HeadlessConnectionEvents& events) = 0;

  virtual bool isConnecting() = 0;

  virtual bool isOpen() = 0;

  /**
   * @brief Sends one text message and waits until it is written.
   *
   * Returns false when the connection is not open or the write fails.
   * Must not be called from the transport's thread.
   */
  virtual bool send(const string& text) = 0;

  /**
   * @brief Begins closing the connection.  Never invokes the events
   * synchronously.
   */
  virtual void close() = 0;
};

class HeadlessTransport {
 public:
  virtual ~HeadlessTransport() {}

  /**
   * @brief Creates an idle connection to the url.  Throws
   * std::runtime_error when the url cannot be used.
   */
  virtual shared_ptr<HeadlessConnection> createConnection(
      const string& url) = 0;
};
}  // namespace lt

#endif  // __LT_HEADLESS_TRANSPORT_H__
