#ifndef __LT_TUNNEL_SERVER__
#define __LT_TUNNEL_SERVER__

#include "FrameCodec.hpp"
#include "Headers.hpp"
#include "LogSink.hpp"
#include "PipeSocketHandler.hpp"
#include "TunnelMessages.hpp"

namespace lt {
/**
 * @brief Sends the answer for one prompt request back to the connection that
 * asked. Safe to call from any thread, at any time.
 * @return false when the asking connection is gone.
 */
typedef function<bool(const ServerTunnelMessage& response)> PromptResponder;

/**
 * @brief Called on the server thread for every prompt_request event. The
 * handler must return promptly and answer later through the responder.
 */
typedef function<void(const json& promptRequest, PromptResponder respond)>
    PromptRequestHandler;

struct TunnelServerHandlers {
  PromptRequestHandler onPromptRequest;
};

/**
 * @brief Accepts tunnel clients on a Unix socket and replays their output
 * into a LogSink.
 *
 * One thread runs a select() loop over the listening socket and every client
 * connection. Each connection has its own frame codec, so clients never see
 * each other's partial frames.
 */
class TunnelServer {
 public:
  /**
   * @brief Starts listening on @p endpoint.
   * @throws std::runtime_error when the socket cannot be bound.
   */
  TunnelServer(shared_ptr<PipeSocketHandler> _socketHandler,
               const SocketEndpoint& _endpoint, shared_ptr<LogSink> _sink,
               const TunnelServerHandlers& _handlers = TunnelServerHandlers());
  virtual ~TunnelServer();

  /**
   * @brief Stops accepting, disconnects every client and removes the socket
   * file. Safe to call more than once.
   */
  void close();

  /**
   * @brief Sends a user_input frame to every connected client.
   * @return Number of clients the frame was written to.
   */
  int broadcastUserInput(const string& content);

  int getConnectionCount();

  const SocketEndpoint& getEndpoint() const { return endpoint; }

  bool isClosed();

 protected:
  struct TunnelConnection {
    TunnelConnection(int _fd, int64_t _id) : fd(_fd), id(_id), closed(false) {}

    int fd;
    int64_t id;
    FrameCodec codec;
    bool closed;
    // Serializes writes and close on this connection
    std::mutex connectionMutex;
  };

  void run();
  void acceptNewConnection(int listenFd);
  /**
   * @brief Drains readable bytes from a connection.
   * @return Complete frames received, in order.
   */
  vector<json> readFromConnection(shared_ptr<TunnelConnection> connection);
  void handleFrame(shared_ptr<TunnelConnection> connection, const json& frame);
  void closeConnection(shared_ptr<TunnelConnection> connection);
  void shutdown();

  static bool writeFrame(shared_ptr<SocketHandler> socketHandler,
                         shared_ptr<TunnelConnection> connection,
                         const json& frame);

  shared_ptr<PipeSocketHandler> socketHandler;
  SocketEndpoint endpoint;
  shared_ptr<LogSink> sink;
  TunnelServerHandlers handlers;

  recursive_mutex serverMutex;
  map<int64_t, shared_ptr<TunnelConnection>> connections;
  int64_t nextConnectionId;
  set<int> listenFds;
  std::atomic<bool> halt;
  bool stopped;
  std::thread serverThread;
};
}  // namespace lt

#endif  // __LT_TUNNEL_SERVER__
