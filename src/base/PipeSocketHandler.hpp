#ifndef __LT_PIPE_SOCKET_HANDLER__
#define __LT_PIPE_SOCKET_HANDLER__

#include "UnixSocketHandler.hpp"

namespace lt {
/**
 * @brief Unix domain stream sockets addressed by filesystem path.
 */
class PipeSocketHandler : public UnixSocketHandler {
 public:
  PipeSocketHandler();
  virtual ~PipeSocketHandler() {}

  /**
   * @brief Connects to the socket at the endpoint path.
   * @return The connected fd, or -1 when nothing is listening there.
   */
  virtual int connect(const SocketEndpoint& endpoint);
  /**
   * @brief Binds and listens on the endpoint path, replacing a stale socket
   * file left behind by a crashed process.
   * @throws std::runtime_error when the path cannot be bound.
   */
  virtual set<int> listen(const SocketEndpoint& endpoint);
  /**
   * @brief Closes the listening fd and removes the socket file.
   */
  virtual void stopListening(const SocketEndpoint& endpoint);

 protected:
  /** @brief Tracks path -> listening socket descriptors for each pipe. */
  map<string, set<int>> pipeServerSockets;
};
}  // namespace lt

#endif  // __LT_PIPE_SOCKET_HANDLER__
