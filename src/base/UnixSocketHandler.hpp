#ifndef __LT_UNIX_SOCKET_HANDLER__
#define __LT_UNIX_SOCKET_HANDLER__

#include "SocketHandler.hpp"

namespace lt {
/**
 * @brief SocketHandler over POSIX sockets. All sockets are non-blocking and
 * every fd has its own mutex so reads and writes on one socket never
 * interleave.
 */
class UnixSocketHandler : public SocketHandler {
 public:
  UnixSocketHandler();
  virtual ~UnixSocketHandler() {}

  virtual ssize_t read(int fd, void* buf, size_t count);
  virtual ssize_t write(int fd, const void* buf, size_t count);
  virtual int accept(int fd);
  virtual void close(int fd);

 protected:
  /**
   * @brief Ensures that a descriptor is tracked and has its own mutex.
   */
  void addToActiveSockets(int fd);
  /**
   * @brief Per-socket initialization: non-blocking mode and SIGPIPE
   * suppression.
   */
  virtual void initSocket(int fd);
  virtual void initServerSocket(int fd);

  /** @brief Mutex per active socket to ensure serial read/write. */
  map<int, shared_ptr<recursive_mutex>> activeSocketMutexes;
  /** @brief Guards access to the active socket map. */
  recursive_mutex globalMutex;
};
}  // namespace lt

#endif  // __LT_UNIX_SOCKET_HANDLER__
