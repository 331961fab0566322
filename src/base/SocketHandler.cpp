#include "SocketHandler.hpp"

namespace lt {
// Seconds a write may go without progress before the peer counts as stuck
#define SOCKET_STALL_TIMEOUT_SEC (10)

int SocketHandler::writeAllOrReturn(int fd, const void* buf, size_t count) {
  const char* bytes = (const char*)buf;
  size_t pos = 0;
  time_t lastProgress = time(NULL);
  while (pos < count) {
    ssize_t bytesWritten = write(fd, bytes + pos, count - pos);
    auto localErrno = errno;
    if (bytesWritten > 0) {
      pos += bytesWritten;
      lastProgress = time(NULL);
      continue;
    }
    if (bytesWritten == 0 ||
        (localErrno != EAGAIN && localErrno != EWOULDBLOCK)) {
      VLOG(1) << "Write to fd " << fd << " failed: "
              << (bytesWritten == 0 ? "closed" : strerror(localErrno));
      return -1;
    }
    if (time(NULL) > lastProgress + SOCKET_STALL_TIMEOUT_SEC) {
      LOG(WARNING) << "Write to fd " << fd << " stalled with "
                   << (count - pos) << " bytes left";
      return -1;
    }
    VLOG(2) << "Got EAGAIN, waiting...";
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  return count;
}
}  // namespace lt
