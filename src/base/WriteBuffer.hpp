#ifndef __LT_WRITE_BUFFER__
#define __LT_WRITE_BUFFER__

#include "Headers.hpp"

namespace lt {
/**
 * @brief Outgoing bytes for one non-blocking stream socket.
 *
 * Frames are appended whole and drained by the owning I/O thread as the
 * socket accepts them, so a frame is never interleaved with another one.
 */
class WriteBuffer {
 public:
  /** @brief Default limit on buffered bytes per socket. */
  static constexpr size_t DEFAULT_MAX_BYTES = 4 * 1024 * 1024;

  explicit WriteBuffer(size_t _maxBytes = DEFAULT_MAX_BYTES)
      : maxBytes(_maxBytes), totalBytes(0), writeOffset(0) {}

  /**
   * @brief Returns true if the buffer has room for more data.
   */
  bool canAcceptMore() const { return totalBytes < maxBytes; }

  bool hasPendingData() const { return !pending.empty(); }

  /**
   * @brief Returns the current amount of buffered data in bytes.
   */
  size_t size() const { return totalBytes; }

  /**
   * @brief Appends one frame.
   * @return false (and drops the frame) when the buffer is already full.
   */
  bool enqueue(const string &data) {
    if (data.empty()) return true;
    if (!canAcceptMore()) return false;
    pending.push_back(data);
    totalBytes += data.size();
    return true;
  }

  /**
   * @brief Returns a pointer to the next bytes to write and the count.
   * @return Pointer to the data, or nullptr if buffer is empty.
   */
  const char *peekData(size_t *count) const {
    if (pending.empty()) {
      *count = 0;
      return nullptr;
    }
    const string &front = pending.front();
    *count = front.size() - writeOffset;
    return front.data() + writeOffset;
  }

  /**
   * @brief Removes bytesWritten from the front of the buffer.
   */
  void consume(size_t bytesWritten) {
    while (bytesWritten > 0 && !pending.empty()) {
      string &front = pending.front();
      size_t available = front.size() - writeOffset;

      if (bytesWritten >= available) {
        bytesWritten -= available;
        totalBytes -= available;
        writeOffset = 0;
        pending.pop_front();
      } else {
        writeOffset += bytesWritten;
        totalBytes -= bytesWritten;
        bytesWritten = 0;
      }
    }
  }

  void clear() {
    pending.clear();
    totalBytes = 0;
    writeOffset = 0;
  }

 private:
  size_t maxBytes;
  std::deque<string> pending;
  size_t totalBytes;
  size_t writeOffset;  // Offset into the front chunk for partial writes
};
}  // namespace lt

#endif  // __LT_WRITE_BUFFER__
