#ifndef __LT_FRAME_CODEC__
#define __LT_FRAME_CODEC__

#include "Headers.hpp"

namespace lt {
/**
 * @brief Splits a byte stream into newline-delimited JSON frames.
 *
 * Bytes after the last newline are kept until a later chunk completes them,
 * so the frames produced do not depend on how the stream was chunked.
 */
class FrameCodec {
 public:
  /** @brief Longest partial frame kept before it is discarded. */
  static constexpr size_t MAX_FRAME_BYTES = 128 * 1024 * 1024;

  FrameCodec() : discarding(false) {}

  /**
   * @brief Encodes one value as a frame: compact JSON plus a trailing
   * newline. Newlines inside strings are escaped by the JSON encoding.
   */
  static string encode(const json& value);

  /**
   * @brief Appends a chunk and returns every line it completed, in order.
   * Empty lines are skipped.
   */
  vector<string> feed(const string& chunk);

  /**
   * @brief Like feed(), but parses each line. Lines that are not JSON are
   * dropped.
   */
  vector<json> feedJson(const string& chunk);

  /** @brief Bytes held for a frame that has not been terminated yet. */
  size_t pendingBytes() const { return partial.size(); }

 private:
  string partial;
  // True while skipping the rest of an oversized frame
  bool discarding;
};
}  // namespace lt

#endif  // __LT_FRAME_CODEC__
