#ifndef __WB_UTF8_SPLITTER__
#define __WB_UTF8_SPLITTER__

#include "Headers.hpp"

namespace wb {
/**
 * @brief Turns arbitrarily fragmented bytes into complete UTF-8 text.
 *
 * A read from a pty can end in the middle of a multi-byte character. The
 * splitter keeps such a trailing incomplete sequence (at most three bytes)
 * and prepends it to the next chunk, so every string it returns is valid
 * UTF-8 and no character is ever split across two returned strings. Bytes
 * that can never start or continue a valid sequence are dropped.
 */
class Utf8Splitter {
 public:
  Utf8Splitter() : droppedBytes(0) {}

  /**
   * @brief Appends a raw chunk and returns the text that is complete so far.
   */
  string push(const char *data, size_t length);

  /** @brief Bytes currently waiting for the rest of their character. */
  const string &pending() const { return carry; }

  /** @brief Total number of invalid bytes that were discarded. */
  int64_t getDroppedBytes() const { return droppedBytes; }

  /**
   * @brief Length of the leading well-formed sequence at `data`, 0 if the
   * byte at `data` is invalid, or -1 if the buffer ends before the sequence
   * could be completed.
   */
  static int sequenceLength(const unsigned char *data, size_t available);

 protected:
  string carry;
  int64_t droppedBytes;
};
}  // namespace wb

#endif  // __WB_UTF8_SPLITTER__
