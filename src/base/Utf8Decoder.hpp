#ifndef __PTYMUX_UTF8_DECODER__
#define __PTYMUX_UTF8_DECODER__

#include "Headers.hpp"

namespace ptymux {
/** @brief UTF-8 encoding of U+FFFD. */
const string UTF8_REPLACEMENT_CHARACTER = "\xEF\xBF\xBD";

/**
 * @brief Incremental UTF-8 decoder for byte streams read in arbitrary chunks.
 *
 * Complete, valid sequences are passed through. A sequence that is merely
 * incomplete at the end of the input is held back until more bytes arrive.
 * A byte that cannot start a valid sequence at its position is dropped and
 * replaced by a single U+FFFD, then decoding resumes at the next byte. The
 * text produced is therefore always valid UTF-8 and independent of how the
 * stream was chunked.
 */
class Utf8Decoder {
 public:
  Utf8Decoder() {}

  /**
   * @brief Decodes `count` bytes, appending valid text to `out`.
   *
   * Trailing bytes of an unfinished sequence are kept for the next call.
   */
  void feed(const char* data, size_t count, string* out);

  inline void feed(const string& data, string* out) {
    feed(data.data(), data.size(), out);
  }

  /**
   * @brief Flushes the held-back tail, replacing whatever is left of an
   * unfinished sequence. Used at end of stream.
   */
  void finish(string* out);

  /** @brief Number of bytes held back waiting for the rest of a sequence. */
  size_t pendingBytes() const { return tail.size(); }

  /** @brief Decodes a complete buffer in one go (feed + finish). */
  static string decode(const string& bytes);

 protected:
  /** @brief Bytes of an unfinished sequence carried between calls. */
  string tail;

  void decodeBuffer(const string& bytes, bool endOfStream, string* out);
};
}  // namespace ptymux

#endif  // __PTYMUX_UTF8_DECODER__
