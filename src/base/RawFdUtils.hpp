#ifndef __PTYMUX_RAW_FD_UTILS__
#define __PTYMUX_RAW_FD_UTILS__

#include "Headers.hpp"

namespace ptymux {
/**
 * @brief Blocking read/write loops over raw descriptors (PTY masters, pipes).
 */
class RawFdUtils {
 public:
  /**
   * @brief Writes the entire buffer, retrying on EINTR/EAGAIN.
   * @throws std::runtime_error with the strerror text on failure.
   */
  static void writeAll(int fd, const char* buf, size_t count);

  /**
   * @brief Reads at most `count` bytes, blocking until some are available.
   * @return Number of bytes read, 0 on end of stream.
   * @throws std::runtime_error on a read error other than EINTR.
   */
  static size_t readSome(int fd, char* buf, size_t count);

  /** @brief Duplicates a descriptor with close-on-exec set. */
  static int dupCloexec(int fd);

  /** @brief Closes a descriptor if it is valid and resets it to -1. */
  static void closeFd(int* fd);
};
}  // namespace ptymux
#endif  // __PTYMUX_RAW_FD_UTILS__
