#ifndef __PTYMUX_HOST_CONFIG_HPP__
#define __PTYMUX_HOST_CONFIG_HPP__

#include "Headers.hpp"
#include "OutputPump.hpp"

namespace ptymux {
/** @brief Settings of the host process, read from an INI file. */
struct HostConfig {
  /** @brief [Terminal] shell */
  optional<string> shell;
  /** @brief [Output] flush_interval_ms, max_batch_bytes, read_chunk_bytes */
  OutputOptions output;
  /** @brief [Debug] verbose */
  int verbose = 0;
  /** @brief [Debug] silent */
  bool silent = false;
  /** @brief [Debug] logsize, in bytes */
  string maxLogSize = "20971520";
};

class HostConfigLoader {
 public:
  /** @brief `<config home>/ptymux/ptymux.ini`. */
  static string defaultPath();

  /**
   * @brief Reads the INI file at `path`.
   * @throws std::runtime_error if it cannot be read or holds invalid values.
   */
  static HostConfig loadFile(const string& path);

  /** @brief Same as loadFile for an in-memory document. */
  static HostConfig parse(const string& contents);
};
}  // namespace ptymux

#endif  // __PTYMUX_HOST_CONFIG_HPP__
