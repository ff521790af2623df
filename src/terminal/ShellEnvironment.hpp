#ifndef __PTYMUX_SHELL_ENVIRONMENT_HPP__
#define __PTYMUX_SHELL_ENVIRONMENT_HPP__

#include "Headers.hpp"

namespace ptymux {
const string DEFAULT_TERM = "xterm-256color";
const string DEFAULT_COLORTERM = "truecolor";
const string DEFAULT_LOCALE = "en_US.UTF-8";
const string TERM_PROGRAM_NAME = "PtyMux";
const string DESKTOP_MARKER_VARIABLE = "PTYMUX_DESKTOP";

/**
 * @brief Decides which shell to start, where, and with what environment.
 */
class ShellEnvironment {
 public:
  /**
   * @brief Picks the shell: `shellOverride` when non-blank, then $SHELL when
   * non-blank, then the user's passwd shell, then /bin/sh.
   */
  static string resolveShell(const optional<string>& shellOverride);

  /**
   * @brief Whether the shell understands `-l`. Matches bash, zsh, sh, fish
   * and ksh variants by basename, case-insensitively.
   */
  static bool shellAcceptsLoginFlag(const string& shellPath);

  /** @brief $HOME when set, otherwise the passwd home directory. */
  static optional<string> getHomeDirectory();

  /**
   * @brief Chooses the working directory for a new session.
   *
   * `requested` wins when it names an existing directory, otherwise `home`
   * is used.
   * @throws SessionError(INVALID_WORKING_DIRECTORY) when the chosen path is
   * missing or not a directory.
   */
  static string resolveWorkingDirectory(const optional<string>& requested,
                                        const optional<string>& home);

  /**
   * @brief Variables injected into every shell. Terminal type, color and
   * locale keep the values inherited from our own environment when present.
   */
  static vector<pair<string, string>> buildEnvironmentOverlay(
      const string& shellPath);
};
}  // namespace ptymux

#endif  // __PTYMUX_SHELL_ENVIRONMENT_HPP__
