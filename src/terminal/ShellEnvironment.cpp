#include "ShellEnvironment.hpp"

#include "SessionError.hpp"

namespace ptymux {
namespace {
bool isDirectory(const string& path) {
  std::error_code ec;
  return fs::is_directory(fs::path(path), ec);
}
}  // namespace

string ShellEnvironment::resolveShell(const optional<string>& shellOverride) {
  if (shellOverride && !trim(*shellOverride).empty()) {
    return *shellOverride;
  }
  auto shellEnv = GetEnv("SHELL");
  if (shellEnv && !trim(*shellEnv).empty()) {
    return *shellEnv;
  }
  passwd* pwd = getpwuid(getuid());
  if (pwd != NULL && pwd->pw_shell != NULL && pwd->pw_shell[0] != '\0') {
    return string(pwd->pw_shell);
  }
  return _PATH_BSHELL;
}

bool ShellEnvironment::shellAcceptsLoginFlag(const string& shellPath) {
  string shellName = fs::path(shellPath).filename().string();
  if (shellName.empty()) {
    shellName = shellPath;
  }
  shellName = toLower(shellName);
  static const vector<string> loginShells = {"zsh", "bash", "sh", "fish",
                                             "ksh"};
  for (const auto& it : loginShells) {
    if (shellName.find(it) != string::npos) {
      return true;
    }
  }
  return false;
}

optional<string> ShellEnvironment::getHomeDirectory() {
  auto home = GetEnv("HOME");
  if (home && !home->empty()) {
    return home;
  }
  passwd* pwd = getpwuid(getuid());
  if (pwd != NULL && pwd->pw_dir != NULL && pwd->pw_dir[0] != '\0') {
    return string(pwd->pw_dir);
  }
  return nullopt;
}

string ShellEnvironment::resolveWorkingDirectory(
    const optional<string>& requested, const optional<string>& home) {
  if (requested && !requested->empty()) {
    if (isDirectory(*requested)) {
      return *requested;
    }
    LOG(WARNING) << "Requested working directory is not accessible, using "
                    "home instead: "
                 << *requested;
  }
  if (!home || home->empty()) {
    throw SessionError(ErrorCode::INVALID_WORKING_DIRECTORY,
                       "Unable to determine working directory");
  }
  if (!isDirectory(*home)) {
    throw SessionError(ErrorCode::INVALID_WORKING_DIRECTORY,
                       "Working directory is not accessible: " + *home);
  }
  return *home;
}

vector<pair<string, string>> ShellEnvironment::buildEnvironmentOverlay(
    const string& shellPath) {
  vector<pair<string, string>> overlay;
  overlay.push_back({"TERM", GetEnv("TERM").value_or(DEFAULT_TERM)});
  overlay.push_back(
      {"COLORTERM", GetEnv("COLORTERM").value_or(DEFAULT_COLORTERM)});
  overlay.push_back({"LC_ALL", GetEnv("LC_ALL").value_or(DEFAULT_LOCALE)});
  overlay.push_back({"LANG", GetEnv("LANG").value_or(DEFAULT_LOCALE)});
  overlay.push_back({"TERM_PROGRAM", TERM_PROGRAM_NAME});
  overlay.push_back({"TERM_PROGRAM_VERSION", PTYMUX_VERSION});
  overlay.push_back({DESKTOP_MARKER_VARIABLE, "1"});
  overlay.push_back({"SHELL", shellPath});
  return overlay;
}
}  // namespace ptymux
