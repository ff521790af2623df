#include "ShellEnvironment.hpp"

#include "SessionError.hpp"
#include "TestHeaders.hpp"

using namespace ptymux;

namespace {
/** Sets or clears an environment variable for the current scope. */
class ScopedEnv {
 public:
  ScopedEnv(const string& _name, const optional<string>& value)
      : name(_name), previous(GetEnv(_name.c_str())) {
    apply(value);
  }
  ~ScopedEnv() { apply(previous); }

 protected:
  string name;
  optional<string> previous;

  void apply(const optional<string>& value) {
    if (value) {
      ::setenv(name.c_str(), value->c_str(), 1);
    } else {
      ::unsetenv(name.c_str());
    }
  }
};

string valueOf(const vector<pair<string, string>>& overlay,
               const string& name) {
  for (const auto& it : overlay) {
    if (it.first == name) {
      return it.second;
    }
  }
  return "<unset>";
}
}  // namespace

TEST_CASE("Shell selection", "[ShellEnvironment]") {
  ScopedEnv shell("SHELL", string("/bin/zsh"));
  REQUIRE(ShellEnvironment::resolveShell(string("/usr/bin/fish")) ==
          "/usr/bin/fish");
  REQUIRE(ShellEnvironment::resolveShell(string("   ")) == "/bin/zsh");
  REQUIRE(ShellEnvironment::resolveShell(nullopt) == "/bin/zsh");

  SECTION("Blank $SHELL falls through to the account shell") {
    ScopedEnv blank("SHELL", string(""));
    REQUIRE_FALSE(ShellEnvironment::resolveShell(nullopt).empty());
  }
}

TEST_CASE("Login flag detection", "[ShellEnvironment]") {
  REQUIRE(ShellEnvironment::shellAcceptsLoginFlag("/bin/bash"));
  REQUIRE(ShellEnvironment::shellAcceptsLoginFlag("/usr/local/bin/ZSH"));
  REQUIRE(ShellEnvironment::shellAcceptsLoginFlag("/usr/bin/fish"));
  REQUIRE(ShellEnvironment::shellAcceptsLoginFlag("/bin/mksh"));
  REQUIRE(ShellEnvironment::shellAcceptsLoginFlag("sh"));
  REQUIRE_FALSE(ShellEnvironment::shellAcceptsLoginFlag("/usr/bin/python3"));
  REQUIRE_FALSE(ShellEnvironment::shellAcceptsLoginFlag("/usr/bin/nu"));
}

TEST_CASE("Working directory resolution", "[ShellEnvironment]") {
  string home = fs::temp_directory_path().string();

  REQUIRE(ShellEnvironment::resolveWorkingDirectory(string("/"), home) == "/");
  REQUIRE(ShellEnvironment::resolveWorkingDirectory(nullopt, home) == home);
  REQUIRE(ShellEnvironment::resolveWorkingDirectory(string(""), home) == home);
  REQUIRE(ShellEnvironment::resolveWorkingDirectory(
              string("/no/such/place"), home) == home);

  try {
    ShellEnvironment::resolveWorkingDirectory(nullopt, nullopt);
    FAIL("expected a SessionError");
  } catch (const SessionError& se) {
    REQUIRE(se.getCode() == ErrorCode::INVALID_WORKING_DIRECTORY);
    REQUIRE(string(se.what()) == "Unable to determine working directory");
  }

  try {
    ShellEnvironment::resolveWorkingDirectory(nullopt,
                                              string("/no/such/home"));
    FAIL("expected a SessionError");
  } catch (const SessionError& se) {
    REQUIRE(se.getCode() == ErrorCode::INVALID_WORKING_DIRECTORY);
    REQUIRE(string(se.what()) ==
            "Working directory is not accessible: /no/such/home");
  }
}

TEST_CASE("Home directory lookup", "[ShellEnvironment]") {
  ScopedEnv home("HOME", string("/home/somebody"));
  REQUIRE(ShellEnvironment::getHomeDirectory() == string("/home/somebody"));
}

TEST_CASE("Environment overlay", "[ShellEnvironment]") {
  SECTION("Defaults when nothing is inherited") {
    ScopedEnv term("TERM", nullopt);
    ScopedEnv colorterm("COLORTERM", nullopt);
    ScopedEnv lcAll("LC_ALL", nullopt);
    ScopedEnv lang("LANG", nullopt);
    auto overlay = ShellEnvironment::buildEnvironmentOverlay("/bin/bash");
    REQUIRE(valueOf(overlay, "TERM") == DEFAULT_TERM);
    REQUIRE(valueOf(overlay, "COLORTERM") == DEFAULT_COLORTERM);
    REQUIRE(valueOf(overlay, "LC_ALL") == DEFAULT_LOCALE);
    REQUIRE(valueOf(overlay, "LANG") == DEFAULT_LOCALE);
    REQUIRE(valueOf(overlay, "TERM_PROGRAM") == TERM_PROGRAM_NAME);
    REQUIRE(valueOf(overlay, "TERM_PROGRAM_VERSION") == PTYMUX_VERSION);
    REQUIRE(valueOf(overlay, DESKTOP_MARKER_VARIABLE) == "1");
    REQUIRE(valueOf(overlay, "SHELL") == "/bin/bash");
  }

  SECTION("Inherited terminal settings win") {
    ScopedEnv term("TERM", string("screen-256color"));
    ScopedEnv lang("LANG", string("de_DE.UTF-8"));
    auto overlay = ShellEnvironment::buildEnvironmentOverlay("/bin/zsh");
    REQUIRE(valueOf(overlay, "TERM") == "screen-256color");
    REQUIRE(valueOf(overlay, "LANG") == "de_DE.UTF-8");
    REQUIRE(valueOf(overlay, "SHELL") == "/bin/zsh");
  }
}
