#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace sbu::common {

/// External command invocation. vArgs[0] is resolved through PATH.
/// Class abbreviation: ps
struct ProcessSpec {
  std::vector<std::string> vArgs;
  std::string sWorkingDir;  // empty = inherit
  std::chrono::seconds durTimeout{900};
};

/// Outcome of a finished (or killed) command.
/// Class abbreviation: pres
struct ProcessResult {
  int iExitCode = -1;  // 128 + signal when terminated by a signal
  std::string sStdout;
  std::string sStderr;
  bool bTimedOut = false;

  bool succeeded() const { return !bTimedOut && iExitCode == 0; }
};

/// Seam for command execution so git and build steps can be faked in tests.
class IProcessRunner {
 public:
  virtual ~IProcessRunner() = default;

  /// Run the command to completion or until its timeout expires.
  /// Throws std::system_error only when the process cannot be spawned.
  virtual ProcessResult run(const ProcessSpec& psSpec) = 0;
};

/// fork/execvp implementation with piped stdout/stderr and a hard deadline.
/// A child that outlives its deadline is killed with SIGKILL and reaped.
/// Class abbreviation: pr
class ProcessRunner : public IProcessRunner {
 public:
  ProcessRunner();
  ~ProcessRunner() override;

  ProcessResult run(const ProcessSpec& psSpec) override;
};

/// Render a command line for log messages.
std::string describeCommand(const std::vector<std::string>& vArgs);

/// Split a command string on whitespace. Quoting is not supported.
std::vector<std::string> splitCommand(const std::string& sCommand);

}  // namespace sbu::common
