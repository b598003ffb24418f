#include "common/ProcessRunner.hpp"

#include "common/Logger.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace sbu::common {

namespace {

/// Owns both ends of a pipe; closes whatever is still open on destruction.
class Pipe {
 public:
  Pipe() {
    if (::pipe2(_fds, O_CLOEXEC) != 0) {
      throw std::system_error(errno, std::generic_category(), "pipe2");
    }
  }
  ~Pipe() {
    closeRead();
    closeWrite();
  }

  Pipe(const Pipe&) = delete;
  Pipe& operator=(const Pipe&) = delete;

  int readFd() const { return _fds[0]; }
  int writeFd() const { return _fds[1]; }

  void closeRead() {
    if (_fds[0] >= 0) {
      ::close(_fds[0]);
      _fds[0] = -1;
    }
  }
  void closeWrite() {
    if (_fds[1] >= 0) {
      ::close(_fds[1]);
      _fds[1] = -1;
    }
  }

 private:
  int _fds[2] = {-1, -1};
};

int decodeStatus(int iStatus) {
  if (WIFEXITED(iStatus)) return WEXITSTATUS(iStatus);
  if (WIFSIGNALED(iStatus)) return 128 + WTERMSIG(iStatus);
  return -1;
}

}  // anonymous namespace

ProcessRunner::ProcessRunner() = default;
ProcessRunner::~ProcessRunner() = default;

ProcessResult ProcessRunner::run(const ProcessSpec& psSpec) {
  if (psSpec.vArgs.empty()) {
    throw std::invalid_argument("ProcessRunner: empty command");
  }

  // Build argv before fork; the child must not allocate.
  std::vector<char*> vArgv;
  vArgv.reserve(psSpec.vArgs.size() + 1);
  for (const auto& sArg : psSpec.vArgs) {
    vArgv.push_back(const_cast<char*>(sArg.c_str()));
  }
  vArgv.push_back(nullptr);

  Pipe pipeOut;
  Pipe pipeErr;

  auto spLog = Logger::get();
  spLog->debug("Running: {} (cwd={})", describeCommand(psSpec.vArgs),
               psSpec.sWorkingDir.empty() ? "." : psSpec.sWorkingDir);

  const pid_t pid = ::fork();
  if (pid == -1) {
    throw std::system_error(errno, std::generic_category(), "fork");
  }

  if (pid == 0) {
    // Child
    ::dup2(pipeOut.writeFd(), STDOUT_FILENO);
    ::dup2(pipeErr.writeFd(), STDERR_FILENO);
    if (!psSpec.sWorkingDir.empty() && ::chdir(psSpec.sWorkingDir.c_str()) != 0) {
      _exit(127);
    }
    ::execvp(vArgv[0], vArgv.data());
    _exit(127);
  }

  pipeOut.closeWrite();
  pipeErr.closeWrite();

  ProcessResult pres;
  const auto tpDeadline = std::chrono::steady_clock::now() + psSpec.durTimeout;

  pollfd vPoll[2] = {{pipeOut.readFd(), POLLIN, 0}, {pipeErr.readFd(), POLLIN, 0}};
  std::string* vSinks[2] = {&pres.sStdout, &pres.sStderr};
  int iOpen = 2;
  char buf[4096];

  while (iOpen > 0) {
    const auto durLeft = std::chrono::duration_cast<std::chrono::milliseconds>(
        tpDeadline - std::chrono::steady_clock::now());
    if (durLeft.count() <= 0) {
      pres.bTimedOut = true;
      break;
    }

    const int iReady = ::poll(vPoll, 2, static_cast<int>(durLeft.count()));
    if (iReady < 0) {
      if (errno == EINTR) continue;
      const int iErr = errno;
      ::kill(pid, SIGKILL);
      ::waitpid(pid, nullptr, 0);
      throw std::system_error(iErr, std::generic_category(), "poll");
    }
    if (iReady == 0) {
      pres.bTimedOut = true;
      break;
    }

    for (int i = 0; i < 2; ++i) {
      if (vPoll[i].fd < 0 || vPoll[i].revents == 0) continue;
      const ssize_t nRead = ::read(vPoll[i].fd, buf, sizeof(buf));
      if (nRead > 0) {
        vSinks[i]->append(buf, static_cast<size_t>(nRead));
      } else if (nRead == 0 || errno != EINTR) {
        vPoll[i].fd = -1;
        --iOpen;
      }
    }
  }

  int iStatus = 0;
  if (pres.bTimedOut) {
    ::kill(pid, SIGKILL);
    spLog->warn("Command timed out after {}s: {}", psSpec.durTimeout.count(),
                describeCommand(psSpec.vArgs));
  }
  while (::waitpid(pid, &iStatus, 0) == -1) {
    if (errno != EINTR) {
      throw std::system_error(errno, std::generic_category(), "waitpid");
    }
  }
  pres.iExitCode = decodeStatus(iStatus);

  return pres;
}

std::string describeCommand(const std::vector<std::string>& vArgs) {
  std::ostringstream oss;
  for (size_t i = 0; i < vArgs.size(); ++i) {
    if (i > 0) oss << ' ';
    oss << vArgs[i];
  }
  return oss.str();
}

std::vector<std::string> splitCommand(const std::string& sCommand) {
  std::vector<std::string> vArgs;
  std::istringstream iss(sCommand);
  std::string sToken;
  while (iss >> sToken) {
    vArgs.push_back(sToken);
  }
  return vArgs;
}

}  // namespace sbu::common
