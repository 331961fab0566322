#ifndef __LT_CHILD_PROCESS__
#define __LT_CHILD_PROCESS__

#include "Headers.hpp"
#include "LogSink.hpp"

namespace lt {
/**
 * @brief A command run under a host, with extra environment variables.
 *
 * With a capture sink the child's stdout and stderr are read through pipes
 * and replayed as writeStdout/writeStderr calls; without one the child
 * inherits the host's streams.
 */
class ChildProcess {
 public:
  ChildProcess(const vector<string>& _command,
               const map<string, string>& _environment,
               shared_ptr<LogSink> _captureSink = shared_ptr<LogSink>())
      : command(_command),
        environment(_environment),
        captureSink(_captureSink),
        pid(-1),
        stdoutFd(-1),
        stderrFd(-1) {}

  virtual ~ChildProcess();

  /**
   * @brief Forks and executes the command.
   * @throws std::runtime_error when the command is empty or fork fails.
   * A command that cannot be executed exits with status 127.
   */
  void start();

  /**
   * @brief Waits for the child and for its captured output to be replayed.
   * @return The exit status, or 128 plus the signal number when the child
   * was killed.
   */
  int wait();

  pid_t getPid() const { return pid; }

 protected:
  void pumpOutput();

  vector<string> command;
  map<string, string> environment;
  shared_ptr<LogSink> captureSink;
  pid_t pid;
  int stdoutFd;
  int stderrFd;
  thread outputThread;
};
}  // namespace lt

#endif  // __LT_CHILD_PROCESS__
