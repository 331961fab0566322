#include "ChildProcess.hpp"

namespace lt {
ChildProcess::~ChildProcess() {
  if (outputThread.joinable()) {
    outputThread.join();
  }
  if (stdoutFd >= 0) {
    ::close(stdoutFd);
  }
  if (stderrFd >= 0) {
    ::close(stderrFd);
  }
}

void ChildProcess::start() {
  if (command.empty()) {
    throw std::runtime_error("No command to run");
  }
  if (pid > 0) {
    throw std::runtime_error("Child process already started");
  }

  int stdoutPipe[2] = {-1, -1};
  int stderrPipe[2] = {-1, -1};
  if (captureSink) {
    if (pipe(stdoutPipe) == -1 || pipe(stderrPipe) == -1) {
      int pipeErrno = GetErrno();
      for (int fd : {stdoutPipe[0], stdoutPipe[1], stderrPipe[0], stderrPipe[1]}) {
        if (fd >= 0) {
          ::close(fd);
        }
      }
      throw std::runtime_error(string("Could not create output pipes: ") +
                               strerror(pipeErrno));
    }
  }

  // Everything the child needs is prepared before fork
  vector<string> envStrings;
  for (const auto& it : environment) {
    envStrings.push_back(it.first + "=" + it.second);
  }
  vector<char*> argv;
  for (auto& arg : command) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(NULL);

  pid = fork();
  if (pid == -1) {
    int forkErrno = GetErrno();
    if (captureSink) {
      ::close(stdoutPipe[0]);
      ::close(stdoutPipe[1]);
      ::close(stderrPipe[0]);
      ::close(stderrPipe[1]);
    }
    throw std::runtime_error(string("Could not fork: ") + strerror(forkErrno));
  }

  if (pid == 0) {
    // child process
    if (captureSink) {
      dup2(stdoutPipe[1], STDOUT_FILENO);
      dup2(stderrPipe[1], STDERR_FILENO);
      ::close(stdoutPipe[0]);
      ::close(stdoutPipe[1]);
      ::close(stderrPipe[0]);
      ::close(stderrPipe[1]);
    }
    ::signal(SIGINT, SIG_DFL);
    ::signal(SIGPIPE, SIG_DFL);
    for (auto& entry : envStrings) {
      ::putenv(&entry[0]);
    }
    execvp(argv[0], argv.data());
    string message = string("Could not run ") + argv[0] + ": " +
                     strerror(GetErrno()) + "\n";
    ssize_t ignored = ::write(STDERR_FILENO, message.c_str(), message.size());
    (void)ignored;
    _exit(127);
  }

  LOG(INFO) << "Started child " << pid << ": " << command[0];
  if (captureSink) {
    ::close(stdoutPipe[1]);
    ::close(stderrPipe[1]);
    stdoutFd = stdoutPipe[0];
    stderrFd = stderrPipe[0];
    outputThread = thread(&ChildProcess::pumpOutput, this);
  }
}

void ChildProcess::pumpOutput() {
  el::Helpers::setThreadName("child-output");
  char buf[64 * 1024];
  bool stdoutOpen = true;
  bool stderrOpen = true;
  while (stdoutOpen || stderrOpen) {
    fd_set rfd;
    FD_ZERO(&rfd);
    int maxFd = -1;
    if (stdoutOpen) {
      FD_SET(stdoutFd, &rfd);
      maxFd = max(maxFd, stdoutFd);
    }
    if (stderrOpen) {
      FD_SET(stderrFd, &rfd);
      maxFd = max(maxFd, stderrFd);
    }
    timeval tv;
    tv.tv_sec = 0;
    tv.tv_usec = 10000;
    int rc = select(maxFd + 1, &rfd, NULL, NULL, &tv);
    if (rc < 0) {
      if (GetErrno() == EINTR) {
        continue;
      }
      STERROR << "select() on child output failed: " << strerror(GetErrno());
      return;
    }
    for (int stream = 0; stream < 2; stream++) {
      int fd = stream == 0 ? stdoutFd : stderrFd;
      bool& open = stream == 0 ? stdoutOpen : stderrOpen;
      if (!open || !FD_ISSET(fd, &rfd)) {
        continue;
      }
      ssize_t bytesRead = ::read(fd, buf, sizeof(buf));
      if (bytesRead < 0 && (GetErrno() == EINTR || GetErrno() == EAGAIN)) {
        continue;
      }
      if (bytesRead <= 0) {
        open = false;
        continue;
      }
      string chunk(buf, bytesRead);
      if (stream == 0) {
        captureSink->writeStdout(chunk);
      } else {
        captureSink->writeStderr(chunk);
      }
    }
  }
}

int ChildProcess::wait() {
  if (pid <= 0) {
    throw std::runtime_error("Child process was never started");
  }
  int status = 0;
  while (waitpid(pid, &status, 0) == -1) {
    if (GetErrno() != EINTR) {
      throw std::runtime_error(string("waitpid failed: ") +
                               strerror(GetErrno()));
    }
  }
  if (outputThread.joinable()) {
    outputThread.join();
  }
  if (WIFEXITED(status)) {
    LOG(INFO) << "Child " << pid << " exited with " << WEXITSTATUS(status);
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    LOG(INFO) << "Child " << pid << " killed by signal " << WTERMSIG(status);
    return 128 + WTERMSIG(status);
  }
  return 1;
}
}  // namespace lt
