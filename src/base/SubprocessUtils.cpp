#include "SubprocessUtils.hpp"

namespace lt {
optional<string> SubprocessUtils::SubprocessToString(
    const string& command, const vector<string>& args) {
  int link_client[2];
  char buf_client[4096];
  if (pipe(link_client) == -1) {
    LOG(WARNING) << "pipe() failed: " << strerror(GetErrno());
    return nullopt;
  }

  pid_t pid = fork();
  if (pid == 0) {
    // child process
    dup2(link_client[1], STDOUT_FILENO);
    close(link_client[0]);
    close(link_client[1]);
    int devNull = ::open("/dev/null", O_WRONLY);
    if (devNull >= 0) {
      dup2(devNull, STDERR_FILENO);
      close(devNull);
    }

    vector<char*> argsArray;
    argsArray.push_back(strdup(command.c_str()));
    for (const auto& arg : args) {
      argsArray.push_back(strdup(arg.c_str()));
    }
    argsArray.push_back(NULL);
    execvp(command.c_str(), argsArray.data());
    _exit(127);
  } else if (pid > 0) {
    close(link_client[1]);
    string output;
    while (true) {
      int nbytes = read(link_client[0], buf_client, sizeof(buf_client));
      if (nbytes < 0 && GetErrno() == EINTR) {
        continue;
      }
      if (nbytes <= 0) {
        break;
      }
      output += string(buf_client, nbytes);
    }
    close(link_client[0]);
    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
      if (GetErrno() != EINTR) {
        return nullopt;
      }
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
      VLOG(1) << command << " exited with status " << status;
      return nullopt;
    }
    return output;
  } else {
    LOG(WARNING) << "Failed to fork: " << strerror(GetErrno());
    close(link_client[0]);
    close(link_client[1]);
    return nullopt;
  }
}
}  // namespace lt
