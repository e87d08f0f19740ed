#include "kata/SubprocessEngine.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <pthread.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <time.h>
#include <unistd.h>

namespace kata {

const char *const kDefaultEngineCommand = "python3 -I -S -";

namespace {
constexpr int kPollTickMs = 20;
constexpr size_t kChunkSize = 16384;

void closeFd(int &fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

bool setNonBlocking(int fd) {
  int flags = fcntl(fd, F_GETFL, 0);
  return flags >= 0 && fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

bool setCloseOnExec(int fd) {
  int flags = fcntl(fd, F_GETFD, 0);
  return flags >= 0 && fcntl(fd, F_SETFD, flags | FD_CLOEXEC) == 0;
}

bool wouldBlock(int code) {
  return code == EAGAIN || code == EWOULDBLOCK || code == EINTR;
}

// Keeps SIGPIPE blocked on this thread while the child's stdin is written; a
// SIGPIPE raised by a child that exited early is consumed before unblocking.
class SigpipeGuard {
public:
  SigpipeGuard() {
    sigemptyset(&pipeSet_);
    sigaddset(&pipeSet_, SIGPIPE);
    sigset_t pending;
    sigemptyset(&pending);
    sigpending(&pending);
    alreadyPending_ = sigismember(&pending, SIGPIPE) == 1;
    blocked_ = pthread_sigmask(SIG_BLOCK, &pipeSet_, &previous_) == 0;
  }

  ~SigpipeGuard() {
    if (!blocked_) {
      return;
    }
    if (!alreadyPending_) {
      sigset_t pending;
      sigemptyset(&pending);
      sigpending(&pending);
      if (sigismember(&pending, SIGPIPE) == 1) {
        timespec zero{0, 0};
        while (sigtimedwait(&pipeSet_, nullptr, &zero) == -1 && errno == EINTR) {
        }
      }
    }
    pthread_sigmask(SIG_SETMASK, &previous_, nullptr);
  }

  SigpipeGuard(const SigpipeGuard &) = delete;
  SigpipeGuard &operator=(const SigpipeGuard &) = delete;

private:
  sigset_t pipeSet_;
  sigset_t previous_;
  bool alreadyPending_ = false;
  bool blocked_ = false;
};

void killGroup(pid_t pid) {
  ::kill(-pid, SIGKILL);
  ::kill(pid, SIGKILL);
}

void reap(pid_t pid, int &status) {
  while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
  }
}

// Reads what is available; closes the descriptor at end of stream.
void drain(const pollfd &entry, int &fd, std::string &out) {
  if ((entry.revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
    return;
  }
  char buffer[kChunkSize];
  ssize_t count = ::read(fd, buffer, sizeof(buffer));
  if (count > 0) {
    out.append(buffer, static_cast<size_t>(count));
  } else if (count == 0 || !wouldBlock(errno)) {
    closeFd(fd);
  }
}
} // namespace

SubprocessEngine::SubprocessEngine(std::vector<std::string> command) : command_(std::move(command)) {}

bool SubprocessEngine::execute(const std::string &program,
                               EngineResult &result,
                               const CancellationToken &cancellation,
                               std::string &error) {
  if (command_.empty()) {
    error = "engine command is empty";
    return false;
  }
  std::vector<char *> argv;
  for (auto &word : command_) {
    argv.push_back(const_cast<char *>(word.c_str()));
  }
  argv.push_back(nullptr);

  int input[2] = {-1, -1};
  int output[2] = {-1, -1};
  int errors[2] = {-1, -1};
  int execStatus[2] = {-1, -1};
  auto closeAll = [&]() {
    for (int *pair : {input, output, errors, execStatus}) {
      closeFd(pair[0]);
      closeFd(pair[1]);
    }
  };
  if (::pipe(input) != 0 || ::pipe(output) != 0 || ::pipe(errors) != 0 || ::pipe(execStatus) != 0) {
    error = std::string("failed to create engine pipes: ") + std::strerror(errno);
    closeAll();
    return false;
  }
  if (!setCloseOnExec(execStatus[1])) {
    error = std::string("failed to configure engine pipes: ") + std::strerror(errno);
    closeAll();
    return false;
  }

  pid_t pid = ::fork();
  if (pid < 0) {
    error = std::string("failed to fork engine: ") + std::strerror(errno);
    closeAll();
    return false;
  }
  if (pid == 0) {
    ::setpgid(0, 0);
    ::dup2(input[0], STDIN_FILENO);
    ::dup2(output[1], STDOUT_FILENO);
    ::dup2(errors[1], STDERR_FILENO);
    ::close(input[0]);
    ::close(input[1]);
    ::close(output[0]);
    ::close(output[1]);
    ::close(errors[0]);
    ::close(errors[1]);
    ::close(execStatus[0]);
    ::execvp(argv[0], argv.data());
    int code = errno;
    ssize_t ignored = ::write(execStatus[1], &code, sizeof(code));
    (void)ignored;
    ::_exit(127);
  }
  ::setpgid(pid, pid);
  closeFd(input[0]);
  closeFd(output[1]);
  closeFd(errors[1]);
  closeFd(execStatus[1]);

  int execError = 0;
  ssize_t execBytes;
  do {
    execBytes = ::read(execStatus[0], &execError, sizeof(execError));
  } while (execBytes < 0 && errno == EINTR);
  closeFd(execStatus[0]);
  if (execBytes == static_cast<ssize_t>(sizeof(execError))) {
    int status = 0;
    reap(pid, status);
    closeAll();
    error = "failed to start engine '" + command_.front() + "': " + std::strerror(execError);
    return false;
  }

  int inputFd = input[1];
  int outFd = output[0];
  int errFd = errors[0];
  input[1] = output[0] = errors[0] = -1;
  if (!setNonBlocking(inputFd) || !setNonBlocking(outFd) || !setNonBlocking(errFd)) {
    error = std::string("failed to configure engine pipes: ") + std::strerror(errno);
    killGroup(pid);
    closeFd(inputFd);
    closeFd(outFd);
    closeFd(errFd);
    int status = 0;
    reap(pid, status);
    return false;
  }

  SigpipeGuard sigpipeGuard;
  std::string out;
  std::string err;
  size_t written = 0;
  if (program.empty()) {
    closeFd(inputFd);
  }
  bool cancelled = false;
  bool failed = false;
  while (outFd >= 0 || errFd >= 0) {
    if (cancellation.isCancelled()) {
      cancelled = true;
      break;
    }
    pollfd fds[3];
    nfds_t count = 0;
    int outIndex = -1;
    int errIndex = -1;
    int inIndex = -1;
    if (outFd >= 0) {
      fds[count] = {outFd, POLLIN, 0};
      outIndex = static_cast<int>(count++);
    }
    if (errFd >= 0) {
      fds[count] = {errFd, POLLIN, 0};
      errIndex = static_cast<int>(count++);
    }
    if (inputFd >= 0) {
      fds[count] = {inputFd, POLLOUT, 0};
      inIndex = static_cast<int>(count++);
    }
    int ready = ::poll(fds, count, kPollTickMs);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      error = std::string("failed to poll engine: ") + std::strerror(errno);
      failed = true;
      break;
    }
    if (ready == 0) {
      continue;
    }
    if (inIndex >= 0 && (fds[inIndex].revents & (POLLOUT | POLLERR | POLLHUP)) != 0) {
      size_t remaining = program.size() - written;
      ssize_t sent = ::write(inputFd, program.data() + written, std::min(remaining, kChunkSize));
      if (sent > 0) {
        written += static_cast<size_t>(sent);
        if (written == program.size()) {
          closeFd(inputFd);
        }
      } else if (sent < 0 && !wouldBlock(errno)) {
        closeFd(inputFd);
      }
    }
    if (outIndex >= 0) {
      drain(fds[outIndex], outFd, out);
    }
    if (errIndex >= 0) {
      drain(fds[errIndex], errFd, err);
    }
  }
  closeFd(inputFd);

  int status = 0;
  bool reaped = false;
  while (!cancelled && !failed) {
    pid_t done = ::waitpid(pid, &status, WNOHANG);
    if (done == pid) {
      reaped = true;
      break;
    }
    if (done < 0 && errno != EINTR) {
      error = std::string("failed to wait for engine: ") + std::strerror(errno);
      failed = true;
      break;
    }
    if (cancellation.waitFor(std::chrono::milliseconds(kPollTickMs))) {
      cancelled = true;
    }
  }
  if (!reaped) {
    killGroup(pid);
    closeFd(outFd);
    closeFd(errFd);
    reap(pid, status);
  }
  closeFd(outFd);
  closeFd(errFd);

  if (failed) {
    return false;
  }
  result = EngineResult();
  result.stdoutText = std::move(out);
  if (cancelled) {
    result.status = EngineResult::Status::Failure;
    result.stderrText = std::string("execution cancelled");
    return true;
  }
  if (WIFEXITED(status) && WEXITSTATUS(status) == 0) {
    result.status = EngineResult::Status::Success;
  } else {
    result.status = EngineResult::Status::Failure;
    if (WIFSIGNALED(status) && err.find_first_not_of(" \t\r\n") == std::string::npos) {
      err = "engine terminated by signal " + std::to_string(WTERMSIG(status));
    }
  }
  result.stderrText = std::move(err);
  return true;
}

bool splitCommandLine(const std::string &text, std::vector<std::string> &out, std::string &error) {
  out.clear();
  std::string word;
  bool inWord = false;
  char quote = '\0';
  for (char c : text) {
    if (quote != '\0') {
      if (c == quote) {
        quote = '\0';
      } else {
        word.push_back(c);
      }
      continue;
    }
    if (c == '\'' || c == '"') {
      quote = c;
      inWord = true;
      continue;
    }
    if (c == ' ' || c == '\t' || c == '\n') {
      if (inWord) {
        out.push_back(word);
        word.clear();
        inWord = false;
      }
      continue;
    }
    word.push_back(c);
    inWord = true;
  }
  if (quote != '\0') {
    error = "unterminated quote in engine command";
    return false;
  }
  if (inWord) {
    out.push_back(word);
  }
  if (out.empty()) {
    error = "engine command is empty";
    return false;
  }
  return true;
}

} // namespace kata
