#include "twig/process.h"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace twig {

namespace {
void close_fd(int& fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

std::vector<std::string> merged_environment(const EnvOverrides& env) {
  std::vector<std::string> out;
  for (char** e = environ; e && *e; ++e) {
    const std::string entry(*e);
    const auto eq = entry.find('=');
    const std::string key = eq == std::string::npos ? entry : entry.substr(0, eq);
    bool overridden = false;
    for (const auto& kv : env) {
      if (kv.first == key) {
        overridden = true;
        break;
      }
    }
    if (!overridden) {
      out.push_back(entry);
    }
  }
  for (const auto& kv : env) {
    out.push_back(kv.first + "=" + kv.second);
  }
  return out;
}

void drain(int& fd, std::string& sink) {
  char buffer[4096];
  const ssize_t n = ::read(fd, buffer, sizeof(buffer));
  if (n > 0) {
    sink.append(buffer, static_cast<size_t>(n));
  } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
    close_fd(fd);
  }
}
} // namespace

ProcessResult ProcessRunner::run(const std::vector<std::string>& args,
                                 const std::filesystem::path& cwd,
                                 const EnvOverrides& env) const {
  ProcessResult result;
  if (args.empty()) {
    result.error_message = "missing command";
    return result;
  }

  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  int exec_pipe[2] = {-1, -1};
  if (::pipe(out_pipe) != 0 || ::pipe(err_pipe) != 0 || ::pipe2(exec_pipe, O_CLOEXEC) != 0) {
    result.error_message = std::string("pipe failed: ") + std::strerror(errno);
    for (int* fd : {&out_pipe[0], &out_pipe[1], &err_pipe[0], &err_pipe[1], &exec_pipe[0], &exec_pipe[1]}) {
      close_fd(*fd);
    }
    return result;
  }

  std::vector<char*> cargs;
  cargs.reserve(args.size() + 1);
  for (const auto& arg : args) {
    cargs.push_back(const_cast<char*>(arg.c_str()));
  }
  cargs.push_back(nullptr);

  const auto env_strings = merged_environment(env);
  std::vector<char*> cenv;
  cenv.reserve(env_strings.size() + 1);
  for (const auto& entry : env_strings) {
    cenv.push_back(const_cast<char*>(entry.c_str()));
  }
  cenv.push_back(nullptr);

  const pid_t pid = ::fork();
  if (pid == 0) {
    int child_errno = 0;
    if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
      child_errno = errno;
      ssize_t ignored = ::write(exec_pipe[1], &child_errno, sizeof(child_errno));
      (void)ignored;
      _exit(127);
    }
    const int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      ::dup2(devnull, STDIN_FILENO);
      ::close(devnull);
    }
    ::dup2(out_pipe[1], STDOUT_FILENO);
    ::dup2(err_pipe[1], STDERR_FILENO);
    ::close(out_pipe[0]);
    ::close(out_pipe[1]);
    ::close(err_pipe[0]);
    ::close(err_pipe[1]);
    ::close(exec_pipe[0]);
    ::execvpe(cargs[0], cargs.data(), cenv.data());
    child_errno = errno;
    ssize_t ignored = ::write(exec_pipe[1], &child_errno, sizeof(child_errno));
    (void)ignored;
    _exit(127);
  }

  close_fd(out_pipe[1]);
  close_fd(err_pipe[1]);
  close_fd(exec_pipe[1]);

  if (pid < 0) {
    result.error_message = std::string("fork failed: ") + std::strerror(errno);
    close_fd(out_pipe[0]);
    close_fd(err_pipe[0]);
    close_fd(exec_pipe[0]);
    return result;
  }

  int out_fd = out_pipe[0];
  int err_fd = err_pipe[0];
  while (out_fd >= 0 || err_fd >= 0) {
    pollfd fds[2];
    nfds_t count = 0;
    if (out_fd >= 0) fds[count++] = pollfd{out_fd, POLLIN, 0};
    if (err_fd >= 0) fds[count++] = pollfd{err_fd, POLLIN, 0};
    const int rc = ::poll(fds, count, -1);
    if (rc < 0) {
      if (errno == EINTR) continue;
      break;
    }
    for (nfds_t i = 0; i < count; ++i) {
      if (fds[i].revents == 0) continue;
      if (fds[i].fd == out_fd) {
        drain(out_fd, result.out);
      } else if (fds[i].fd == err_fd) {
        drain(err_fd, result.err);
      }
    }
  }
  close_fd(out_fd);
  close_fd(err_fd);

  int exec_errno = 0;
  ssize_t n = 0;
  do {
    n = ::read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
  } while (n < 0 && errno == EINTR);
  close_fd(exec_pipe[0]);

  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      result.error_message = std::string("waitpid failed: ") + std::strerror(errno);
      return result;
    }
  }

  if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
    result.error_message = "cannot run " + args[0] + ": " + std::strerror(exec_errno);
    return result;
  }

  result.started = true;
  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  }
  return result;
}

} // namespace twig
