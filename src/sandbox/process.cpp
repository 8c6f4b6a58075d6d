#include "cowork/sandbox/process.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace cowork::sandbox {

namespace {

void set_non_blocking(const int fd) {
  const int flags = fcntl(fd, F_GETFL, 0);
  if (flags >= 0) {
    (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  }
}

void close_fd(int &fd) {
  if (fd >= 0) {
    close(fd);
    fd = -1;
  }
}

// Drains what is readable now. Returns false once the writer side is closed.
bool drain(const int fd, std::string &buffer, const std::size_t cap, bool &truncated) {
  std::array<char, 4096> chunk{};
  while (true) {
    const ssize_t bytes = read(fd, chunk.data(), chunk.size());
    if (bytes > 0) {
      const std::size_t room = cap > buffer.size() ? cap - buffer.size() : 0;
      const auto take = std::min(room, static_cast<std::size_t>(bytes));
      buffer.append(chunk.data(), take);
      if (take < static_cast<std::size_t>(bytes)) {
        truncated = true;
      }
      continue;
    }
    if (bytes == 0) {
      return false;
    }
    if (errno == EINTR) {
      continue;
    }
    return errno == EAGAIN || errno == EWOULDBLOCK;
  }
}

} // namespace

std::string join_args(const std::vector<std::string> &args) {
  std::string out;
  for (const auto &arg : args) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    out += arg;
  }
  return out;
}

common::Result<ProcessResult> PosixProcessRunner::run(const std::vector<std::string> &argv,
                                                      const ProcessOptions &options) {
  if (argv.empty()) {
    return common::Result<ProcessResult>::failure("command is empty");
  }

  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  if (pipe(out_pipe) != 0 || pipe(err_pipe) != 0) {
    close_fd(out_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[0]);
    close_fd(err_pipe[1]);
    return common::Result<ProcessResult>::failure(std::string("failed to create pipes: ") +
                                                  std::strerror(errno));
  }

  const pid_t pid = fork();
  if (pid < 0) {
    close_fd(out_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[0]);
    close_fd(err_pipe[1]);
    return common::Result<ProcessResult>::failure("failed to fork: " + join_args(argv));
  }

  if (pid == 0) {
    (void)setpgid(0, 0);
    (void)dup2(out_pipe[1], STDOUT_FILENO);
    (void)dup2(err_pipe[1], STDERR_FILENO);
    const int devnull = open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      (void)dup2(devnull, STDIN_FILENO);
      close(devnull);
    }
    close(out_pipe[0]);
    close(out_pipe[1]);
    close(err_pipe[0]);
    close(err_pipe[1]);

    if (!options.working_dir.empty() && chdir(options.working_dir.c_str()) != 0) {
      const std::string msg = "cannot enter " + options.working_dir.string() + "\n";
      (void)write(STDERR_FILENO, msg.data(), msg.size());
      _exit(126);
    }
    for (const auto &[key, value] : options.env) {
      (void)setenv(key.c_str(), value.c_str(), 1);
    }

    std::vector<char *> args;
    args.reserve(argv.size() + 1);
    for (const auto &arg : argv) {
      args.push_back(const_cast<char *>(arg.c_str()));
    }
    args.push_back(nullptr);
    execvp(args[0], args.data());
    _exit(127);
  }

  close_fd(out_pipe[1]);
  close_fd(err_pipe[1]);
  set_non_blocking(out_pipe[0]);
  set_non_blocking(err_pipe[0]);

  ProcessResult result;
  int status = 0;
  bool exited = false;
  bool out_open = true;
  bool err_open = true;
  const auto started = std::chrono::steady_clock::now();

  while (!exited || out_open || err_open) {
    if (out_open) {
      out_open = drain(out_pipe[0], result.stdout_text, options.max_output_bytes,
                       result.output_truncated);
    }
    if (err_open) {
      err_open = drain(err_pipe[0], result.stderr_text, options.max_output_bytes,
                       result.output_truncated);
    }

    if (!exited) {
      const pid_t waited = waitpid(pid, &status, WNOHANG);
      if (waited == pid) {
        exited = true;
      } else if (std::chrono::steady_clock::now() - started > options.timeout) {
        result.killed = true;
        (void)kill(-pid, SIGKILL);
        (void)kill(pid, SIGKILL);
        (void)waitpid(pid, &status, 0);
        exited = true;
        break;
      }
    } else if (std::chrono::steady_clock::now() - started > options.timeout) {
      // Grandchildren holding the pipes open.
      (void)kill(-pid, SIGKILL);
      break;
    }

    struct pollfd fds[2] = {
        {.fd = out_open ? out_pipe[0] : -1, .events = POLLIN, .revents = 0},
        {.fd = err_open ? err_pipe[0] : -1, .events = POLLIN, .revents = 0},
    };
    (void)poll(fds, 2, 50);
  }

  bool ignored = false;
  (void)drain(out_pipe[0], result.stdout_text, options.max_output_bytes, ignored);
  (void)drain(err_pipe[0], result.stderr_text, options.max_output_bytes, ignored);
  close_fd(out_pipe[0]);
  close_fd(err_pipe[0]);

  if (result.killed) {
    result.exit_code = -1;
  } else if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  }
  return common::Result<ProcessResult>::success(std::move(result));
}

} // namespace cowork::sandbox
