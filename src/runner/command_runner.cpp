#include "berth/runner/command_runner.hpp"

#include "berth/common/fs.hpp"
#include "berth/observability/global.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace berth::runner {

namespace {

void set_non_blocking(const int fd) {
  const int flags = fcntl(fd, F_GETFL, 0);
  if (flags >= 0) {
    (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  }
}

void read_into_buffer(const int fd, std::string &buffer) {
  std::array<char, 4096> chunk{};
  while (true) {
    const ssize_t bytes = read(fd, chunk.data(), chunk.size());
    if (bytes > 0) {
      buffer.append(chunk.data(), static_cast<std::size_t>(bytes));
      continue;
    }
    return;
  }
}

void close_pipe(int (&fds)[2]) {
  for (int &fd : fds) {
    if (fd >= 0) {
      close(fd);
      fd = -1;
    }
  }
}

} // namespace

std::string command_line(const std::vector<std::string> &argv) { return common::join(argv, " "); }

common::Result<CommandResult> SystemCommandRunner::run(const std::vector<std::string> &argv,
                                                       const CommandOptions &options) {
  if (argv.empty()) {
    return common::Result<CommandResult>::failure("command is empty");
  }
  if (options.cancel.cancelled()) {
    return common::Result<CommandResult>::failure("cancelled before running " + argv.front());
  }

  int stdout_pipe[2] = {-1, -1};
  int stderr_pipe[2] = {-1, -1};
  if (pipe(stdout_pipe) != 0 || pipe(stderr_pipe) != 0) {
    close_pipe(stdout_pipe);
    close_pipe(stderr_pipe);
    return common::Result<CommandResult>::failure("failed to create pipes for " + argv.front());
  }

  const auto started = std::chrono::steady_clock::now();
  const pid_t pid = fork();
  if (pid < 0) {
    close_pipe(stdout_pipe);
    close_pipe(stderr_pipe);
    return common::Result<CommandResult>::failure("failed to fork " + argv.front());
  }

  if (pid == 0) {
    (void)setpgid(0, 0);
    const int devnull = open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      (void)dup2(devnull, STDIN_FILENO);
      close(devnull);
    }
    (void)dup2(stdout_pipe[1], STDOUT_FILENO);
    (void)dup2(stderr_pipe[1], STDERR_FILENO);
    close_pipe(stdout_pipe);
    close_pipe(stderr_pipe);

    std::vector<char *> args;
    args.reserve(argv.size() + 1);
    for (const auto &arg : argv) {
      args.push_back(const_cast<char *>(arg.c_str()));
    }
    args.push_back(nullptr);

    execvp(args[0], args.data());
    _exit(127);
  }

  close(stdout_pipe[1]);
  close(stderr_pipe[1]);
  set_non_blocking(stdout_pipe[0]);
  set_non_blocking(stderr_pipe[0]);

  std::string stdout_text;
  std::string stderr_text;
  int status = 0;
  bool timed_out = false;
  bool cancelled = false;

  while (true) {
    read_into_buffer(stdout_pipe[0], stdout_text);
    read_into_buffer(stderr_pipe[0], stderr_text);

    const pid_t waited = waitpid(pid, &status, WNOHANG);
    if (waited == pid) {
      break;
    }

    cancelled = options.cancel.cancelled();
    timed_out = std::chrono::steady_clock::now() - started > options.timeout;
    if (cancelled || timed_out) {
      (void)kill(-pid, SIGKILL);
      (void)kill(pid, SIGKILL);
      (void)waitpid(pid, &status, 0);
      break;
    }

    struct pollfd poll_fds[2] = {
        {.fd = stdout_pipe[0], .events = POLLIN, .revents = 0},
        {.fd = stderr_pipe[0], .events = POLLIN, .revents = 0},
    };
    (void)poll(poll_fds, 2, 50);
  }

  read_into_buffer(stdout_pipe[0], stdout_text);
  read_into_buffer(stderr_pipe[0], stderr_text);
  close(stdout_pipe[0]);
  close(stderr_pipe[0]);

  CommandResult result;
  result.stdout_text = std::move(stdout_text);
  result.stderr_text = std::move(stderr_text);
  result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;

  const std::string line = command_line(argv);
  observability::record_command(line, result.exit_code,
                                std::chrono::duration_cast<std::chrono::milliseconds>(
                                    std::chrono::steady_clock::now() - started));

  if (cancelled) {
    return common::Result<CommandResult>::failure("cancelled: " + line);
  }
  if (timed_out) {
    result.exit_code = -1;
    if (!options.allow_failure) {
      return common::Result<CommandResult>::failure("timed out after " +
                                                    std::to_string(options.timeout.count()) +
                                                    "ms: " + line);
    }
  }
  if (result.exit_code == 127 && result.stderr_text.empty() && !options.allow_failure) {
    return common::Result<CommandResult>::failure(argv.front() + ": command not found");
  }

  if (result.exit_code != 0 && !options.allow_failure) {
    const std::string detail = common::trim(result.stderr_text);
    return common::Result<CommandResult>::failure(detail.empty()
                                                      ? line + " exited with status " +
                                                            std::to_string(result.exit_code)
                                                      : line + ": " + detail);
  }

  return common::Result<CommandResult>::success(std::move(result));
}

} // namespace berth::runner
