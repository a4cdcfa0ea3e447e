#include "process.hpp"

#include <fcntl.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <sstream>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

extern char** environ;

namespace macrelay::process {

namespace {

using namespace std::chrono_literals;

std::string Errno(const char* what, int err) {
  return std::string(what) + ": " + std::strerror(err);
}

int DecodeStatus(int status) {
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  if (WIFSIGNALED(status)) return -WTERMSIG(status);
  return -1;
}

/*
  posix_spawn attributes and file actions, destroyed on scope exit.
*/
struct SpawnSetup {
  posix_spawnattr_t          attr;
  posix_spawn_file_actions_t actions;

  SpawnSetup() {
    posix_spawnattr_init(&attr);
    posix_spawn_file_actions_init(&actions);
  }
  ~SpawnSetup() {
    posix_spawn_file_actions_destroy(&actions);
    posix_spawnattr_destroy(&attr);
  }
};

void ClosePair(int fds[2]) {
  if (fds[0] >= 0) ::close(fds[0]);
  if (fds[1] >= 0) ::close(fds[1]);
}

} // namespace

std::unique_ptr<Process> Process::Spawn(const std::vector<std::string>& argv, ProcessOptions options) {
  if (argv.empty()) throw util::ProcessError("empty command");

  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  if (options.capture_stdout && ::pipe2(out_pipe, O_CLOEXEC) != 0) {
    throw util::ProcessError(Errno("pipe", errno));
  }
  if (::pipe2(err_pipe, O_CLOEXEC) != 0) {
    const int err = errno;
    ClosePair(out_pipe);
    throw util::ProcessError(Errno("pipe", err));
  }

  SpawnSetup setup;

  posix_spawn_file_actions_addopen(&setup.actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
  if (options.capture_stdout) {
    posix_spawn_file_actions_adddup2(&setup.actions, out_pipe[1], STDOUT_FILENO);
  } else {
    posix_spawn_file_actions_addopen(&setup.actions, STDOUT_FILENO, "/dev/null", O_WRONLY, 0);
  }
  posix_spawn_file_actions_adddup2(&setup.actions, err_pipe[1], STDERR_FILENO);

  // own process group so a signal reaches shell children too
  sigset_t defaults;
  sigemptyset(&defaults);
  sigaddset(&defaults, SIGPIPE);
  sigaddset(&defaults, SIGTERM);
  sigaddset(&defaults, SIGINT);
  sigaddset(&defaults, SIGHUP);
  sigset_t empty;
  sigemptyset(&empty);
  posix_spawnattr_setsigdefault(&setup.attr, &defaults);
  posix_spawnattr_setsigmask(&setup.attr, &empty);
  posix_spawnattr_setpgroup(&setup.attr, 0);
  posix_spawnattr_setflags(&setup.attr, POSIX_SPAWN_SETSIGDEF | POSIX_SPAWN_SETSIGMASK | POSIX_SPAWN_SETPGROUP);

  std::vector<char*> args;
  args.reserve(argv.size() + 1);
  for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
  args.push_back(nullptr);

  pid_t     pid = -1;
  const int rc  = ::posix_spawnp(&pid, args[0], &setup.actions, &setup.attr, args.data(), environ);

  if (out_pipe[1] >= 0) ::close(out_pipe[1]);
  ::close(err_pipe[1]);

  if (rc != 0) {
    if (out_pipe[0] >= 0) ::close(out_pipe[0]);
    ::close(err_pipe[0]);
    throw util::ProcessError(Errno(("spawn " + argv[0]).c_str(), rc));
  }

  MACRELAY_LOG_DEBUG("Spawned process", {observability::StringField("program", argv[0]), observability::IntField("pid", pid)});
  return std::unique_ptr<Process>(new Process(pid, out_pipe[0], err_pipe[0], std::move(options)));
}

Process::Process(pid_t pid, int stdout_fd, int stderr_fd, ProcessOptions options)
    : pid_(pid), stdout_fd_(stdout_fd), options_(std::move(options)), tail_(options_.stderr_tail_lines) {
  stderr_thread_ = std::thread(&Process::DrainStderr, this, stderr_fd);
}

Process::~Process() {
  if (!Poll()) {
    Kill();
    Wait();
  }
  // leftover group members would keep the stderr pipe open
  ::kill(-pid_, SIGKILL);
  if (stdout_fd_ >= 0) ::close(stdout_fd_);
  if (stderr_thread_.joinable()) stderr_thread_.join();
}

void Process::DrainStderr(int fd) {
  std::string line;
  char        buf[4096];

  auto emit = [this, &line] {
    if (options_.on_stderr_line) options_.on_stderr_line(line);
    tail_.Push(std::move(line));
    line.clear();
  };

  for (;;) {
    const ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) break;

    // ffmpeg ends progress lines with '\r' alone
    for (ssize_t i = 0; i < n; ++i) {
      const char c = buf[i];
      if (c == '\n' || c == '\r') {
        if (!line.empty()) emit();
        continue;
      }
      line.push_back(c);
      if (line.size() >= kMaxStderrLine) emit();
    }
  }

  if (!line.empty()) emit();
  ::close(fd);
}

std::size_t Process::Read(char* buffer, std::size_t size) {
  if (stdout_fd_ < 0) return 0;

  for (;;) {
    const ssize_t n = ::read(stdout_fd_, buffer, size);
    if (n >= 0) return static_cast<std::size_t>(n);
    if (errno == EINTR) continue;
    throw util::ProcessError(Errno("read stdout", errno));
  }
}

std::optional<int> Process::Poll() {
  std::lock_guard lock(status_mutex_);
  if (exit_code_) return exit_code_;

  int         status = 0;
  const pid_t rc     = ::waitpid(pid_, &status, WNOHANG);
  if (rc == pid_) {
    exit_code_ = DecodeStatus(status);
  } else if (rc < 0 && errno == ECHILD) {
    exit_code_ = -1;
  }
  return exit_code_;
}

int Process::Wait() {
  for (;;) {
    if (auto code = Poll()) return *code;
    std::this_thread::sleep_for(10ms);
  }
}

std::optional<int> Process::WaitFor(std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  for (;;) {
    if (auto code = Poll()) return code;
    if (std::chrono::steady_clock::now() >= deadline) return std::nullopt;
    std::this_thread::sleep_for(10ms);
  }
}

void Process::Signal(int sig) {
  if (Poll()) return;
  // the group shares the child's pid
  if (::kill(-pid_, sig) != 0) ::kill(pid_, sig);
}

void Process::Terminate() {
  Signal(SIGTERM);
}

void Process::Kill() {
  Signal(SIGKILL);
}

int Process::Stop(std::chrono::milliseconds grace) {
  Terminate();
  if (auto code = WaitFor(grace)) return *code;

  MACRELAY_LOG_WARN("Process ignored SIGTERM, killing", {observability::IntField("pid", pid_)});
  Kill();
  return Wait();
}

std::vector<std::string> Process::StderrTail(std::size_t lines) const {
  return tail_.Last(lines);
}

SpawnFn DefaultSpawner() {
  return [](const std::vector<std::string>& argv, ProcessOptions options) { return Process::Spawn(argv, std::move(options)); };
}

std::vector<std::string> SplitCommand(const std::string& command) {
  std::vector<std::string> out;
  std::istringstream       in(command);
  std::string              token;
  while (in >> token) out.push_back(token);
  return out;
}

} // namespace macrelay::process
