#pragma once

#include <sys/types.h>

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "line_ring.hpp"

namespace macrelay::process {

struct ProcessOptions {
  // pipe stdout back to the parent; otherwise it goes to /dev/null
  bool capture_stdout = true;

  std::size_t stderr_tail_lines = 50;

  // called from the stderr reader thread for every line
  std::function<void(const std::string&)> on_stderr_line;
};

/*
  Supervised child process.

  The child runs in its own process group with stdin on /dev/null. Its
  stderr is drained by a dedicated thread into a ring buffer, so a child
  that floods diagnostics never blocks the stdout relay.

  Exit codes: WEXITSTATUS for a normal exit, -signal when killed.
  The destructor kills and reaps a child that is still running.
*/
class Process {
 public:
  // longer stderr output without a line end is split into pieces of this size
  static constexpr std::size_t kMaxStderrLine = 4096;

  static std::unique_ptr<Process> Spawn(const std::vector<std::string>& argv, ProcessOptions options = {});

  ~Process();

  Process(const Process&)            = delete;
  Process& operator=(const Process&) = delete;

  pid_t Pid() const {
    return pid_;
  }

  // Blocking read of stdout. Returns 0 at end of output.
  std::size_t Read(char* buffer, std::size_t size);

  // Non-blocking; nullopt while the child is running.
  std::optional<int> Poll();

  int                Wait();
  std::optional<int> WaitFor(std::chrono::milliseconds timeout);

  bool Running() {
    return !Poll().has_value();
  }

  void Terminate();
  void Kill();

  // SIGTERM, wait up to grace, then SIGKILL. Returns the exit code.
  int Stop(std::chrono::milliseconds grace);

  std::vector<std::string> StderrTail(std::size_t lines) const;

 private:
  Process(pid_t pid, int stdout_fd, int stderr_fd, ProcessOptions options);

  void DrainStderr(int fd);
  void Signal(int sig);

  pid_t pid_;
  int   stdout_fd_;

  ProcessOptions           options_;
  LineRing                 tail_;
  std::thread              stderr_thread_;
  mutable std::mutex       status_mutex_;
  std::optional<int>       exit_code_;
};

using SpawnFn = std::function<std::unique_ptr<Process>(const std::vector<std::string>&, ProcessOptions)>;

// Process::Spawn as a SpawnFn.
SpawnFn DefaultSpawner();

// Splits a command line on whitespace; no quoting rules.
std::vector<std::string> SplitCommand(const std::string& command);

} // namespace macrelay::process
