#pragma once
/*
 * Process
 *
 * Purpose: RAII handle of a spawned child with optional stdin/stdout pipes.
 * Usage: spawn_process(argv, PipeMode::Stdin, proc, msg); write to
 *        proc.stdin_fd(); proc.close_stdin(); proc.wait(status, msg).
 * Note: a child still running when the handle dies is killed and reaped.
 */
#include <string>
#include <vector>
#include <sys/types.h>
#include "posix_fd.hpp"
#include "types.hpp"

enum class PipeMode { Stdin, Stdout };

class Process {
public:
  Process() = default;
  Process(const Process&) = delete;
  Process& operator=(const Process&) = delete;
  Process(Process&& other) noexcept;
  Process& operator=(Process&& other) noexcept;
  ~Process();

  bool running() const { return pid_ > 0; }
  pid_t pid() const { return pid_; }
  int stdin_fd() const { return in_.get(); }
  int stdout_fd() const { return out_.get(); }

  /* signals end-of-input to the child; returns 0 or errno */
  int close_stdin() { return in_.close_checked(); }
  bool wait(ExitStatus& status, std::string& msg);
  /* best effort: SIGKILL and reap, errors ignored */
  void kill();

private:
  friend bool spawn_process(const std::vector<std::string>& argv, PipeMode mode,
                            Process& out, std::string& msg);

  pid_t pid_ = -1;
  UniqueFd in_;
  UniqueFd out_;
};

bool spawn_process(const std::vector<std::string>& argv, PipeMode mode,
                   Process& out, std::string& msg);

std::string describe_exit(const ExitStatus& status);

/* blocks SIGPIPE for the calling thread while alive; a SIGPIPE raised in
 * that window is consumed so writes report EPIPE instead */
class SigpipeGuard {
public:
  SigpipeGuard();
  ~SigpipeGuard();
  SigpipeGuard(const SigpipeGuard&) = delete;
  SigpipeGuard& operator=(const SigpipeGuard&) = delete;
private:
  bool was_pending_ = false;
  bool was_blocked_ = false;
};
