#include "process.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <pthread.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

Process::Process(Process&& other) noexcept
  : pid_(other.pid_), in_(std::move(other.in_)), out_(std::move(other.out_)) {
  other.pid_ = -1;
}

Process& Process::operator=(Process&& other) noexcept {
  if (this != &other) {
    kill();
    pid_ = other.pid_;
    in_ = std::move(other.in_);
    out_ = std::move(other.out_);
    other.pid_ = -1;
  }
  return *this;
}

Process::~Process() { kill(); }

bool Process::wait(ExitStatus& status, std::string& msg) {
  if (pid_ <= 0) { msg = "no child process to wait for"; return false; }
  in_.reset();
  int ws = 0;
  pid_t r;
  do { r = ::waitpid(pid_, &ws, 0); } while (r < 0 && errno == EINTR);
  if (r < 0) { msg = std::string("waitpid failed: ") + std::strerror(errno); return false; }
  pid_ = -1;
  out_.reset();
  if (WIFEXITED(ws)) { status.kind = ExitStatus::Kind::Exited; status.code = WEXITSTATUS(ws); }
  else if (WIFSIGNALED(ws)) { status.kind = ExitStatus::Kind::Signaled; status.code = WTERMSIG(ws); }
  else { status.kind = ExitStatus::Kind::Unknown; status.code = 0; }
  return true;
}

void Process::kill() {
  in_.reset();
  out_.reset();
  if (pid_ <= 0) return;
  (void)::kill(pid_, SIGKILL);
  pid_t r;
  do { r = ::waitpid(pid_, nullptr, 0); } while (r < 0 && errno == EINTR);
  pid_ = -1;
}

std::string describe_exit(const ExitStatus& status) {
  switch (status.kind) {
    case ExitStatus::Kind::Exited: return "exit " + std::to_string(status.code);
    case ExitStatus::Kind::Signaled: return "signal " + std::to_string(status.code);
    case ExitStatus::Kind::Unknown: break;
  }
  return "unknown status";
}

namespace {
struct SpawnActions {
  posix_spawn_file_actions_t fa;
  bool ok = false;
  SpawnActions() { ok = (::posix_spawn_file_actions_init(&fa) == 0); }
  ~SpawnActions() { if (ok) ::posix_spawn_file_actions_destroy(&fa); }
};
}

bool spawn_process(const std::vector<std::string>& argv, PipeMode mode,
                   Process& out, std::string& msg) {
  if (argv.empty() || argv[0].empty()) { msg = "clipboard command is empty"; return false; }
  int fds[2];
  if (::pipe(fds) != 0) { msg = std::string("can not create pipe: ") + std::strerror(errno); return false; }
  UniqueFd rd(fds[0]);
  UniqueFd wr(fds[1]);
  (void)::fcntl(rd.get(), F_SETFD, FD_CLOEXEC);
  (void)::fcntl(wr.get(), F_SETFD, FD_CLOEXEC);

  SpawnActions act;
  if (!act.ok) { msg = "can not init spawn actions"; return false; }
  int rc = 0;
  if (mode == PipeMode::Stdin) {
    rc |= ::posix_spawn_file_actions_adddup2(&act.fa, rd.get(), STDIN_FILENO);
    rc |= ::posix_spawn_file_actions_addopen(&act.fa, STDOUT_FILENO, "/dev/null", O_WRONLY, 0);
  } else {
    rc |= ::posix_spawn_file_actions_addopen(&act.fa, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    rc |= ::posix_spawn_file_actions_adddup2(&act.fa, wr.get(), STDOUT_FILENO);
  }
  rc |= ::posix_spawn_file_actions_addopen(&act.fa, STDERR_FILENO, "/dev/null", O_WRONLY, 0);
  if (rc != 0) { msg = "can not set up spawn actions"; return false; }

  std::vector<char*> args;
  args.reserve(argv.size() + 1);
  for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
  args.push_back(nullptr);

  pid_t pid = -1;
  rc = ::posix_spawnp(&pid, args[0], &act.fa, nullptr, args.data(), environ);
  if (rc != 0) { msg = "can not spawn " + argv[0] + ": " + std::strerror(rc); return false; }

  Process p;
  p.pid_ = pid;
  if (mode == PipeMode::Stdin) p.in_ = std::move(wr);
  else p.out_ = std::move(rd);
  out = std::move(p);
  return true;
}

SigpipeGuard::SigpipeGuard() {
  sigset_t pending;
  sigemptyset(&pending);
  if (::sigpending(&pending) == 0) was_pending_ = sigismember(&pending, SIGPIPE) == 1;
  sigset_t set, old;
  sigemptyset(&set);
  sigaddset(&set, SIGPIPE);
  sigemptyset(&old);
  ::pthread_sigmask(SIG_BLOCK, &set, &old);
  was_blocked_ = sigismember(&old, SIGPIPE) == 1;
}

SigpipeGuard::~SigpipeGuard() {
  sigset_t set;
  sigemptyset(&set);
  sigaddset(&set, SIGPIPE);
  if (!was_pending_) {
    sigset_t pending;
    sigemptyset(&pending);
    if (::sigpending(&pending) == 0 && sigismember(&pending, SIGPIPE) == 1) {
#if defined(__APPLE__)
      int sig = 0;
      (void)::sigwait(&set, &sig);
#else
      struct timespec zero{0, 0};
      while (::sigtimedwait(&set, nullptr, &zero) < 0 && errno == EINTR) {}
#endif
    }
  }
  if (!was_blocked_) ::pthread_sigmask(SIG_UNBLOCK, &set, nullptr);
}
