#pragma once

// assay/sandbox.hpp — Pseudo-terminal executor and process-tree control.
//
// PLATFORM BACKENDS (selected at build time):
//   src/sandbox_posix.cpp  forkpty(3), killpg(2)              #ifndef _WIN32
//   src/sandbox_win.cpp    ConPTY, taskkill /T /F              #ifdef  _WIN32
//
// EXECUTION MODEL:
//   The resolved command runs under a shell whose stdout/stderr are
//   redirected to raw files inside the run's artifact directory. The shell
//   itself is attached to a pseudo-terminal (80x24) so tools that probe for a
//   TTY behave as they would interactively. Terminal output is drained and
//   discarded; the redirected files are the only captured streams.
//
// TIMEOUT INVARIANT:
//   On expiry the injected KillProcessTreeFn is invoked exactly once. If the
//   shell is still alive kill_grace_ms later the backend escalates with its
//   own hard kill, without calling the injected function again.

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace assay {

// pid_t on POSIX, DWORD process id on Windows. 0 means "no process".
using ProcessId = long long;

using KillProcessTreeFn = std::function<void(ProcessId)>;

// POSIX: SIGTERM to the process group, then SIGKILL to the leader.
// Windows: taskkill /PID <pid> /T /F. Errors are ignored; pid <= 0 is a no-op.
void kill_process_tree(ProcessId pid);

struct ShellInvocation {
  std::string shell;
  std::vector<std::string> args;
};

// Double-quotes a path for the platform shell, backslash-escaping embedded
// double quotes.
std::string quote_path_for_shell(const std::string& path);

// POSIX:   /bin/sh -c '<cmd> 1> "out" 2> "err"'
// Windows: %ComSpec% /d /s /c "<cmd> 1> \"out\" 2> \"err\""
ShellInvocation build_shell_invocation(const std::string& command, const std::string& stdout_path,
                                       const std::string& stderr_path);

struct PtySpec {
  ShellInvocation invocation;
  std::string cwd;
  std::map<std::string, std::string> env;
  std::uint64_t timeout_ms{30000};
  std::uint16_t cols{80};
  std::uint16_t rows{24};
  std::uint64_t kill_grace_ms{5000};
};

struct PtyRunResult {
  std::optional<int> exit_code;  // 128+N for death by signal N on POSIX
  bool timed_out{false};
  bool spawn_failed{false};
  std::string error_message;
  ProcessId pid{0};
  std::uint64_t started_at_ms{0};
  std::uint64_t completed_at_ms{0};
};

// Runs one invocation to completion. `current_pid` is published while the
// child is alive so another thread can kill it; it is reset to 0 on return.
PtyRunResult run_in_pty(const PtySpec& spec, const KillProcessTreeFn& kill_tree,
                        std::atomic<ProcessId>* current_pid);

struct CapturedResult {
  bool ok{false};  // spawned, exited 0, not timed out
  int exit_code{-1};
  bool timed_out{false};
  std::string stdout_text;
};

// Plain pipe capture for short helper commands (git). stderr is discarded.
CapturedResult run_captured(const std::vector<std::string>& argv, const std::string& cwd,
                            std::uint64_t timeout_ms);

}  // namespace assay
