#ifndef _WIN32

#include "assay/sandbox.hpp"

#include <fcntl.h>
#include <poll.h>
#include <pty.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <termios.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <exception>
#include <thread>

#include "assay/types.hpp"

namespace assay {

namespace {

using Clock = std::chrono::steady_clock;

// Owns the argv/envp storage for execve. Built before fork so the child
// does not allocate.
struct ExecImage {
  std::vector<std::string> argv_storage;
  std::vector<std::string> env_storage;
  std::vector<char*> argv;
  std::vector<char*> envp;

  ExecImage(const ShellInvocation& inv, const std::map<std::string, std::string>& env) {
    argv_storage.push_back(inv.shell);
    argv_storage.insert(argv_storage.end(), inv.args.begin(), inv.args.end());
    for (auto& s : argv_storage) argv.push_back(s.data());
    argv.push_back(nullptr);

    for (const auto& [k, v] : env) env_storage.push_back(k + "=" + v);
    if (!env.contains("TERM")) env_storage.push_back("TERM=xterm-256color");
    for (auto& s : env_storage) envp.push_back(s.data());
    envp.push_back(nullptr);
  }
};

int decode_wait_status(int status) {
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
  return -1;
}

void drain_master(int fd) {
  char buf[4096];
  while (true) {
    const ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n > 0) continue;
    if (n < 0 && errno == EINTR) continue;
    // EAGAIN: nothing buffered. EIO: slave side closed. 0: EOF.
    break;
  }
}

}  // namespace

void kill_process_tree(ProcessId pid) {
  if (pid <= 0) return;
  const pid_t p = static_cast<pid_t>(pid);
  // forkpty() makes the child a session and process-group leader.
  ::killpg(p, SIGTERM);
  ::kill(p, SIGKILL);
}

std::string quote_path_for_shell(const std::string& path) {
  std::string out = "\"";
  for (char c : path) {
    if (c == '"') out += '\\';
    out += c;
  }
  out += '"';
  return out;
}

ShellInvocation build_shell_invocation(const std::string& command, const std::string& stdout_path,
                                       const std::string& stderr_path) {
  ShellInvocation inv;
  inv.shell = "/bin/sh";
  inv.args = {"-c", command + " 1> " + quote_path_for_shell(stdout_path) + " 2> " +
                        quote_path_for_shell(stderr_path)};
  return inv;
}

PtyRunResult run_in_pty(const PtySpec& spec, const KillProcessTreeFn& kill_tree,
                        std::atomic<ProcessId>* current_pid) {
  PtyRunResult result;
  ExecImage image(spec.invocation, spec.env);

  struct winsize ws {};
  ws.ws_col = spec.cols;
  ws.ws_row = spec.rows;

  int master = -1;
  result.started_at_ms = unix_now_ms();
  const pid_t pid = ::forkpty(&master, nullptr, nullptr, &ws);
  if (pid < 0) {
    result.spawn_failed = true;
    result.error_message = "spawn_failed: forkpty errno " + std::to_string(errno);
    result.completed_at_ms = unix_now_ms();
    return result;
  }

  if (pid == 0) {
    if (!spec.cwd.empty() && ::chdir(spec.cwd.c_str()) != 0) _exit(127);
    ::execve(image.argv[0], image.argv.data(), image.envp.data());
    _exit(127);
  }

  result.pid = pid;
  if (current_pid) current_pid->store(pid);
  ::fcntl(master, F_SETFL, ::fcntl(master, F_GETFL) | O_NONBLOCK);

  const auto deadline = Clock::now() + std::chrono::milliseconds(spec.timeout_ms);
  auto hard_kill_at = Clock::time_point::max();
  bool escalated = false;
  int status = 0;

  while (true) {
    struct pollfd pfd {master, POLLIN, 0};
    const int pr = ::poll(&pfd, 1, 20);
    if (pr > 0) drain_master(master);

    const pid_t w = ::waitpid(pid, &status, WNOHANG);
    if (w == pid) break;
    if (w < 0 && errno != EINTR) {
      // Reaped elsewhere or never ours; nothing left to wait for.
      status = -1;
      break;
    }

    const auto now = Clock::now();
    if (!result.timed_out && now >= deadline) {
      result.timed_out = true;
      try {
        kill_tree(pid);
      } catch (const std::exception& e) {
        append_annotation(result.error_message, std::string("kill_failed:") + e.what());
      }
      hard_kill_at = now + std::chrono::milliseconds(spec.kill_grace_ms);
    }
    if (result.timed_out && !escalated && now >= hard_kill_at) {
      ::killpg(pid, SIGKILL);
      ::kill(pid, SIGKILL);
      escalated = true;
    }
  }

  drain_master(master);
  ::close(master);
  if (current_pid) current_pid->store(0);
  result.completed_at_ms = unix_now_ms();
  if (status != -1) result.exit_code = decode_wait_status(status);
  return result;
}

CapturedResult run_captured(const std::vector<std::string>& argv_in, const std::string& cwd,
                            std::uint64_t timeout_ms) {
  CapturedResult result;
  if (argv_in.empty()) return result;

  int out_pipe[2];
  if (::pipe(out_pipe) != 0) return result;

  std::vector<std::string> storage = argv_in;
  std::vector<char*> argv;
  for (auto& s : storage) argv.push_back(s.data());
  argv.push_back(nullptr);

  const pid_t pid = ::fork();
  if (pid < 0) {
    ::close(out_pipe[0]);
    ::close(out_pipe[1]);
    return result;
  }
  if (pid == 0) {
    ::setsid();
    ::dup2(out_pipe[1], STDOUT_FILENO);
    const int devnull = ::open("/dev/null", O_WRONLY);
    if (devnull >= 0) ::dup2(devnull, STDERR_FILENO);
    ::close(out_pipe[0]);
    ::close(out_pipe[1]);
    if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) _exit(127);
    ::execvp(argv[0], argv.data());
    _exit(127);
  }

  ::close(out_pipe[1]);
  ::fcntl(out_pipe[0], F_SETFL, O_NONBLOCK);

  const auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);
  char buf[4096];
  int status = 0;
  while (true) {
    ssize_t n = 0;
    while ((n = ::read(out_pipe[0], buf, sizeof(buf))) > 0) {
      result.stdout_text.append(buf, static_cast<size_t>(n));
    }
    const pid_t w = ::waitpid(pid, &status, WNOHANG);
    if (w == pid) break;
    if (Clock::now() >= deadline) {
      ::killpg(pid, SIGKILL);
      ::kill(pid, SIGKILL);
      ::waitpid(pid, &status, 0);
      result.timed_out = true;
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  ssize_t n = 0;
  while ((n = ::read(out_pipe[0], buf, sizeof(buf))) > 0) {
    result.stdout_text.append(buf, static_cast<size_t>(n));
  }
  ::close(out_pipe[0]);

  result.exit_code = decode_wait_status(status);
  result.ok = !result.timed_out && result.exit_code == 0;
  return result;
}

}  // namespace assay

#endif
