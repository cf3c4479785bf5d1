#ifdef _WIN32
#include "assay/sandbox.hpp"

#include <windows.h>

#include <chrono>
#include <cstdlib>
#include <exception>
#include <string>
#include <thread>

#include "assay/types.hpp"

namespace assay {
namespace {

using Clock = std::chrono::steady_clock;

std::wstring widen(const std::string& s) {
  if (s.empty()) return {};
  const int n = MultiByteToWideChar(CP_UTF8, 0, s.data(), static_cast<int>(s.size()), nullptr, 0);
  std::wstring out(static_cast<size_t>(n), L'\0');
  MultiByteToWideChar(CP_UTF8, 0, s.data(), static_cast<int>(s.size()), out.data(), n);
  return out;
}

std::wstring quote_arg(const std::string& arg) {
  std::wstring out = L"\"";
  for (wchar_t c : widen(arg)) {
    if (c == L'"') out += L'\\';
    out += c;
  }
  out += L"\"";
  return out;
}

// CreateProcessW wants a double-NUL terminated UTF-16 block, sorted by key.
std::wstring build_env_block(const std::map<std::string, std::string>& env) {
  std::wstring block;
  for (const auto& [k, v] : env) {
    block += widen(k + "=" + v);
    block += L'\0';
  }
  if (!env.contains("TERM")) {
    block += L"TERM=xterm-256color";
    block += L'\0';
  }
  block += L'\0';
  return block;
}

struct PseudoConsole {
  HPCON hpc{nullptr};
  HANDLE in_write{nullptr};   // our end of the console's input
  HANDLE out_read{nullptr};   // our end of the console's output

  ~PseudoConsole() {
    if (hpc) ClosePseudoConsole(hpc);
    if (in_write) CloseHandle(in_write);
    if (out_read) CloseHandle(out_read);
  }

  bool open(std::uint16_t cols, std::uint16_t rows) {
    HANDLE in_read = nullptr;
    HANDLE out_write = nullptr;
    if (!CreatePipe(&in_read, &in_write, nullptr, 0)) return false;
    if (!CreatePipe(&out_read, &out_write, nullptr, 0)) {
      CloseHandle(in_read);
      return false;
    }
    COORD size{static_cast<SHORT>(cols), static_cast<SHORT>(rows)};
    const HRESULT hr = CreatePseudoConsole(size, in_read, out_write, 0, &hpc);
    CloseHandle(in_read);
    CloseHandle(out_write);
    return SUCCEEDED(hr);
  }
};

void drain_output(HANDLE h) {
  char buf[4096];
  DWORD avail = 0;
  while (PeekNamedPipe(h, nullptr, 0, nullptr, &avail, nullptr) && avail > 0) {
    DWORD n = 0;
    if (!ReadFile(h, buf, sizeof(buf), &n, nullptr) || n == 0) break;
  }
}

}  // namespace

void kill_process_tree(ProcessId pid) {
  if (pid <= 0) return;
  std::wstring cmd = L"taskkill /PID " + std::to_wstring(pid) + L" /T /F";
  STARTUPINFOW si{};
  si.cb = sizeof(si);
  si.dwFlags = STARTF_USESHOWWINDOW;
  si.wShowWindow = SW_HIDE;
  PROCESS_INFORMATION pi{};
  if (!CreateProcessW(nullptr, cmd.data(), nullptr, nullptr, FALSE, CREATE_NO_WINDOW, nullptr,
                      nullptr, &si, &pi)) {
    return;
  }
  WaitForSingleObject(pi.hProcess, 10000);
  CloseHandle(pi.hThread);
  CloseHandle(pi.hProcess);
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
  const char* comspec = std::getenv("ComSpec");
  inv.shell = (comspec && comspec[0]) ? comspec : "C:\\Windows\\System32\\cmd.exe";
  inv.args = {"/d", "/s", "/c",
              command + " 1> " + quote_path_for_shell(stdout_path) + " 2> " +
                  quote_path_for_shell(stderr_path)};
  return inv;
}

PtyRunResult run_in_pty(const PtySpec& spec, const KillProcessTreeFn& kill_tree,
                        std::atomic<ProcessId>* current_pid) {
  PtyRunResult result;
  result.started_at_ms = unix_now_ms();

  PseudoConsole console;
  if (!console.open(spec.cols, spec.rows)) {
    result.spawn_failed = true;
    result.error_message = "spawn_failed: CreatePseudoConsole";
    result.completed_at_ms = unix_now_ms();
    return result;
  }

  SIZE_T attr_size = 0;
  InitializeProcThreadAttributeList(nullptr, 1, 0, &attr_size);
  std::string attr_storage(attr_size, '\0');
  auto* attrs = reinterpret_cast<LPPROC_THREAD_ATTRIBUTE_LIST>(attr_storage.data());
  if (!InitializeProcThreadAttributeList(attrs, 1, 0, &attr_size) ||
      !UpdateProcThreadAttribute(attrs, 0, PROC_THREAD_ATTRIBUTE_PSEUDOCONSOLE, console.hpc,
                                 sizeof(HPCON), nullptr, nullptr)) {
    result.spawn_failed = true;
    result.error_message = "spawn_failed: proc thread attributes";
    result.completed_at_ms = unix_now_ms();
    return result;
  }

  STARTUPINFOEXW si{};
  si.StartupInfo.cb = sizeof(si);
  si.lpAttributeList = attrs;

  // cmd.exe takes the remainder of its command line verbatim after /c.
  std::wstring cmd = quote_arg(spec.invocation.shell);
  for (size_t i = 0; i < spec.invocation.args.size(); ++i) {
    const bool is_payload = i + 1 == spec.invocation.args.size();
    cmd += L" ";
    cmd += is_payload ? L"\"" + widen(spec.invocation.args[i]) + L"\""
                      : widen(spec.invocation.args[i]);
  }
  std::wstring env_block = build_env_block(spec.env);
  const std::wstring cwd = widen(spec.cwd);

  PROCESS_INFORMATION pi{};
  const BOOL created = CreateProcessW(
      nullptr, cmd.data(), nullptr, nullptr, FALSE,
      EXTENDED_STARTUPINFO_PRESENT | CREATE_UNICODE_ENVIRONMENT, env_block.data(),
      cwd.empty() ? nullptr : cwd.c_str(), &si.StartupInfo, &pi);
  DeleteProcThreadAttributeList(attrs);
  if (!created) {
    result.spawn_failed = true;
    result.error_message = "spawn_failed: CreateProcessW error " + std::to_string(GetLastError());
    result.completed_at_ms = unix_now_ms();
    return result;
  }

  result.pid = static_cast<ProcessId>(pi.dwProcessId);
  if (current_pid) current_pid->store(result.pid);

  const auto deadline = Clock::now() + std::chrono::milliseconds(spec.timeout_ms);
  auto hard_kill_at = Clock::time_point::max();
  bool escalated = false;
  while (true) {
    drain_output(console.out_read);
    if (WaitForSingleObject(pi.hProcess, 20) == WAIT_OBJECT_0) break;
    const auto now = Clock::now();
    if (!result.timed_out && now >= deadline) {
      result.timed_out = true;
      try {
        kill_tree(result.pid);
      } catch (const std::exception& e) {
        append_annotation(result.error_message, std::string("kill_failed:") + e.what());
      }
      hard_kill_at = now + std::chrono::milliseconds(spec.kill_grace_ms);
    }
    if (result.timed_out && !escalated && now >= hard_kill_at) {
      TerminateProcess(pi.hProcess, 1);
      escalated = true;
    }
  }

  DWORD code = 0;
  if (GetExitCodeProcess(pi.hProcess, &code)) result.exit_code = static_cast<int>(code);
  drain_output(console.out_read);
  CloseHandle(pi.hThread);
  CloseHandle(pi.hProcess);
  if (current_pid) current_pid->store(0);
  result.completed_at_ms = unix_now_ms();
  return result;
}

CapturedResult run_captured(const std::vector<std::string>& argv, const std::string& cwd,
                            std::uint64_t timeout_ms) {
  CapturedResult result;
  if (argv.empty()) return result;

  SECURITY_ATTRIBUTES sa{sizeof(SECURITY_ATTRIBUTES), nullptr, TRUE};
  HANDLE out_r = nullptr;
  HANDLE out_w = nullptr;
  if (!CreatePipe(&out_r, &out_w, &sa, 0)) return result;
  SetHandleInformation(out_r, HANDLE_FLAG_INHERIT, 0);

  STARTUPINFOW si{};
  si.cb = sizeof(si);
  si.dwFlags = STARTF_USESTDHANDLES;
  si.hStdOutput = out_w;
  si.hStdError = nullptr;
  si.hStdInput = nullptr;

  std::wstring cmd;
  for (const auto& a : argv) {
    if (!cmd.empty()) cmd += L" ";
    cmd += quote_arg(a);
  }
  const std::wstring wcwd = widen(cwd);
  PROCESS_INFORMATION pi{};
  if (!CreateProcessW(nullptr, cmd.data(), nullptr, nullptr, TRUE, CREATE_NO_WINDOW, nullptr,
                      wcwd.empty() ? nullptr : wcwd.c_str(), &si, &pi)) {
    CloseHandle(out_r);
    CloseHandle(out_w);
    return result;
  }
  CloseHandle(out_w);

  const auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);
  char buf[4096];
  while (true) {
    DWORD avail = 0;
    while (PeekNamedPipe(out_r, nullptr, 0, nullptr, &avail, nullptr) && avail > 0) {
      DWORD n = 0;
      if (!ReadFile(out_r, buf, sizeof(buf), &n, nullptr) || n == 0) break;
      result.stdout_text.append(buf, n);
    }
    if (WaitForSingleObject(pi.hProcess, 2) == WAIT_OBJECT_0) break;
    if (Clock::now() >= deadline) {
      TerminateProcess(pi.hProcess, 1);
      WaitForSingleObject(pi.hProcess, INFINITE);
      result.timed_out = true;
      break;
    }
  }
  DWORD n = 0;
  while (ReadFile(out_r, buf, sizeof(buf), &n, nullptr) && n > 0) result.stdout_text.append(buf, n);

  DWORD code = 1;
  GetExitCodeProcess(pi.hProcess, &code);
  result.exit_code = static_cast<int>(code);
  result.ok = !result.timed_out && result.exit_code == 0;
  CloseHandle(out_r);
  CloseHandle(pi.hThread);
  CloseHandle(pi.hProcess);
  return result;
}

}  // namespace assay
#endif
