#include <benchgen/process.hpp>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <string_view>
#include <system_error>

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <thread>
#include <windows.h>
#else
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace benchgen {

  namespace {

    bool
    needs_quoting(std::string_view arg) {
      if (arg.empty()) return true;
      for (char c : arg) {
        if (c == ' ' || c == '\t' || c == '"' || c == '\'' || c == '\\')
          return true;
      }
      return false;
    }

    std::string
    quote(std::string_view arg) {
      if (!needs_quoting(arg)) return std::string(arg);
      std::string out = "\"";
      for (char c : arg) {
        if (c == '"' || c == '\\') out += '\\';
        out += c;
      }
      out += '"';
      return out;
    }

    bool
    is_executable_file(const fs::path& path) {
      std::error_code ec;
      if (!fs::is_regular_file(path, ec)) return false;
#ifdef _WIN32
      return true;
#else
      return ::access(path.c_str(), X_OK) == 0;
#endif
    }

#ifndef _WIN32

    constexpr int exit_exec_failed = 127;

    // How often the child is checked for exit while output is quiet.
    constexpr int poll_interval_ms = 50;

    void
    close_fd(int& fd) {
      if (fd >= 0) {
        ::close(fd);
        fd = -1;
      }
    }

    // Owns both ends of a pipe and closes whatever is still open.
    struct pipe_fds {
      int fds[2] = {-1, -1};

      ~pipe_fds() {
        close_fd(fds[0]);
        close_fd(fds[1]);
      }

      bool
      open(int flags) {
        if (::pipe(fds) != 0) return false;
        if (flags != 0) {
          ::fcntl(fds[0], F_SETFD, flags);
          ::fcntl(fds[1], F_SETFD, flags);
        }
        return true;
      }

      int&
      read_end() {
        return fds[0];
      }

      int&
      write_end() {
        return fds[1];
      }
    };

    // Reads what the pipe delivers within wait_ms. Returns true when bytes
    // were appended; closes the descriptor at end of stream.
    bool
    read_chunk(int& fd, int wait_ms, std::string& out) {
      pollfd pfd{fd, POLLIN, 0};
      if (::poll(&pfd, 1, wait_ms) <= 0) return false;

      char buf[4096];
      ssize_t got = ::read(fd, buf, sizeof(buf));
      if (got > 0) {
        out.append(buf, static_cast<std::size_t>(got));
        return true;
      }
      if (got == 0 || errno != EINTR) close_fd(fd);
      return false;
    }

    process_result
    run_posix(const process_request& request) {
      process_result result;

      pipe_fds output;
      pipe_fds status;
      if (!output.open(0) || !status.open(FD_CLOEXEC)) {
        result.error = std::strerror(errno);
        return result;
      }

      std::vector<char*> argv;
      argv.reserve(request.args.size() + 2);
      argv.push_back(const_cast<char*>(request.program.c_str()));
      for (const auto& a : request.args)
        argv.push_back(const_cast<char*>(a.c_str()));
      argv.push_back(nullptr);

      pid_t pid = ::fork();
      if (pid < 0) {
        result.error = std::strerror(errno);
        return result;
      }

      bool has_deadline = request.timeout.count() > 0;

      if (pid == 0) {
        // A timed child leads its own process group so the whole group can
        // be killed, including anything it spawned.
        if (has_deadline) ::setpgid(0, 0);

        // Child: stdout and stderr share the output pipe
        ::close(output.read_end());
        ::close(status.read_end());
        ::dup2(output.write_end(), STDOUT_FILENO);
        ::dup2(output.write_end(), STDERR_FILENO);
        ::close(output.write_end());

        ::execvp(request.program.c_str(), argv.data());

        int err = errno;
        ssize_t ignored = ::write(status.write_end(), &err, sizeof(err));
        (void)ignored;
        ::_exit(exit_exec_failed);
      }

      if (has_deadline) ::setpgid(pid, pid);

      close_fd(output.write_end());
      close_fd(status.write_end());

      // The status pipe is close-on-exec: EOF means exec succeeded, data
      // means it failed with the errno written by the child.
      int exec_errno = 0;
      ssize_t n;
      do {
        n = ::read(status.read_end(), &exec_errno, sizeof(exec_errno));
      } while (n < 0 && errno == EINTR);

      if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        int wstatus = 0;
        ::waitpid(pid, &wstatus, 0);
        result.error = std::strerror(exec_errno);
        return result;
      }

      result.launched = true;

      using clock = std::chrono::steady_clock;
      auto timeout = std::min(request.timeout, max_process_timeout);
      auto deadline = clock::now() + timeout;

      int wstatus = 0;
      bool reaped = false;
      while (!reaped) {
        int wait_ms = poll_interval_ms;
        if (has_deadline) {
          auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                          deadline - clock::now())
                          .count();
          if (left <= 0) {
            ::kill(-pid, SIGKILL);
            ::kill(pid, SIGKILL);
            result.timed_out = true;
            break;
          }
          if (left < wait_ms) wait_ms = static_cast<int>(left);
        }

        if (output.read_end() >= 0)
          read_chunk(output.read_end(), wait_ms, result.output);
        else
          ::poll(nullptr, 0, wait_ms);

        pid_t done = ::waitpid(pid, &wstatus, WNOHANG);
        if (done == pid) {
          reaped = true;
        } else if (done < 0 && errno != EINTR) {
          break;
        }
      }

      if (result.timed_out) {
        while (::waitpid(pid, &wstatus, 0) < 0) {
          if (errno != EINTR) break;
        }
        reaped = true;
      }

      // Whatever the child wrote before exiting is still in the pipe
      while (output.read_end() >= 0 &&
             read_chunk(output.read_end(), 0, result.output)) {
      }

      if (!reaped) return result;

      if (WIFEXITED(wstatus))
        result.exit_code = WEXITSTATUS(wstatus);
      else
        result.exit_code = -1;

      return result;
    }

#else

    process_result
    run_win32(const process_request& request) {
      process_result result;

      SECURITY_ATTRIBUTES sa;
      sa.nLength = sizeof(sa);
      sa.bInheritHandle = TRUE;
      sa.lpSecurityDescriptor = NULL;

      HANDLE out_read = NULL, out_write = NULL;
      if (!CreatePipe(&out_read, &out_write, &sa, 0)) {
        result.error = "cannot create pipe: error " +
                       std::to_string(GetLastError());
        return result;
      }
      SetHandleInformation(out_read, HANDLE_FLAG_INHERIT, 0);

      std::string cmd = format_command(request);
      std::vector<char> cmd_buf(cmd.begin(), cmd.end());
      cmd_buf.push_back('\0');

      STARTUPINFOA si;
      PROCESS_INFORMATION pi;
      ZeroMemory(&si, sizeof(si));
      si.cb = sizeof(si);
      si.hStdOutput = out_write;
      si.hStdError = out_write;
      si.hStdInput = GetStdHandle(STD_INPUT_HANDLE);
      si.dwFlags |= STARTF_USESTDHANDLES;
      ZeroMemory(&pi, sizeof(pi));

      BOOL created = CreateProcessA(NULL, cmd_buf.data(), NULL, NULL, TRUE, 0,
                                    NULL, NULL, &si, &pi);
      CloseHandle(out_write);

      if (!created) {
        CloseHandle(out_read);
        result.error = "cannot create process: error " +
                       std::to_string(GetLastError());
        return result;
      }

      result.launched = true;

      // Drain on a separate thread so a chatty child never blocks on a
      // full pipe while we wait on it.
      std::thread reader([&result, out_read] {
        char buf[4096];
        DWORD got = 0;
        while (ReadFile(out_read, buf, sizeof(buf), &got, NULL) && got > 0)
          result.output.append(buf, got);
      });

      DWORD wait_ms =
          request.timeout.count() > 0
              ? static_cast<DWORD>(
                    std::min(request.timeout, max_process_timeout).count())
              : INFINITE;
      if (WaitForSingleObject(pi.hProcess, wait_ms) == WAIT_TIMEOUT) {
        TerminateProcess(pi.hProcess, 1);
        WaitForSingleObject(pi.hProcess, INFINITE);
        result.timed_out = true;
      }

      DWORD exit_code = 0;
      GetExitCodeProcess(pi.hProcess, &exit_code);
      result.exit_code = static_cast<int>(exit_code);

      reader.join();
      CloseHandle(out_read);
      CloseHandle(pi.hProcess);
      CloseHandle(pi.hThread);
      return result;
    }

#endif

  } // namespace

  process_result
  run_process(const process_request& request) {
#ifdef _WIN32
    return run_win32(request);
#else
    return run_posix(request);
#endif
  }

  std::optional<fs::path>
  find_executable(const fs::path& program) {
    if (program.empty()) return std::nullopt;

    if (program.has_parent_path()) {
      if (is_executable_file(program)) return program;
      return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    if (!path_env) return std::nullopt;

#ifdef _WIN32
    constexpr char separator = ';';
#else
    constexpr char separator = ':';
#endif

    std::string_view dirs = path_env;
    while (!dirs.empty()) {
      auto pos = dirs.find(separator);
      auto dir = dirs.substr(0, pos);
      if (!dir.empty()) {
        auto candidate = fs::path(std::string(dir)) / program;
        if (is_executable_file(candidate)) return candidate;
#ifdef _WIN32
        candidate += ".exe";
        if (is_executable_file(candidate)) return candidate;
#endif
      }
      if (pos == std::string_view::npos) break;
      dirs.remove_prefix(pos + 1);
    }
    return std::nullopt;
  }

  std::string
  format_command(const process_request& request) {
    std::string cmd = quote(request.program);
    for (const auto& a : request.args) {
      cmd += ' ';
      cmd += quote(a);
    }
    return cmd;
  }

} // namespace benchgen
