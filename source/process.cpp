#include <bulkpush/process.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <sys/types.h>
#include <sys/wait.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <fcntl.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <mutex>
#include <stdexcept>
#include <string_view>
#include <thread>

extern char **environ;

namespace bulkpush {

using namespace std::chrono_literals;

namespace {

struct FdGuard {
  int fd{-1};
  FdGuard() = default;
  explicit FdGuard(int f) : fd(f) {}
  FdGuard(const FdGuard &) = delete;
  FdGuard &operator=(const FdGuard &) = delete;
  ~FdGuard() { reset(); }
  void reset() {
    if (fd >= 0)
      ::close(fd);
    fd = -1;
  }
};

struct Pipe {
  FdGuard rd;
  FdGuard wr;
};

bool make_cloexec_pipe(Pipe &p) {
  int pfd[2];
#ifdef __linux__
  if (::pipe2(pfd, O_CLOEXEC) != 0)
    return false;
#else
  if (::pipe(pfd) != 0)
    return false;
  ::fcntl(pfd[0], F_SETFD, ::fcntl(pfd[0], F_GETFD) | FD_CLOEXEC);
  ::fcntl(pfd[1], F_SETFD, ::fcntl(pfd[1], F_GETFD) | FD_CLOEXEC);
#endif
  p.rd.fd = pfd[0];
  p.wr.fd = pfd[1];
  return true;
}

void set_nonblocking(int fd) {
  ::fcntl(fd, F_SETFL, ::fcntl(fd, F_GETFL) | O_NONBLOCK);
}

std::string join_args(const std::vector<std::string> &args) {
  std::string s;
  for (const auto &a : args) {
    if (!s.empty())
      s += ' ';
    s += a;
  }
  return s;
}

std::string trim(std::string s) {
  while (!s.empty() && (s.back() == '\n' || s.back() == '\r' ||
                        s.back() == ' ' || s.back() == '\t'))
    s.pop_back();
  size_t i = 0;
  while (i < s.size() && (s[i] == '\n' || s[i] == ' ' || s[i] == '\t'))
    ++i;
  return s.substr(i);
}

int exit_code_of(int status) {
  if (WIFEXITED(status))
    return WEXITSTATUS(status);
  if (WIFSIGNALED(status))
    return 128 + WTERMSIG(status);
  return -1;
}

// SIGTERM to the whole group, SIGKILL if it is still there after the grace
// period. Returns the reaped status.
int terminate_child(pid_t pid) {
  ::kill(-pid, SIGTERM);
  auto deadline = std::chrono::steady_clock::now() + 2s;
  int status = 0;
  while (std::chrono::steady_clock::now() < deadline) {
    pid_t r = ::waitpid(pid, &status, WNOHANG);
    if (r == pid)
      return status;
    std::this_thread::sleep_for(20ms);
  }
  spdlog::warn("[exec] pid={} ignored SIGTERM; killing", pid);
  ::kill(-pid, SIGKILL);
  ::waitpid(pid, &status, 0);
  return status;
}

} // namespace

ProcessExecutor::ProcessExecutor(std::string binary) : binary_(std::move(binary)) {
  // a child exiting before it read its stdin payload must not kill us
  static std::once_flag once;
  std::call_once(once, [] { ::signal(SIGPIPE, SIG_IGN); });
}

std::unordered_map<std::string, std::string> ProcessExecutor::prompt_free_env() {
  std::unordered_map<std::string, std::string> env{
      {"GIT_TERMINAL_PROMPT", "0"},
      {"GIT_ASKPASS", ""},
      {"SSH_ASKPASS", ""},
      {"GCM_INTERACTIVE", "never"},
      {"LC_ALL", "C"},
      {"LANG", "C"},
  };
  if (const char *ssh = ::getenv("GIT_SSH_COMMAND"); !ssh || !*ssh)
    env["GIT_SSH_COMMAND"] = "ssh -o BatchMode=yes";
  return env;
}

static std::vector<std::string> build_env() {
  auto forced = ProcessExecutor::prompt_free_env();
  std::vector<std::string> out;
  for (char **e = environ; e && *e; ++e) {
    std::string kv(*e);
    auto eq = kv.find('=');
    std::string key = eq == std::string::npos ? kv : kv.substr(0, eq);
    if (forced.count(key))
      continue;
    out.push_back(std::move(kv));
  }
  for (const auto &[k, v] : forced)
    out.push_back(k + "=" + v);
  return out;
}

CommandResult ProcessExecutor::execute(const CommandInvocation &inv) {
  const std::string cmdline = binary_ + " " + join_args(inv.args);

  auto fail = [&](std::string message, std::optional<ErrorKind> kind,
                  std::optional<int> exit_code = std::nullopt,
                  std::string out = {}, std::string err = {}) {
    return ExecutionError(ExecutionErrorInfo{std::move(message), exit_code,
                                             std::move(out), std::move(err),
                                             kind, binary_, inv.args});
  };

  if (inv.cancel && inv.cancel->cancelled()) {
    spdlog::debug("[exec] cancelled before start: {}", cmdline);
    throw fail("cancelled", ErrorKind::Cancelled);
  }

  // everything the child needs is built before fork
  std::vector<std::string> env_strings = build_env();
  std::vector<char *> envp;
  envp.reserve(env_strings.size() + 1);
  for (auto &s : env_strings)
    envp.push_back(s.data());
  envp.push_back(nullptr);

  std::vector<std::string> argv_strings;
  argv_strings.reserve(inv.args.size() + 1);
  argv_strings.push_back(binary_);
  argv_strings.insert(argv_strings.end(), inv.args.begin(), inv.args.end());
  std::vector<char *> argv;
  argv.reserve(argv_strings.size() + 1);
  for (auto &s : argv_strings)
    argv.push_back(s.data());
  argv.push_back(nullptr);

  const std::string cwd = inv.cwd.string();
  if (binary_.empty())
    throw std::invalid_argument("no binary configured");
  if (inv.args.empty())
    throw std::invalid_argument("empty argument vector");

  Pipe out_p, err_p, in_p, exec_p;
  FdGuard devnull;
  if (!make_cloexec_pipe(out_p) || !make_cloexec_pipe(err_p) ||
      !make_cloexec_pipe(exec_p) || (inv.input && !make_cloexec_pipe(in_p))) {
    throw fail(fmt::format("pipe failed: {}", std::strerror(errno)), std::nullopt);
  }
  if (!inv.input) {
    devnull.fd = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (devnull.fd < 0)
      throw fail(fmt::format("open /dev/null failed: {}", std::strerror(errno)),
                 std::nullopt);
  }

  spdlog::debug("[exec] {} (cwd={})", cmdline, cwd);

  pid_t pid = ::fork();
  if (pid < 0) {
    throw fail(fmt::format("fork failed: {}", std::strerror(errno)), std::nullopt);
  }

  if (pid == 0) {
    ::setpgid(0, 0);
    ::signal(SIGPIPE, SIG_DFL);
    int in_fd = inv.input ? in_p.rd.fd : devnull.fd;
    ::dup2(in_fd, STDIN_FILENO);
    ::dup2(out_p.wr.fd, STDOUT_FILENO);
    ::dup2(err_p.wr.fd, STDERR_FILENO);
    if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
      int e = -errno; // negative: chdir, not exec
      (void)!::write(exec_p.wr.fd, &e, sizeof(e));
      _exit(127);
    }
    ::execvpe(argv[0], argv.data(), envp.data());
    int e = errno;
    (void)!::write(exec_p.wr.fd, &e, sizeof(e));
    _exit(127);
  }

  out_p.wr.reset();
  err_p.wr.reset();
  in_p.rd.reset();
  exec_p.wr.reset();
  devnull.reset();

  int child_errno = 0;
  ssize_t n = ::read(exec_p.rd.fd, &child_errno, sizeof(child_errno));
  exec_p.rd.reset();
  if (n > 0) {
    int st = 0;
    ::waitpid(pid, &st, 0);
    if (child_errno < 0) {
      throw fail(fmt::format("cannot enter '{}': {}", cwd, std::strerror(-child_errno)),
                 ErrorKind::NotARepository);
    }
    std::optional<ErrorKind> kind;
    if (child_errno == ENOENT)
      kind = ErrorKind::ToolNotFound;
    else if (child_errno == EACCES)
      kind = ErrorKind::PermissionDenied;
    spdlog::error("[exec] failed to spawn {}: {}", binary_, std::strerror(child_errno));
    throw fail(fmt::format("failed to spawn {} in '{}': {}", binary_, cwd,
                           std::strerror(child_errno)),
               kind);
  }

  if (inv.on_spawn)
    inv.on_spawn(static_cast<int>(pid));

  std::string out, err;
  std::string_view pending_input;
  if (inv.input) {
    pending_input = *inv.input;
    set_nonblocking(in_p.wr.fd);
    if (pending_input.empty())
      in_p.wr.reset();
  }

  std::optional<std::chrono::steady_clock::time_point> deadline;
  if (inv.timeout)
    deadline = std::chrono::steady_clock::now() + *inv.timeout;

  std::array<char, 8192> buf{};
  bool cancelled = false, timed_out = false;

  while (out_p.rd.fd >= 0 || err_p.rd.fd >= 0) {
    if (inv.cancel && inv.cancel->cancelled()) {
      cancelled = true;
      break;
    }
    if (deadline && std::chrono::steady_clock::now() >= *deadline) {
      timed_out = true;
      break;
    }

    std::array<pollfd, 3> fds{};
    nfds_t nfds = 0;
    int out_idx = -1, err_idx = -1, in_idx = -1;
    if (out_p.rd.fd >= 0) {
      out_idx = static_cast<int>(nfds);
      fds[nfds++] = pollfd{out_p.rd.fd, POLLIN, 0};
    }
    if (err_p.rd.fd >= 0) {
      err_idx = static_cast<int>(nfds);
      fds[nfds++] = pollfd{err_p.rd.fd, POLLIN, 0};
    }
    if (in_p.wr.fd >= 0) {
      in_idx = static_cast<int>(nfds);
      fds[nfds++] = pollfd{in_p.wr.fd, POLLOUT, 0};
    }

    int pr = ::poll(fds.data(), nfds, 50);
    if (pr < 0) {
      if (errno == EINTR)
        continue;
      spdlog::error("[exec] poll failed: {}", std::strerror(errno));
      int st = terminate_child(pid);
      throw fail(fmt::format("poll failed: {}", std::strerror(errno)),
                 std::nullopt, exit_code_of(st), out, err);
    }
    if (pr == 0)
      continue;

    auto drain = [&](int idx, FdGuard &fd, std::string &sink) {
      if (idx < 0 || !(fds[idx].revents & (POLLIN | POLLHUP | POLLERR)))
        return;
      ssize_t r = ::read(fd.fd, buf.data(), buf.size());
      if (r > 0)
        sink.append(buf.data(), static_cast<size_t>(r));
      else if (r == 0 || (errno != EINTR && errno != EAGAIN))
        fd.reset();
    };
    drain(out_idx, out_p.rd, out);
    drain(err_idx, err_p.rd, err);

    if (in_idx >= 0 && (fds[in_idx].revents & (POLLOUT | POLLERR | POLLHUP))) {
      ssize_t w = ::write(in_p.wr.fd, pending_input.data(), pending_input.size());
      if (w > 0) {
        pending_input.remove_prefix(static_cast<size_t>(w));
        if (pending_input.empty())
          in_p.wr.reset();
      } else if (w < 0 && errno != EAGAIN && errno != EINTR) {
        // child closed its stdin; the rest of the payload is not wanted
        in_p.wr.reset();
      }
    }
  }
  in_p.wr.reset();

  // both streams are closed, but the child may still be running
  int status = 0;
  while (!cancelled && !timed_out) {
    pid_t r = ::waitpid(pid, &status, WNOHANG);
    if (r == pid)
      break;
    if (r < 0 && errno != EINTR) {
      spdlog::error("[exec] waitpid failed: {}", std::strerror(errno));
      throw fail(fmt::format("waitpid failed: {}", std::strerror(errno)),
                 std::nullopt, std::nullopt, out, err);
    }
    if (inv.cancel && inv.cancel->cancelled())
      cancelled = true;
    else if (deadline && std::chrono::steady_clock::now() >= *deadline)
      timed_out = true;
    else
      std::this_thread::sleep_for(20ms);
  }

  if (cancelled || timed_out) {
    int st = terminate_child(pid);
    if (cancelled) {
      spdlog::info("[exec] cancelled: {}", cmdline);
      throw fail("cancelled", ErrorKind::Cancelled, exit_code_of(st), out, err);
    }
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(*inv.timeout).count();
    spdlog::warn("[exec] timed out after {}s: {}", secs, cmdline);
    throw fail(fmt::format("{} timed out after {}s", cmdline, secs),
               ErrorKind::RemoteConnectionError, exit_code_of(st), out, err);
  }

  int code = exit_code_of(status);
  spdlog::debug("[exec] {} -> {}", cmdline, code);

  if (code != 0) {
    auto kind = classify_stderr(err);
    std::string msg = trim(err);
    if (msg.empty())
      msg = fmt::format("{} exited with code {}", cmdline, code);
    throw fail(std::move(msg), kind, code, std::move(out), std::move(err));
  }

  return CommandResult{code, std::move(out), std::move(err)};
}

} // namespace bulkpush
