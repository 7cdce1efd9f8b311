#include "sandbox/unix.hpp"

#include <fcntl.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <chrono>
#include <climits>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <thread>

#include <kj/debug.h>

namespace {
char* mystrerror(int err, char* buf, size_t buf_size) {
#ifdef _GNU_SOURCE
  return strerror_r(err, buf, buf_size);
#else
  strerror_r(err, buf, buf_size);
  return buf;
#endif
}

std::string ErrnoMessage(const char* prefix, int err) {
  char buf[256] = {};
  return std::string(prefix) + ": " + mystrerror(err, buf, sizeof(buf));
}

void ClosePipe(int* fds) {
  for (int i = 0; i < 2; i++) {
    if (fds[i] != -1) close(fds[i]);
    fds[i] = -1;
  }
}

// Blocking wait4 that survives signals.
pid_t Reap(pid_t pid, int* status, struct rusage* rusage) {
  pid_t ret;
  do {
    ret = wait4(pid, status, 0, rusage);
  } while (ret == -1 && errno == EINTR);
  return ret;
}
}  // namespace

namespace sandbox {

static const constexpr size_t kStrErrorBufSize = 2048;

bool Unix::ExecuteInternal(const ExecutionOptions& options, ExecutionInfo* info,
                           std::string* error_msg) {
  options_ = &options;
  child_pid_ = 0;
  bool ok = Setup(error_msg) && DoFork(error_msg) && Wait(info, error_msg);
  ClosePipe(pipe_fds_);
  OnFinish(info);
  return ok;
}

bool Unix::Setup(std::string* error_msg) {
  if (pipe2(pipe_fds_, O_CLOEXEC) == -1) {  // NOLINT
    *error_msg = ErrnoMessage("pipe2", errno);
    return false;
  }
  return OnSetup(error_msg);
}

bool Unix::DoFork(std::string* error_msg) {
  int fork_result = fork();
  if (fork_result == -1) {
    *error_msg = ErrnoMessage("fork", errno);
    return false;
  }
  if (fork_result != 0) {
    child_pid_ = fork_result;
    return true;
  }
  Child();
}

void Unix::Child() {
  close(pipe_fds_[0]);
  auto die2 = [this](const char* prefix, const char* err) {
    char buf[kStrErrorBufSize + 64 + 3 + 1] = {};
    strncat(buf, prefix, 64);             // NOLINT
    strncat(buf, ": ", 3);                // NOLINT
    strncat(buf, err, kStrErrorBufSize);  // NOLINT
    ssize_t len = strlen(buf);            // NOLINT
    if (write(pipe_fds_[1], &len, sizeof(len)) == sizeof(len)) {
      while (write(pipe_fds_[1], buf, len) == -1 && errno == EINTR) {
      }
    }
    close(pipe_fds_[1]);
    _Exit(1);
  };

  auto die = [&die2](const char* prefix, int err) {
    char buf[kStrErrorBufSize] = {};
    die2(prefix, mystrerror(err, buf, kStrErrorBufSize));  // NOLINT
  };

  // Change process group, so that we do not receive Ctrl-Cs in the terminal
  // and the whole group can be killed at once.
  if (setsid() == -1) die("setsid", errno);

  // Unset streams are connected to /dev/null, never to ours.
  auto open_stream = [&die](const char* path, int flags) {
    int fd = open(path[0] ? path : "/dev/null", flags | O_CLOEXEC,
                  S_IRUSR | S_IWUSR);
    if (fd == -1) die("open", errno);
    return fd;
  };
  int stdin_fd = open_stream(options_->stdin_file, O_RDONLY);
  int stdout_fd =
      open_stream(options_->stdout_file, O_WRONLY | O_CREAT | O_TRUNC);
  int stderr_fd =
      open_stream(options_->stderr_file, O_WRONLY | O_CREAT | O_TRUNC);

  if (chdir(options_->root) == -1) {
    die("chdir", errno);
  }

  char* argsp[ExecutionOptions::narg + 1] = {};
  size_t narg = 0;
  // NOLINTNEXTLINE
  for (size_t i = 0; i < ExecutionOptions::narg; i++) {
    if (!options_->args[i][0]) break;
    argsp[narg++] = const_cast<char*>(&options_->args[i][0]);  // NOLINT
  }
  char* envp[ExecutionOptions::nenv + 1] = {};
  size_t nenv = 0;
  // NOLINTNEXTLINE
  for (size_t i = 0; i < ExecutionOptions::nenv; i++) {
    if (!options_->env[i][0]) break;
    envp[nenv++] = const_cast<char*>(&options_->env[i][0]);  // NOLINT
  }

  // Handle I/O redirection.
#define DUP(field, fd)              \
  if (dup2(field##_fd, fd) == -1) { \
    die("redir " #field, errno);    \
  }
  DUP(stdin, STDIN_FILENO);
  DUP(stdout, STDOUT_FILENO);
  DUP(stderr, STDERR_FILENO);
#undef DUP

  // Set resource limits.
  struct rlimit rlim {};
#define SET_RLIM(res, value)                    \
  {                                             \
    rlim_t lim = value;                         \
    if (lim) {                                  \
      rlim.rlim_cur = lim;                      \
      rlim.rlim_max = lim;                      \
      if (setrlimit(RLIMIT_##res, &rlim) < 0) { \
        die("setrlim " #res, errno);            \
      }                                         \
    }                                           \
  }

  SET_RLIM(AS, options_->memory_limit_kb * 1024);
  SET_RLIM(DATA, options_->data_limit_kb * 1024);
  SET_RLIM(CPU, (options_->cpu_limit_millis + 999) / 1000);
  SET_RLIM(FSIZE, options_->max_file_size_kb * 1024);
  SET_RLIM(MEMLOCK, options_->max_mlock_kb * 1024);
  SET_RLIM(NOFILE, options_->max_files);
  SET_RLIM(NPROC, options_->max_procs);
  SET_RLIM(STACK, options_->max_stack_kb * 1024);
#undef SET_RLIM
  rlim.rlim_cur = rlim.rlim_max = 0;
  if (setrlimit(RLIMIT_CORE, &rlim) < 0) die("setrlim CORE", errno);

  char buf[kStrErrorBufSize] = {};
  if (!OnChild(buf, kStrErrorBufSize)) {  // NOLINT
    die2("OnChild", buf);                 // NOLINT
  }
  execve(options_->executable, argsp, envp);
  die("exec", errno);
  // [[noreturn]] does not work on lambdas...
  _Exit(1);
}

bool Unix::Wait(ExecutionInfo* info, std::string* error_msg) {
  close(pipe_fds_[1]);
  pipe_fds_[1] = -1;
  int child_status = 0;
  struct rusage rusage {};
  ssize_t error_len = 0;
  if (read(pipe_fds_[0], &error_len, sizeof(error_len)) == sizeof(error_len)) {
    char error[PIPE_BUF] = {};
    if (error_len >= PIPE_BUF) error_len = PIPE_BUF - 1;
    if (read(pipe_fds_[0], error, error_len) == -1) {
      *error_msg = ErrnoMessage("read", errno);
    } else {
      *error_msg = error;
    }
    Reap(child_pid_, &child_status, &rusage);
    return false;
  }

  auto program_start = std::chrono::steady_clock::now();
  auto elapsed_millis = [&program_start]() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - program_start)
        .count();
  };

  bool has_exited = false;
  while (!options_->wall_limit_millis ||
         elapsed_millis() < options_->wall_limit_millis) {
    int ret = wait4(child_pid_, &child_status, WNOHANG, &rusage);
    if (ret == -1 && errno == EINTR) continue;
    if (ret == -1) {
      *error_msg = ErrnoMessage("wait4", errno);
      kill(-child_pid_, SIGKILL);
      Reap(child_pid_, &child_status, &rusage);
      return false;
    }
    if (ret == child_pid_) {
      has_exited = true;
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  if (!has_exited) {
    if (kill(-child_pid_, SIGKILL) == -1 && errno != ESRCH) {
      KJ_LOG(WARNING, "Killing the process group failed", strerror(errno));
    }
    if (Reap(child_pid_, &child_status, &rusage) != child_pid_) {
      *error_msg = ErrnoMessage("wait4", errno);
      return false;
    }
  }

  info->memory_usage_kb = rusage.ru_maxrss;
  info->status_code = WIFEXITED(child_status) ? WEXITSTATUS(child_status) : 0;
  info->signal = WIFSIGNALED(child_status) ? WTERMSIG(child_status) : 0;
  // If the child received a KILL or XCPU signal, assume we killed it
  // because of memory or time limits.
  info->killed = info->signal == SIGKILL || info->signal == SIGXCPU;
  info->wall_time_millis = elapsed_millis();
  info->cpu_time_millis =
      rusage.ru_utime.tv_sec * 1000LL + rusage.ru_utime.tv_usec / 1000;
  info->sys_time_millis =
      rusage.ru_stime.tv_sec * 1000LL + rusage.ru_stime.tv_usec / 1000;
  if (info->signal != 0) {
    strncpy(info->message, strsignal(info->signal),  // NOLINT
            sizeof(info->message) - 1);
  } else if (info->status_code != 0) {
    strncpy(info->message, "Non-zero return code",  // NOLINT
            sizeof(info->message) - 1);
  }
  return true;
}

namespace {
Sandbox::Register<Unix> r;  // NOLINT
}  // namespace

}  // namespace sandbox
