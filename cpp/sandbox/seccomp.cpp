#include "sandbox/seccomp.hpp"

#include <linux/audit.h>
#include <linux/seccomp.h>
#include <sched.h>
#include <sys/prctl.h>
#include <sys/socket.h>
#include <sys/syscall.h>
#include <cerrno>
#include <cstddef>
#include <cstring>

namespace {

#if defined(__x86_64__)
const constexpr uint32_t kNativeArch = AUDIT_ARCH_X86_64;
#elif defined(__aarch64__)
const constexpr uint32_t kNativeArch = AUDIT_ARCH_AARCH64;
#else
const constexpr uint32_t kNativeArch = 0;
#endif

sock_filter Stmt(uint16_t code, uint32_t k) {
  sock_filter f{};
  f.code = code;
  f.k = k;
  return f;
}

sock_filter Jump(uint16_t code, uint32_t k, uint8_t jt, uint8_t jf) {
  sock_filter f = Stmt(code, k);
  f.jt = jt;
  f.jf = jf;
  return f;
}

sock_filter Return(uint32_t action) { return Stmt(BPF_RET | BPF_K, action); }

sock_filter Errno(int err) {
  return Return(SECCOMP_RET_ERRNO |
                (static_cast<uint32_t>(err) & SECCOMP_RET_DATA));
}

sock_filter LoadNr() {
  return Stmt(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, nr));
}

// Lower 32 bits of a system call argument.
sock_filter LoadArg(int n) {
  return Stmt(BPF_LD | BPF_W | BPF_ABS,
              offsetof(struct seccomp_data, args) + n * sizeof(uint64_t));
}

// System calls refused to every sandboxed program.
const int kDenied[] = {
    SYS_ptrace,        SYS_mount,           SYS_umount2,
    SYS_unshare,       SYS_setns,           SYS_pivot_root,
    SYS_chroot,        SYS_reboot,          SYS_kexec_load,
    SYS_init_module,   SYS_finit_module,    SYS_delete_module,
    SYS_bpf,           SYS_perf_event_open, SYS_keyctl,
    SYS_add_key,       SYS_request_key,     SYS_process_vm_readv,
    SYS_process_vm_writev,
    SYS_userfaultfd,   SYS_connect,         SYS_bind,
    SYS_listen,        SYS_accept,          SYS_accept4,
};

}  // namespace

namespace sandbox {

bool SeccompFilter::Build(bool allow_fork, std::string* error_msg) {
  if (kNativeArch == 0) {
    *error_msg = "seccomp: unsupported architecture";
    return false;
  }
  program_.clear();
  auto deny = [this](int nr, int err) {
    program_.push_back(Jump(BPF_JMP | BPF_JEQ | BPF_K, nr, 0, 1));
    program_.push_back(Errno(err));
  };

  program_.push_back(
      Stmt(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, arch)));
  program_.push_back(Jump(BPF_JMP | BPF_JEQ | BPF_K, kNativeArch, 1, 0));
  program_.push_back(Return(SECCOMP_RET_KILL_PROCESS));
  program_.push_back(LoadNr());
#ifdef __X32_SYSCALL_BIT
  program_.push_back(Jump(BPF_JMP | BPF_JGE | BPF_K, __X32_SYSCALL_BIT, 0, 1));
  program_.push_back(Return(SECCOMP_RET_KILL_PROCESS));
#endif

  // socket(domain, ...) only for AF_UNIX.
  program_.push_back(Jump(BPF_JMP | BPF_JEQ | BPF_K, SYS_socket, 0, 4));
  program_.push_back(LoadArg(0));
  program_.push_back(Jump(BPF_JMP | BPF_JEQ | BPF_K, AF_UNIX, 0, 1));
  program_.push_back(Return(SECCOMP_RET_ALLOW));
  program_.push_back(Errno(EACCES));

  if (!allow_fork) {
    // clone(flags, ...) only for threads.
    program_.push_back(Jump(BPF_JMP | BPF_JEQ | BPF_K, SYS_clone, 0, 4));
    program_.push_back(LoadArg(0));
    program_.push_back(Jump(BPF_JMP | BPF_JSET | BPF_K, CLONE_THREAD, 0, 1));
    program_.push_back(Return(SECCOMP_RET_ALLOW));
    program_.push_back(Errno(EPERM));
#ifdef SYS_fork
    deny(SYS_fork, EPERM);
#endif
#ifdef SYS_vfork
    deny(SYS_vfork, EPERM);
#endif
#ifdef SYS_clone3
    // The flags live in memory where the filter cannot look: make libc fall
    // back to clone.
    deny(SYS_clone3, ENOSYS);
#endif
  }

  for (int nr : kDenied) deny(nr, EPERM);
  program_.push_back(Return(SECCOMP_RET_ALLOW));
  return true;
}

bool SeccompFilter::Install(char* error_msg, size_t buflen) const {
  auto fail = [error_msg, buflen](const char* what) {
    const char* err = strerror(errno);
    error_msg[0] = 0;
    strncat(error_msg, what, buflen - 1);                      // NOLINT
    strncat(error_msg, ": ", buflen - strlen(error_msg) - 1);  // NOLINT
    strncat(error_msg, err, buflen - strlen(error_msg) - 1);   // NOLINT
    return false;
  };
  if (program_.empty()) {
    errno = EINVAL;
    return fail("seccomp filter not built");
  }
  if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) == -1) {
    return fail("prctl(NO_NEW_PRIVS)");
  }
  struct sock_fprog prog {};
  prog.len = static_cast<unsigned short>(program_.size());
  prog.filter = const_cast<sock_filter*>(program_.data());  // NOLINT
  if (prctl(PR_SET_SECCOMP, SECCOMP_MODE_FILTER, &prog) == -1) {
    return fail("prctl(SECCOMP)");
  }
  return true;
}

bool SeccompFilter::Supported() {
  return kNativeArch != 0 && prctl(PR_GET_SECCOMP, 0, 0, 0, 0) >= 0;
}

}  // namespace sandbox
