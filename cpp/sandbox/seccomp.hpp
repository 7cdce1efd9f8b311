#ifndef SANDBOX_SECCOMP_HPP
#define SANDBOX_SECCOMP_HPP

#include <linux/filter.h>
#include <string>
#include <vector>

namespace sandbox {

// A seccomp-bpf program for untrusted code. It refuses, with an error code,
// the system calls that could escape or inspect the sandbox (mount, ptrace,
// namespaces, kernel modules, ...) and sockets outside of AF_UNIX; process
// creation is refused unless allow_fork is set. Threads are always allowed.
// Calls made with a foreign architecture or ABI kill the process.
class SeccompFilter {
 public:
  // Builds the program. Returns false and sets error_msg when seccomp cannot
  // be used on this architecture.
  bool Build(bool allow_fork, std::string* error_msg);

  // Installs the program on the calling thread, setting no_new_privs first.
  // Must be called after Build. Does not allocate, so it can run between
  // fork and exec. Returns false and fills error_msg on failure.
  bool Install(char* error_msg, size_t buflen) const;

  // True if the running kernel supports seccomp filters.
  static bool Supported();

 private:
  std::vector<sock_filter> program_;
};

}  // namespace sandbox

#endif
