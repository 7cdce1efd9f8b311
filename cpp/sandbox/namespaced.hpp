#ifndef SANDBOX_NAMESPACED_HPP
#define SANDBOX_NAMESPACED_HPP

#include <memory>
#include <string>
#include <vector>

#include "sandbox/seccomp.hpp"
#include "sandbox/unix.hpp"
#include "util/file.hpp"

namespace sandbox {

// Sandbox built on unprivileged user namespaces. On top of the limits of the
// Unix sandbox, the program runs without network, in a private file system
// that only contains read-only system directories, the box (mounted at /box)
// and an empty /tmp, and under a seccomp filter.
class Namespaced : public Unix {
 public:
  static Sandbox* Create() { return new Namespaced(); }

  // Negative when the kernel refuses user namespaces or seccomp.
  static int Score();

  bool Isolated() const override { return true; }

 protected:
  Namespaced() = default;

  bool OnSetup(std::string* error_msg) override;
  bool OnChild(char* error_msg, size_t buflen) override;
  void OnFinish(ExecutionInfo* info) override;

 private:
  struct Bind {
    std::string source;
    std::string target;
    unsigned long flags;  // NOLINT
    bool read_only;
  };

  void AddBind(const std::string& source, bool read_only);

  std::unique_ptr<util::TempDir> root_;
  std::string root_path_;
  std::string box_path_;
  std::string tmp_path_;
  unsigned long box_flags_ = 0;  // NOLINT
  std::vector<std::string> dirs_;
  std::vector<std::string> files_;
  std::vector<Bind> binds_;
  SeccompFilter filter_;
  uid_t uid_ = 0;
  gid_t gid_ = 0;
};

}  // namespace sandbox

#endif
