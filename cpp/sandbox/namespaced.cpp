#include "sandbox/namespaced.hpp"

#include <dirent.h>
#include <fcntl.h>
#include <sched.h>
#include <sys/mount.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>

#include <kj/debug.h>

#include "util/flags.hpp"

namespace {

const char* kSystemDirs[] = {"/usr", "/bin",  "/lib", "/lib32",
                             "/lib64", "/etc/alternatives"};
const char* kSystemFiles[] = {"/etc/ld.so.cache"};
const char* kDevices[] = {"/dev/null", "/dev/zero", "/dev/urandom",
                          "/dev/random"};

// Fills msg with "what: strerror(errno)" and returns false. Does not allocate.
bool Fail(char* msg, size_t buflen, const char* what) {
  const char* err = strerror(errno);
  msg[0] = 0;
  strncat(msg, what, buflen - 1);                      // NOLINT
  strncat(msg, ": ", buflen - strlen(msg) - 1);        // NOLINT
  strncat(msg, err, buflen - strlen(msg) - 1);         // NOLINT
  return false;
}

// Writes a string to an existing file. Does not allocate.
bool WriteProcFile(const char* path, const char* data) {
  int fd = open(path, O_WRONLY | O_CLOEXEC);
  if (fd == -1) return false;
  size_t len = strlen(data);
  bool ok = write(fd, data, len) == static_cast<ssize_t>(len);
  int err = errno;
  close(fd);
  errno = err;
  return ok;
}

// Appends the decimal representation of v to buf.
void AppendUnsigned(char* buf, size_t buflen, unsigned long v) {  // NOLINT
  char digits[32];
  size_t n = 0;
  do {
    digits[n++] = '0' + v % 10;
    v /= 10;
  } while (v);
  size_t len = strlen(buf);
  while (n && len + 1 < buflen) buf[len++] = digits[--n];
  buf[len] = 0;
}

// Builds "<id> <id> 1\n" into buf.
void IdMap(char* buf, size_t buflen, unsigned long id) {  // NOLINT
  buf[0] = 0;
  AppendUnsigned(buf, buflen, id);
  strncat(buf, " ", buflen - strlen(buf) - 1);  // NOLINT
  AppendUnsigned(buf, buflen, id);
  strncat(buf, " 1\n", buflen - strlen(buf) - 1);  // NOLINT
}

// Enters new user and mount namespaces, mapping the current user to itself.
bool EnterNamespaces(uid_t uid, gid_t gid, int flags) {
  if (unshare(CLONE_NEWUSER | CLONE_NEWNS | flags) == -1) return false;
  char map[64];
  if (!WriteProcFile("/proc/self/setgroups", "deny") && errno != ENOENT) {
    return false;
  }
  IdMap(map, sizeof(map), uid);
  if (!WriteProcFile("/proc/self/uid_map", map)) return false;
  IdMap(map, sizeof(map), gid);
  return WriteProcFile("/proc/self/gid_map", map);
}

// Mount flags that an unprivileged remount must preserve.
unsigned long LockedFlags(const std::string& path) {  // NOLINT
  struct statvfs st {};
  if (statvfs(path.c_str(), &st) == -1) return 0;
  unsigned long flags = 0;  // NOLINT
  if (st.f_flag & ST_NOSUID) flags |= MS_NOSUID;
  if (st.f_flag & ST_NODEV) flags |= MS_NODEV;
  if (st.f_flag & ST_NOEXEC) flags |= MS_NOEXEC;
  if (st.f_flag & ST_NOATIME) flags |= MS_NOATIME;
  if (st.f_flag & ST_NODIRATIME) flags |= MS_NODIRATIME;
  if (st.f_flag & ST_RELATIME) flags |= MS_RELATIME;
  if (!(st.f_flag & (ST_NOATIME | ST_RELATIME))) flags |= MS_STRICTATIME;
  return flags;
}

std::string RealPath(const std::string& path) {
  char buf[PATH_MAX] = {};
  if (realpath(path.c_str(), buf) == nullptr) return "";
  return buf;
}

// "/opt/conda/bin/python3" -> "/opt"
std::string TopLevelDir(const std::string& path) {
  if (path.size() < 2 || path[0] != '/') return "";
  size_t pos = path.find('/', 1);
  if (pos == std::string::npos) return "";
  return path.substr(0, pos);
}

int Probe() {
  if (!sandbox::SeccompFilter::Supported()) {
    KJ_LOG(INFO, "seccomp is not available");
    return -1;
  }
  uid_t uid = getuid();
  gid_t gid = getgid();
  pid_t pid = fork();
  if (pid == -1) return -1;
  if (pid == 0) {
    if (!EnterNamespaces(uid, gid, CLONE_NEWNET)) _Exit(1);
    if (mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) == -1) {
      _Exit(2);
    }
    if (mount("tmpfs", "/tmp", "tmpfs", 0, "size=1m") == -1) _Exit(3);
    _Exit(0);
  }
  int status = 0;
  while (waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR) return -1;
  }
  if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
    KJ_LOG(INFO, "User namespaces are not available", status);
    return -1;
  }
  return 10;
}

}  // namespace

namespace sandbox {

int Namespaced::Score() {
  static const int score = Probe();
  return score;
}

void Namespaced::AddBind(const std::string& source, bool read_only) {
  struct stat st {};
  if (stat(source.c_str(), &st) == -1) return;
  for (const Bind& bind : binds_) {
    if (bind.source == source) return;
  }
  std::string target = root_path_ + source;
  // Parent directories of the mountpoint, outermost first.
  for (size_t pos = root_path_.size() + 1;
       (pos = target.find('/', pos)) != std::string::npos; pos++) {
    std::string dir = target.substr(0, pos);
    if (std::find(dirs_.begin(), dirs_.end(), dir) == dirs_.end()) {
      dirs_.push_back(dir);
    }
  }
  if (S_ISDIR(st.st_mode)) {
    dirs_.push_back(target);
  } else {
    files_.push_back(target);
  }
  binds_.push_back(Bind{source, target, LockedFlags(source), read_only});
}

bool Namespaced::OnSetup(std::string* error_msg) {
  uid_ = getuid();
  gid_ = getgid();
  dirs_.clear();
  files_.clear();
  binds_.clear();
  try {
    root_.reset(new util::TempDir(Flags::temp_directory));
  } catch (const std::exception& exc) {
    *error_msg = std::string("mountpoint: ") + exc.what();
    return false;
  }
  if (Flags::keep_sandboxes) root_->Keep();
  root_path_ = RealPath(root_->Path());
  if (root_path_.empty()) {
    *error_msg = "realpath: " + root_->Path();
    return false;
  }
  box_path_ = root_path_ + "/box";
  tmp_path_ = root_path_ + "/tmp";
  box_flags_ = LockedFlags(options_->root);

  for (const char* dir : kSystemDirs) AddBind(dir, true);
  for (const char* file : kSystemFiles) AddBind(file, true);
  // Java runtimes keep their configuration in /etc.
  DIR* etc = opendir("/etc");
  if (etc != nullptr) {
    while (struct dirent* ent = readdir(etc)) {
      if (strncmp(ent->d_name, "java", 4) == 0) {
        AddBind(std::string("/etc/") + ent->d_name, true);
      }
    }
    closedir(etc);
  }
  if (options_->executable[0] == '/') {
    std::string top = TopLevelDir(RealPath(options_->executable));
    if (!top.empty()) AddBind(top, true);
  }
  for (const char* dev : kDevices) AddBind(dev, false);
  dirs_.push_back(box_path_);
  dirs_.push_back(tmp_path_);

  return filter_.Build(options_->allow_fork, error_msg);
}

bool Namespaced::OnChild(char* error_msg, size_t buflen) {
  int flags = CLONE_NEWNET | CLONE_NEWIPC | CLONE_NEWUTS;
  if (!EnterNamespaces(uid_, gid_, flags)) {
    return Fail(error_msg, buflen, "unshare");
  }
  if (mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) == -1) {
    return Fail(error_msg, buflen, "make-private");
  }
  const char* root = root_path_.c_str();
  if (mount("tmpfs", root, "tmpfs", MS_NOSUID | MS_NODEV,
            "size=8m,mode=0755") == -1) {
    return Fail(error_msg, buflen, "mount root");
  }
  for (const std::string& dir : dirs_) {
    if (mkdir(dir.c_str(), 0755) == -1 && errno != EEXIST) {
      return Fail(error_msg, buflen, "mkdir");
    }
  }
  for (const std::string& file : files_) {
    int fd = open(file.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0644);
    if (fd == -1) return Fail(error_msg, buflen, "create mountpoint");
    close(fd);
  }

  // The working directory is the box.
  if (mount(".", box_path_.c_str(), nullptr, MS_BIND | MS_REC, nullptr) == -1) {
    return Fail(error_msg, buflen, "bind box");
  }
  unsigned long box_flags =  // NOLINT
      MS_BIND | MS_REMOUNT | MS_NOSUID | MS_NODEV | box_flags_;
  if (!options_->writable_root) box_flags |= MS_RDONLY;
  if (mount(nullptr, box_path_.c_str(), nullptr, box_flags, nullptr) == -1) {
    return Fail(error_msg, buflen, "remount box");
  }

  for (const Bind& bind : binds_) {
    if (mount(bind.source.c_str(), bind.target.c_str(), nullptr,
              MS_BIND | MS_REC, nullptr) == -1) {
      return Fail(error_msg, buflen, bind.source.c_str());
    }
    if (!bind.read_only) continue;
    if (mount(nullptr, bind.target.c_str(), nullptr,
              MS_BIND | MS_REMOUNT | MS_RDONLY | MS_NOSUID | bind.flags,
              nullptr) == -1) {
      return Fail(error_msg, buflen, bind.source.c_str());
    }
  }

  if (mount("tmpfs", tmp_path_.c_str(), "tmpfs", MS_NOSUID | MS_NODEV,
            "size=64m,mode=1777") == -1) {
    return Fail(error_msg, buflen, "mount /tmp");
  }

  if (chdir(root) == -1) return Fail(error_msg, buflen, "chdir");
  if (syscall(SYS_pivot_root, ".", ".") == -1) {
    return Fail(error_msg, buflen, "pivot_root");
  }
  if (umount2(".", MNT_DETACH) == -1) {
    return Fail(error_msg, buflen, "umount old root");
  }
  if (mount(nullptr, "/", nullptr,
            MS_BIND | MS_REMOUNT | MS_RDONLY | MS_NOSUID | MS_NODEV,
            nullptr) == -1) {
    return Fail(error_msg, buflen, "remount /");
  }
  if (chdir("/box") == -1) return Fail(error_msg, buflen, "chdir /box");
  return filter_.Install(error_msg, buflen);
}

void Namespaced::OnFinish(ExecutionInfo* info) {
  // Nothing is mounted on the host side: the mountpoint is a plain directory.
  root_.reset();
}

namespace {
Sandbox::Register<Namespaced> r;  // NOLINT
}  // namespace

}  // namespace sandbox
