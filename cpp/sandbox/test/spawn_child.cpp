#include <sys/wait.h>
#include <unistd.h>

// Exits with 0 if a child process can be created.
int main() {
  pid_t pid = fork();
  if (pid == -1) return 1;
  if (pid == 0) _exit(0);
  int status = 0;
  waitpid(pid, &status, 0);
  return 0;
}
