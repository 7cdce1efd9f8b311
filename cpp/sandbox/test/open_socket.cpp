#include <sys/socket.h>
#include <unistd.h>

// Exits with 0 if an IPv4 socket can be created.
int main() {
  int fd = socket(AF_INET, SOCK_STREAM, 0);
  if (fd == -1) return 1;
  close(fd);
  return 0;
}
