#include <cstdio>

// Exits with 0 if argv[1] can be created and written.
int main(int argc, char** argv) {
  FILE* f = fopen(argv[1], "w");
  if (f == nullptr) return 1;
  bool ok = fputs("data\n", f) >= 0;
  return fclose(f) == 0 && ok ? 0 : 1;
}
