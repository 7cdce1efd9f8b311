#include <cstdlib>

int main(int argc, char** argv) { return atoi(argv[1]); }
