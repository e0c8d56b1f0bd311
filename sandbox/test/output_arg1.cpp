#include <stdio.h>
#include <stdlib.h>

// Writes argv[1] bytes to stdout and, if given, argv[2] bytes to stderr.
int main(int argc, char** argv) {
  long out = atol(argv[1]);
  long err = argc > 2 ? atol(argv[2]) : 0;
  for (long i = 0; i < out; i++) putchar('a' + i % 26);
  fflush(stdout);
  for (long i = 0; i < err; i++) fputc('A' + i % 26, stderr);
  return 0;
}
