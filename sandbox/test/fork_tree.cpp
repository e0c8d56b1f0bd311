#include <stdio.h>
#include <unistd.h>

// Leaves a sleeping grandchild behind and prints its pid.
int main() {
  pid_t pid = fork();
  if (pid == -1) return 1;
  if (pid == 0) {
    while (true) pause();
  }
  printf("%d\n", pid);
  fflush(stdout);
  return 0;
}
