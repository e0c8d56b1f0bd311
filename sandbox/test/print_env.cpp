#include <stdio.h>

extern char** environ;

int main() {
  for (char** var = environ; *var != nullptr; var++) printf("%s\n", *var);
  return 0;
}
