#include <stdlib.h>
#include <string.h>
#include <unistd.h>

// Allocates and touches argv[1] MiB, then stays alive for a moment so that
// its memory usage can be observed.
int main(int argc, char** argv) {
  const size_t size = atoll(argv[1]) * 1024 * 1024;
  char* data = static_cast<char*>(malloc(size));
  if (data == nullptr) return 3;
  memset(data, 1, size);
  usleep(200 * 1000);
  return data[size / 2] == 1 ? 0 : 1;
}
