// Splits the fused contents of several files on a set of delimiter bytes.
// Usage: fused_split <delimiters> <file>...

#include <cstdio>
#include <string>
#include <vector>

#include "fusedstream/core/char_class.hpp"
#include "split_common.hpp"

int main(int argc, char** argv) {
  if (argc < 2) {
    std::fprintf(stderr, "usage: %s <delimiters> <file>...\n", argv[0]);
    return 2;
  }
  const auto word = fusedstream::core::CharSet::Of(argv[1]).Complement();
  const std::vector<std::string> paths(argv + 2, argv + argc);
  return fusedstream::examples::RunSplit(paths, word);
}
