// Prints every whitespace-separated word of several files, read as one.
// Usage: fused_split_ws <file>...

#include <string>
#include <vector>

#include "fusedstream/core/char_class.hpp"
#include "split_common.hpp"

int main(int argc, char** argv) {
  const fusedstream::core::CharSet word(fusedstream::core::CharClass::Space);
  const std::vector<std::string> paths(argv + 1, argv + argc);
  return fusedstream::examples::RunSplit(paths, word.Complement());
}
