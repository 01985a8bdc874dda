#pragma once

// Shared driver for the split examples: fuses the files named on the command
// line and prints every maximal run of word bytes, one per line.

#include <cstdio>
#include <exception>
#include <string>
#include <string_view>
#include <vector>

#include "fusedstream/core/char_class.hpp"
#include "fusedstream/core/fused_reader.hpp"

namespace fusedstream::examples {

inline void PrintWords(std::string_view line, const core::CharSet& word) {
  std::size_t i = 0;
  while (i < line.size()) {
    while (i < line.size() && !word.Matches(line[i])) ++i;
    const std::size_t start = i;
    while (i < line.size() && word.Matches(line[i])) ++i;
    if (i > start) {
      std::printf("%.*s\n", static_cast<int>(i - start), line.data() + start);
    }
  }
}

inline int RunSplit(const std::vector<std::string>& paths, const core::CharSet& word) {
  try {
    auto reader = core::FusedReader::FromPathsRaw(paths);
    for (auto line = reader.ReadLine(); line; line = reader.ReadLine()) {
      PrintWords(*line, word);
    }
    reader.Close();
  } catch (const std::exception& e) {
    std::fprintf(stderr, "error: %s\n", e.what());
    return 1;
  }
  return 0;
}

}  // namespace fusedstream::examples
