#include "qmatch/dna_generator.hpp"

#include <stdexcept>

namespace qmatch {

namespace {

constexpr char kBases[] = {'A', 'C', 'G', 'T'};

char randomBase(std::mt19937& rng) {
  std::uniform_int_distribution<int> pick(0, 3);
  return kBases[pick(rng)];
}

char randomOtherBase(char current, std::mt19937& rng) {
  char alternatives[3];
  int count = 0;
  for (char b : kBases) {
    if (b != current && count < 3) {
      alternatives[count++] = b;
    }
  }
  std::uniform_int_distribution<int> pick(0, count - 1);
  return alternatives[pick(rng)];
}

}  // namespace

std::string randomDna(int length, std::mt19937& rng) {
  if (length < 0) {
    throw std::invalid_argument("sequence length must be non-negative");
  }
  std::string out;
  out.reserve(static_cast<std::size_t>(length));
  for (int i = 0; i < length; ++i) {
    out.push_back(randomBase(rng));
  }
  return out;
}

std::string mutateDna(const std::string& seq, int edits, std::mt19937& rng) {
  if (edits < 0) {
    throw std::invalid_argument("edit count must be non-negative");
  }
  std::string out = seq;
  if (out.empty()) {
    return out;
  }
  std::uniform_int_distribution<int> position(0, static_cast<int>(out.size()) - 1);
  for (int e = 0; e < edits; ++e) {
    const int idx = position(rng);
    out[static_cast<std::size_t>(idx)] = randomOtherBase(out[static_cast<std::size_t>(idx)], rng);
  }
  return out;
}

DemoCase buildDemoCase(const DemoParams& params, std::mt19937& rng) {
  if (params.n <= 0 || params.k < 0) {
    throw std::invalid_argument("demo needs n > 0 and k >= 0");
  }
  if (params.n > params.m || params.n > params.p) {
    throw std::invalid_argument("demo needs n <= m and n <= p");
  }

  DemoCase demo;
  demo.params = params;
  demo.text = randomDna(params.m, rng);

  std::uniform_int_distribution<int> embedAt(0, params.m - params.n);
  const int pos = embedAt(rng);
  const std::string seed =
      mutateDna(demo.text.substr(static_cast<std::size_t>(pos), static_cast<std::size_t>(params.n)), params.k, rng);

  const int flank = params.p - params.n;
  const int lead = pos % (flank + 1);
  const std::string left = randomDna(flank, rng).substr(0, static_cast<std::size_t>(lead));
  const std::string right = randomDna(flank, rng).substr(0, static_cast<std::size_t>(flank - lead));
  demo.query = left + seed + right;

  demo.textEmbedStart = pos + 1;
  demo.queryEmbedStart = lead + 1;
  return demo;
}

}  // namespace qmatch
