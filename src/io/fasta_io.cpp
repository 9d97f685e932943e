#include "qmatch/fasta_io.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

namespace qmatch {

namespace {

std::string normalizeName(const std::string& raw) {
  std::string name = raw;
  auto sp = name.find_first_of(" \t");
  if (sp != std::string::npos) {
    name = name.substr(0, sp);
  }
  return name;
}

std::string trim(const std::string& s) {
  auto begin = s.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return {};
  }
  auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(begin, end - begin + 1);
}

void appendBases(const std::string& line, std::string& seq) {
  for (char ch : line) {
    if (!std::isspace(static_cast<unsigned char>(ch))) {
      seq.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(ch))));
    }
  }
}

std::ifstream openFasta(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("Failed to open FASTA: " + path);
  }
  return in;
}

}  // namespace

FastaMap readFasta(const std::string& path) {
  std::ifstream in = openFasta(path);

  FastaMap out;
  std::string line;
  std::string current;
  std::string seq;
  while (std::getline(in, line)) {
    if (!line.empty() && line[0] == '>') {
      if (!current.empty()) {
        out[current] = seq;
        seq.clear();
      }
      current = normalizeName(trim(line.substr(1)));
      continue;
    }
    if (current.empty()) {
      continue;
    }
    appendBases(line, seq);
  }
  if (!current.empty()) {
    out[current] = seq;
  }
  return out;
}

std::vector<std::string> readFastaNames(const std::string& path) {
  std::ifstream in = openFasta(path);

  std::vector<std::string> names;
  std::unordered_set<std::string> seen;
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty() || line[0] != '>') {
      continue;
    }
    std::string name = normalizeName(trim(line.substr(1)));
    if (name.empty()) {
      continue;
    }
    if (seen.insert(name).second) {
      names.push_back(std::move(name));
    }
  }
  return names;
}

std::string readFastaSequence(const std::string& path, const std::string& seqName) {
  std::ifstream in = openFasta(path);

  std::string line;
  std::string seq;
  bool inTarget = false;
  bool found = false;
  while (std::getline(in, line)) {
    if (!line.empty() && line[0] == '>') {
      if (found) {
        break;
      }
      const std::string name = normalizeName(trim(line.substr(1)));
      inTarget = !name.empty() && (seqName.empty() || name == seqName);
      found = inTarget;
      continue;
    }
    if (inTarget) {
      appendBases(line, seq);
    }
  }
  if (!found) {
    if (seqName.empty()) {
      throw std::runtime_error("No sequences in FASTA: " + path);
    }
    throw std::runtime_error("Sequence not found: " + seqName + " in " + path);
  }
  return seq;
}

void writeFasta(const std::string& path, const FastaMap& records) {
  std::ofstream out(path);
  if (!out) {
    throw std::runtime_error("Failed to write FASTA: " + path);
  }
  for (const auto& [name, seq] : records) {
    out << '>' << name << '\n';
    for (std::size_t i = 0; i < seq.size(); i += 80) {
      out << seq.substr(i, std::min<std::size_t>(80, seq.size() - i)) << '\n';
    }
  }
}

}  // namespace qmatch
