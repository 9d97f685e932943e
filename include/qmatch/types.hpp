#pragma once

#include <atomic>
#include <string>
#include <tuple>
#include <unordered_map>
#include <vector>

namespace qmatch {

// l-mer value -> ascending offsets of that l-mer inside one query window.
using SeedIndex = std::unordered_map<std::string, std::vector<int>>;

// 1-based start offsets of two n-mers that differ in at most k positions.
struct MatchPair {
  int queryStart{0};
  int textStart{0};
};

inline bool operator<(const MatchPair& a, const MatchPair& b) {
  return std::tie(a.queryStart, a.textStart) < std::tie(b.queryStart, b.textStart);
}

inline bool operator==(const MatchPair& a, const MatchPair& b) {
  return a.queryStart == b.queryStart && a.textStart == b.textStart;
}

inline bool operator!=(const MatchPair& a, const MatchPair& b) {
  return !(a == b);
}

enum class MatchMethod {
  LmerFilter,
  BruteForce,
};

struct MatchStats {
  long long windowsScanned{0};
  long long seedHits{0};
  long long candidates{0};
  long long outOfBounds{0};
  long long verified{0};
  long long accepted{0};

  MatchStats& operator+=(const MatchStats& other) {
    windowsScanned += other.windowsScanned;
    seedHits += other.seedHits;
    candidates += other.candidates;
    outOfBounds += other.outOfBounds;
    verified += other.verified;
    accepted += other.accepted;
    return *this;
  }
};

struct MatchRequest {
  std::string query;
  std::string text;
  int n{0};
  int k{0};
  int threads{1};
  MatchMethod method{MatchMethod::LmerFilter};
  const std::atomic<bool>* cancel{nullptr};  // checked before every query window
};

struct MatchResult {
  std::vector<MatchPair> pairs;
  int seedLength{0};
  MatchStats stats;
  bool cancelled{false};
};

struct FastaMatchRequest {
  std::string queryFasta;
  std::string querySeq;  // empty: first record
  std::string textFasta;
  std::string textSeq;   // empty: first record
  int n{0};
  int k{0};
  int threads{1};
  MatchMethod method{MatchMethod::LmerFilter};
};

struct DemoParams {
  int m{200};  // text length
  int p{60};   // query length
  int n{15};
  int k{2};
};

struct DemoCase {
  DemoParams params;
  std::string text;
  std::string query;
  int textEmbedStart{0};   // 1-based
  int queryEmbedStart{0};  // 1-based
};

const char* methodName(MatchMethod method);
MatchMethod parseMethod(const std::string& name);

}  // namespace qmatch
