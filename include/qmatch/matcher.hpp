#pragma once

#include "qmatch/types.hpp"

#include <string>
#include <vector>

namespace qmatch {

class IMatcher {
 public:
  virtual ~IMatcher() = default;
  virtual MatchResult match(const MatchRequest& request) const = 0;
};

// Seed-and-extend search: exact l-mer seeds with l = n / (k + 1), verified by
// Hamming distance over the full n-mer.
class LmerFilterMatcher final : public IMatcher {
 public:
  MatchResult match(const MatchRequest& request) const override;
};

// Compares every (query window, text window) pair directly.
class BruteForceMatcher final : public IMatcher {
 public:
  MatchResult match(const MatchRequest& request) const override;
};

// Throws std::invalid_argument unless n >= 1, k >= 0 and k + 1 <= n.
void validateMatchParams(int n, int k);
int seedLength(int n, int k);

SeedIndex buildSeedIndex(const std::string& block, int l);

// Mismatches between a[aStart, aStart + len) and b[bStart, bStart + len).
// With limit >= 0 counting stops at limit + 1.
int hammingDistance(const std::string& a,
                    int aStart,
                    const std::string& b,
                    int bStart,
                    int len,
                    int limit = -1);
int hammingDistance(const std::string& a, const std::string& b);

// Sorts ascending by (queryStart, textStart) and drops duplicates.
void finalizeMatches(std::vector<MatchPair>& pairs);

std::vector<MatchPair> queryMatch(const std::string& query, const std::string& text, int n, int k);

}  // namespace qmatch
