#pragma once

#include "qmatch/matcher.hpp"
#include "qmatch/types.hpp"

#include <cstdint>
#include <utility>

namespace qmatch {

class QueryMatchFacade {
 public:
  QueryMatchFacade();

  MatchResult match(const MatchRequest& request) const;
  std::pair<MatchRequest, MatchResult> matchFasta(const FastaMatchRequest& request) const;
  std::pair<DemoCase, MatchResult> demo(const DemoParams& params, std::uint32_t seed) const;

 private:
  const IMatcher& matcherFor(MatchMethod method) const;

  LmerFilterMatcher lmerMatcher_;
  BruteForceMatcher bruteMatcher_;
};

}  // namespace qmatch
