#pragma once

#include "qmatch/types.hpp"

#include <ostream>
#include <string>

namespace qmatch {

std::string describeMatch(const std::string& query, const std::string& text, const MatchPair& pair, int n);
void printMatches(std::ostream& out,
                  const std::string& query,
                  const std::string& text,
                  int n,
                  const MatchResult& result);
void writeMatchTsv(const std::string& path, const MatchRequest& request, const MatchResult& result);
void writeMatchJson(const std::string& path, const MatchRequest& request, const MatchResult& result);

}  // namespace qmatch
