#pragma once

#include "qmatch/types.hpp"

#include <random>
#include <string>

namespace qmatch {

std::string randomDna(int length, std::mt19937& rng);

// Each edit substitutes a different base at a uniformly chosen position.
// Positions may repeat, so the result is within `edits` mismatches of `seq`.
std::string mutateDna(const std::string& seq, int edits, std::mt19937& rng);

DemoCase buildDemoCase(const DemoParams& params, std::mt19937& rng);

}  // namespace qmatch
